#ifndef EYE_COMMAND_HPP
#define EYE_COMMAND_HPP

#include "eye_animator.hpp"
#include "eye_types.hpp"

#include <cstdint>
#include <string>

enum class CommandType : uint8_t {
    MOOD,
    LOOK,
    BLINK,
    CLOSE,
    OPEN,
    CURIOUS,
    IDLE,
    COVERAGE,
    WAKEUP,
    STATUS
};

const char *toString(CommandType type);

/**
 * One typed command, as parsed from an event line or built by a sequence.
 * Only the fields relevant to the type are meaningful.
 */
struct EyeCommand {
    CommandType type = CommandType::STATUS;
    Mood mood = Mood::DEFAULT;
    Direction direction = Direction::CENTER;
    Speed speed = Speed::MEDIUM;
    EyeSelector eyes = EyeSelector::BOTH;
    bool enabled = false;
    float top = 0.0f;
    float bottom = 0.0f;

    static EyeCommand makeMood(Mood mood);
    static EyeCommand makeLook(Direction direction, Speed speed = Speed::FAST);
    static EyeCommand makeBlink(Speed speed = Speed::MEDIUM, EyeSelector eyes = EyeSelector::BOTH);
    static EyeCommand makeClose(Speed speed = Speed::MEDIUM, EyeSelector eyes = EyeSelector::BOTH);
    static EyeCommand makeOpen(Speed speed = Speed::MEDIUM, EyeSelector eyes = EyeSelector::BOTH);
    static EyeCommand makeCurious(bool enabled);
    static EyeCommand makeIdle(bool enabled);
    static EyeCommand makeCoverage(float top, float bottom, EyeSelector eyes = EyeSelector::BOTH);
};

/**
 * EyeCommandParser - Newline-delimited JSON events to typed commands
 *
 * Never throws: malformed JSON, unknown types and unknown names come back
 * as an invalid result with a message.
 */
class EyeCommandParser {
public:
    struct ParseResult {
        bool valid = false;
        EyeCommand command;
        std::string error;
    };

    static ParseResult parse(const std::string &line);
};

/**
 * Forward a command to the controller. WAKEUP and STATUS are handled by
 * the service and are accepted here without touching the controller.
 */
CommandResult applyCommand(EyeAnimator &animator, const EyeCommand &command);

/**
 * Status snapshot as a single-line JSON object.
 */
std::string statusToJson(const EyeAnimator::Status &status);

/**
 * Reply line for a rejected event.
 */
std::string errorToJson(EyeError error, const std::string &message);

#endif // EYE_COMMAND_HPP
