#ifndef EYE_TYPES_HPP
#define EYE_TYPES_HPP

#include <cstdint>
#include <string>

/**
 * Closed enumerations shared by the eye engine.
 *
 * Text names are only parsed at the command boundary; inside the engine
 * everything is typed. Out-of-range values (e.g. from a static_cast) are
 * still rejected by the controller via the isValid() helpers.
 */

enum class Mood : uint8_t {
    DEFAULT,
    ANGRY,
    TIRED,
    HAPPY,
    CURIOUS
};

enum class Direction : uint8_t {
    CENTER,
    LEFT,
    RIGHT,
    TOP,
    BOTTOM,
    TOP_LEFT,
    TOP_RIGHT,
    BOTTOM_LEFT,
    BOTTOM_RIGHT
};

enum class Speed : uint8_t {
    SLOW,
    MEDIUM,
    FAST
};

enum class EyeSelector : uint8_t {
    BOTH,
    LEFT,
    RIGHT
};

enum class EyeSide : uint8_t {
    LEFT = 0,
    RIGHT = 1
};

enum class BlinkPhase : uint8_t {
    IDLE,
    CLOSING,
    CLOSED,
    OPENING
};

enum class Easing : uint8_t {
    LINEAR,
    SMOOTHSTEP,
    SINE
};

/**
 * Error kinds reported by the engine. None of them is fatal.
 */
enum class EyeError : uint8_t {
    NONE,
    INVALID_COMMAND,
    CONFIG_OUT_OF_BOUNDS,
    DEGENERATE_GEOMETRY
};

/**
 * Outcome of a controller command. On failure the state is unchanged.
 */
struct CommandResult {
    bool ok = true;
    EyeError error = EyeError::NONE;
    std::string message;

    static CommandResult success() { return CommandResult(); }
    static CommandResult invalid(const std::string &message);
};

// Unit step of a look direction, y grows downwards
struct DirectionStep {
    int dx;
    int dy;
};

bool isValid(Mood mood);
bool isValid(Direction direction);
bool isValid(Speed speed);
bool isValid(EyeSelector eyes);
bool isValid(Easing easing);

DirectionStep directionStep(Direction direction);
bool selects(EyeSelector eyes, EyeSide side);

// Name lookup (case-insensitive). Return false for unknown names.
bool parseMood(const std::string &name, Mood &out);
bool parseDirection(const std::string &name, Direction &out);
bool parseSpeed(const std::string &name, Speed &out);
bool parseEyeSelector(const std::string &name, EyeSelector &out);
bool parseEasing(const std::string &name, Easing &out);

const char *toString(Mood mood);
const char *toString(Direction direction);
const char *toString(Speed speed);
const char *toString(EyeSelector eyes);
const char *toString(BlinkPhase phase);
const char *toString(Easing easing);
const char *toString(EyeError error);

#endif // EYE_TYPES_HPP
