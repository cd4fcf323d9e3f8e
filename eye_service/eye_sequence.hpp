#ifndef EYE_SEQUENCE_HPP
#define EYE_SEQUENCE_HPP

#include "eye_command.hpp"

#include <cstdint>
#include <string>
#include <vector>

class EyeAnimator;

struct SequenceStep {
    EyeCommand command;
    float hold_s;   // wait after the controller is idle again
};

struct EyeSequence {
    std::string name;
    std::vector<SequenceStep> steps;
};

/**
 * Wake-up: tired and shut, a slow then faster flutter, then default face.
 */
EyeSequence makeWakeupSequence();

/**
 * EyeSequencePlayer - Plays an EyeSequence against a controller
 *
 * Each step is applied, then the player waits until the controller is
 * idle and then for the step's hold time. Driven only by tick(); call it
 * after EyeAnimator::tick() with the same elapsed time.
 */
class EyeSequencePlayer {
public:
    explicit EyeSequencePlayer(EyeAnimator &animator);

    /**
     * Start (or restart) playback from the first step.
     */
    void start(const EyeSequence &sequence);
    void stop();

    void tick(float elapsed_s);

    bool isRunning() const { return m_running; }
    const std::string &name() const { return m_sequence.name; }
    size_t currentStep() const { return m_index; }
    size_t totalSteps() const { return m_sequence.steps.size(); }

    /**
     * Steps the controller rejected during the current run.
     */
    uint32_t rejectedSteps() const { return m_rejected; }

private:
    enum class State : uint8_t {
        APPLY,
        WAIT_IDLE,
        HOLD
    };

    void applyCurrent();
    void advance();

    EyeAnimator &m_animator;
    EyeSequence m_sequence;
    size_t m_index = 0;
    State m_state = State::APPLY;
    float m_hold_elapsed = 0.0f;
    bool m_running = false;
    uint32_t m_rejected = 0;
};

#endif // EYE_SEQUENCE_HPP
