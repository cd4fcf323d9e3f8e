/**
 * EyeSequence Implementation
 */

#include "eye_sequence.hpp"
#include "eye_animator.hpp"
#include "logger.h"

#include <cmath>

EyeSequence makeWakeupSequence() {
    EyeSequence seq;
    seq.name = "wakeup";
    seq.steps = {
        {EyeCommand::makeMood(Mood::TIRED), 0.0f},
        {EyeCommand::makeClose(Speed::FAST), 2.0f},
        {EyeCommand::makeOpen(Speed::SLOW), 0.0f},
        {EyeCommand::makeClose(Speed::SLOW), 1.0f},
        {EyeCommand::makeOpen(Speed::MEDIUM), 0.0f},
        {EyeCommand::makeClose(Speed::MEDIUM), 0.0f},
        {EyeCommand::makeOpen(Speed::FAST), 0.0f},
        {EyeCommand::makeMood(Mood::DEFAULT), 0.0f},
    };
    return seq;
}

EyeSequencePlayer::EyeSequencePlayer(EyeAnimator &animator)
    : m_animator(animator) {
}

void EyeSequencePlayer::start(const EyeSequence &sequence) {
    if (m_running) {
        LOG_INFO(LOG_TAG_SEQ, "Restarting '%s' as '%s'",
                 m_sequence.name.c_str(), sequence.name.c_str());
    }

    m_sequence = sequence;
    m_index = 0;
    m_state = State::APPLY;
    m_hold_elapsed = 0.0f;
    m_rejected = 0;
    m_running = !m_sequence.steps.empty();

    LOG_INFO(LOG_TAG_SEQ, "Sequence '%s' started (%zu steps)",
             m_sequence.name.c_str(), m_sequence.steps.size());
}

void EyeSequencePlayer::stop() {
    if (!m_running) return;
    m_running = false;
    LOG_INFO(LOG_TAG_SEQ, "Sequence '%s' stopped at step %zu",
             m_sequence.name.c_str(), m_index);
}

void EyeSequencePlayer::tick(float elapsed_s) {
    if (!m_running) return;
    if (!std::isfinite(elapsed_s) || elapsed_s < 0.0f) elapsed_s = 0.0f;

    // Hold time only counts on ticks after the controller went idle
    float hold_dt = elapsed_s;

    while (m_running) {
        switch (m_state) {
            case State::APPLY:
                applyCurrent();
                m_state = State::WAIT_IDLE;
                break;

            case State::WAIT_IDLE:
                if (!m_animator.isIdle()) return;
                m_state = State::HOLD;
                m_hold_elapsed = 0.0f;
                hold_dt = 0.0f;
                break;

            case State::HOLD:
                m_hold_elapsed += hold_dt;
                hold_dt = 0.0f;
                if (m_hold_elapsed < m_sequence.steps[m_index].hold_s) return;
                advance();
                break;
        }
    }
}

void EyeSequencePlayer::applyCurrent() {
    const EyeCommand &cmd = m_sequence.steps[m_index].command;
    CommandResult result = applyCommand(m_animator, cmd);
    if (!result.ok) {
        m_rejected++;
        LOG_WARN(LOG_TAG_SEQ, "'%s' step %zu (%s) rejected: %s",
                 m_sequence.name.c_str(), m_index, toString(cmd.type),
                 result.message.c_str());
        return;
    }
    LOG_DEBUG(LOG_TAG_SEQ, "'%s' step %zu: %s",
              m_sequence.name.c_str(), m_index, toString(cmd.type));
}

void EyeSequencePlayer::advance() {
    m_index++;
    m_state = State::APPLY;
    if (m_index >= m_sequence.steps.size()) {
        m_running = false;
        LOG_INFO(LOG_TAG_SEQ, "Sequence '%s' complete", m_sequence.name.c_str());
    }
}
