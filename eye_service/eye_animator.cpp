/**
 * EyeAnimator Implementation
 */

#include "eye_animator.hpp"
#include "logger.h"

#include <algorithm>
#include <cmath>

extern "C" {
#include "eye_limits.h"
}

static constexpr float PI_F = 3.14159265358979f;

EyeAnimator::EyeAnimator(const ResolvedConfig &config)
    : m_config(config),
      m_eyes{{EyeModel(EyeSide::LEFT, config.screen.width, config.screen.height),
              EyeModel(EyeSide::RIGHT, config.screen.width, config.screen.height)}},
      m_rng(static_cast<uint32_t>(config.seed ^ (config.seed >> 32))) {
    EyeModel &left = m_eyes[index(EyeSide::LEFT)];
    EyeModel &right = m_eyes[index(EyeSide::RIGHT)];

    left.setBaseSize(config.left.width, config.left.height);
    left.setBaseCornerRadius(config.left.corner_radius);
    right.setBaseSize(config.right.width, config.right.height);
    right.setBaseCornerRadius(config.right.corner_radius);

    for (auto &eye : m_eyes) {
        eye.applyMoodShape(m_mood);
    }
    layoutEyes();
}

// ---- Timing ----

EyeAnimator::LidTiming EyeAnimator::lidTiming(Speed speed) {
    switch (speed) {
        case Speed::FAST:   return {0.06f, 0.03f, 0.06f};
        case Speed::SLOW:   return {0.25f, 0.10f, 0.25f};
        case Speed::MEDIUM:
        default:
            return {0.10f, 0.066f, 0.10f};
    }
}

float EyeAnimator::lookDuration(Speed speed) {
    switch (speed) {
        case Speed::SLOW: return ROBOEYES_LOOK_SLOW_S;
        case Speed::FAST: return ROBOEYES_LOOK_FAST_S;
        case Speed::MEDIUM:
        default:
            return ROBOEYES_LOOK_MEDIUM_S;
    }
}

float EyeAnimator::ease(Easing easing, float t) {
    t = roboeyes_clamp01(t);
    switch (easing) {
        case Easing::SMOOTHSTEP:
            return t * t * (3.0f - 2.0f * t);
        case Easing::SINE:
            return 0.5f * (1.0f - std::cos(PI_F * t));
        case Easing::LINEAR:
        default:
            return t;
    }
}

const char *EyeAnimator::toString(LidAction action) {
    switch (action) {
        case LidAction::BLINK: return "blink";
        case LidAction::CLOSE: return "close";
        case LidAction::OPEN:  return "open";
    }
    return "?";
}

// ---- Tick ----

void EyeAnimator::tick(float elapsed_s) {
    if (!std::isfinite(elapsed_s) || elapsed_s < 0.0f) {
        LOG_WARN(LOG_TAG_ANIM, "Ignoring invalid tick delta %f", elapsed_s);
        elapsed_s = 0.0f;
    }

    if (m_idle_enabled) {
        advanceIdle(elapsed_s);
    }
    advanceLook(elapsed_s);
    advanceLids(elapsed_s);
    layoutEyes();
}

bool EyeAnimator::isIdle() const {
    return !m_look_target && m_phase == BlinkPhase::IDLE && m_lid_queue.empty();
}

EyeAnimator::Status EyeAnimator::status() const {
    Status s;
    s.mood = m_mood;
    s.blink_phase = m_phase;
    s.look_target = m_look_target;
    s.curious = curiousEffective();
    s.idle_enabled = m_idle_enabled;
    s.held_closed_left = m_held_closed[index(EyeSide::LEFT)];
    s.held_closed_right = m_held_closed[index(EyeSide::RIGHT)];
    s.queued_lid_requests = m_lid_queue.size();
    s.idle = isIdle();
    return s;
}

// ---- Mood / curious ----

CommandResult EyeAnimator::setMood(Mood mood) {
    if (!isValid(mood)) {
        LOG_WARN(LOG_TAG_ANIM, "Rejected mood %d", static_cast<int>(mood));
        return CommandResult::invalid("unknown mood");
    }

    m_mood = mood;
    for (auto &eye : m_eyes) {
        eye.applyMoodShape(mood);
    }
    // Blink keeps visual precedence over the new resting shape
    refreshLids();
    applyCurious();

    LOG_DEBUG(LOG_TAG_ANIM, "Mood -> %s", ::toString(mood));
    return CommandResult::success();
}

CommandResult EyeAnimator::setCurious(bool active) {
    m_curious_toggle = active;
    applyCurious();
    LOG_DEBUG(LOG_TAG_ANIM, "Curious -> %s", active ? "on" : "off");
    return CommandResult::success();
}

bool EyeAnimator::curiousEffective() const {
    return m_curious_toggle || m_mood == Mood::CURIOUS;
}

void EyeAnimator::applyCurious() {
    bool active = curiousEffective();

    CuriousRole left_role = CuriousRole::NEUTRAL;
    CuriousRole right_role = CuriousRole::NEUTRAL;
    if (m_look_dx < 0) {
        left_role = CuriousRole::OUTER;
        right_role = CuriousRole::INNER;
    } else if (m_look_dx > 0) {
        left_role = CuriousRole::INNER;
        right_role = CuriousRole::OUTER;
    }

    m_eyes[index(EyeSide::LEFT)].setCuriousRole(left_role);
    m_eyes[index(EyeSide::RIGHT)].setCuriousRole(right_role);
    for (auto &eye : m_eyes) {
        eye.applyCuriousScale(active);
    }
    layoutEyes();
}

// ---- Direct coverage ----

CommandResult EyeAnimator::setEyelidCoverage(float top, float bottom, EyeSelector eyes) {
    if (!isValid(eyes)) {
        return CommandResult::invalid("unknown eye selector");
    }
    if (std::isnan(top) || std::isnan(bottom)) {
        LOG_WARN(LOG_TAG_ANIM, "Rejected NaN eyelid coverage");
        return CommandResult::invalid("eyelid coverage is not a number");
    }

    for (auto &eye : m_eyes) {
        if (selects(eyes, eye.side())) {
            eye.setEyelidCoverage(top, bottom);
        }
    }
    return CommandResult::success();
}

// ---- Lids ----

CommandResult EyeAnimator::blink(Speed speed, EyeSelector eyes) {
    return queueLid(LidAction::BLINK, speed, eyes);
}

CommandResult EyeAnimator::close(Speed speed, EyeSelector eyes) {
    return queueLid(LidAction::CLOSE, speed, eyes);
}

CommandResult EyeAnimator::open(Speed speed, EyeSelector eyes) {
    return queueLid(LidAction::OPEN, speed, eyes);
}

CommandResult EyeAnimator::queueLid(LidAction action, Speed speed, EyeSelector eyes) {
    if (!isValid(speed)) {
        LOG_WARN(LOG_TAG_ANIM, "Rejected %s: bad speed", toString(action));
        return CommandResult::invalid("unknown speed");
    }
    if (!isValid(eyes)) {
        LOG_WARN(LOG_TAG_ANIM, "Rejected %s: bad eye selector", toString(action));
        return CommandResult::invalid("unknown eye selector");
    }
    if (m_lid_queue.size() >= ROBOEYES_LID_QUEUE_MAX) {
        LOG_WARN(LOG_TAG_ANIM, "Rejected %s: lid queue full", toString(action));
        return CommandResult::invalid("lid queue full");
    }

    m_lid_queue.push(LidRequest{action, speed, eyes});
    LOG_DEBUG(LOG_TAG_ANIM, "Queued %s (%s, %s), %zu pending",
              toString(action), ::toString(speed), ::toString(eyes), m_lid_queue.size());

    if (m_phase == BlinkPhase::IDLE) {
        startNextLid();
    }
    return CommandResult::success();
}

bool EyeAnimator::startNextLid() {
    if (m_lid_queue.empty()) return false;

    m_lid = m_lid_queue.front();
    m_lid_queue.pop();

    bool any = false;
    for (auto &eye : m_eyes) {
        size_t i = index(eye.side());
        bool held = m_held_closed[i];
        bool wanted = selects(m_lid.eyes, eye.side()) &&
                      (m_lid.action == LidAction::OPEN ? held : !held);
        m_lid_active[i] = wanted;
        if (wanted) {
            m_phase_start[i] = eye.lids();
            any = true;
        }
    }

    if (!any) {
        if (m_lid.action == LidAction::OPEN) {
            LOG_WARN(LOG_TAG_ANIM, "Eyes already open, skipping open");
        } else {
            LOG_DEBUG(LOG_TAG_ANIM, "Selected eyes held closed, skipping %s", toString(m_lid.action));
        }
        m_phase = BlinkPhase::IDLE;
        return true;
    }

    m_phase = (m_lid.action == LidAction::OPEN) ? BlinkPhase::OPENING : BlinkPhase::CLOSING;
    m_phase_elapsed = 0.0f;
    return true;
}

float EyeAnimator::phaseDuration() const {
    LidTiming timing = lidTiming(m_lid.speed);
    switch (m_phase) {
        case BlinkPhase::CLOSING: return timing.close_s;
        case BlinkPhase::CLOSED:  return timing.hold_s;
        case BlinkPhase::OPENING: return timing.open_s;
        case BlinkPhase::IDLE:
        default:
            return 0.0f;
    }
}

void EyeAnimator::advanceLids(float dt) {
    // Time left over from a finished phase carries into the next one
    for (;;) {
        if (m_phase == BlinkPhase::IDLE) {
            if (!startNextLid()) break;
            continue;
        }

        float remaining = phaseDuration() - m_phase_elapsed;
        if (dt < remaining) {
            m_phase_elapsed += dt;
            break;
        }
        dt -= remaining;
        completePhase();
    }
    refreshLids();
}

void EyeAnimator::completePhase() {
    switch (m_phase) {
        case BlinkPhase::CLOSING:
            if (m_lid.action == LidAction::CLOSE) {
                for (size_t i = 0; i < m_eyes.size(); i++) {
                    if (m_lid_active[i]) m_held_closed[i] = true;
                    m_lid_active[i] = false;
                }
                m_phase = BlinkPhase::IDLE;
            } else {
                m_phase = BlinkPhase::CLOSED;
            }
            break;

        case BlinkPhase::CLOSED:
            m_phase = BlinkPhase::OPENING;
            break;

        case BlinkPhase::OPENING:
            for (auto &eye : m_eyes) {
                size_t i = index(eye.side());
                if (!m_lid_active[i]) continue;
                if (m_lid.action == LidAction::OPEN) m_held_closed[i] = false;
                eye.setLids(eye.restingLids());
                m_lid_active[i] = false;
            }
            m_phase = BlinkPhase::IDLE;
            break;

        case BlinkPhase::IDLE:
            break;
    }
    m_phase_elapsed = 0.0f;
}

void EyeAnimator::refreshLids() {
    float p = 0.0f;
    float duration = phaseDuration();
    if (duration > 0.0f) {
        p = ease(m_config.easing, m_phase_elapsed / duration);
    }

    for (auto &eye : m_eyes) {
        size_t i = index(eye.side());
        const EyelidCoverage &rest = eye.restingLids();
        EyelidCoverage lids = rest;

        if (m_lid_active[i] && m_phase != BlinkPhase::IDLE) {
            const EyelidCoverage &from = m_phase_start[i];
            switch (m_phase) {
                case BlinkPhase::CLOSING:
                    lids.top_inner = from.top_inner + (1.0f - from.top_inner) * p;
                    lids.top_outer = from.top_outer + (1.0f - from.top_outer) * p;
                    break;
                case BlinkPhase::CLOSED:
                    lids.top_inner = 1.0f;
                    lids.top_outer = 1.0f;
                    break;
                case BlinkPhase::OPENING:
                    lids.top_inner = 1.0f + (rest.top_inner - 1.0f) * p;
                    lids.top_outer = 1.0f + (rest.top_outer - 1.0f) * p;
                    break;
                default:
                    break;
            }
            eye.setLids(lids);
        } else if (m_held_closed[i]) {
            lids.top_inner = 1.0f;
            lids.top_outer = 1.0f;
            eye.setLids(lids);
        }
    }
}

// ---- Look ----

CommandResult EyeAnimator::look(Direction direction, Speed speed) {
    if (!isValid(direction)) {
        LOG_WARN(LOG_TAG_ANIM, "Rejected look: bad direction %d", static_cast<int>(direction));
        return CommandResult::invalid("unknown direction");
    }
    if (!isValid(speed)) {
        LOG_WARN(LOG_TAG_ANIM, "Rejected look: bad speed");
        return CommandResult::invalid("unknown speed");
    }

    startLook(direction, speed, m_config.look_travel);
    LOG_DEBUG(LOG_TAG_ANIM, "Look %s (%s) -> offset %.1f,%.1f",
              ::toString(direction), ::toString(speed), m_look_goal_x, m_look_goal_y);
    return CommandResult::success();
}

void EyeAnimator::startLook(Direction direction, Speed speed, float travel) {
    m_look_dx = directionStep(direction).dx;
    // Curious roles follow the new direction before room is measured
    applyCurious();

    lookTargetOffset(direction, travel, m_look_goal_x, m_look_goal_y);
    m_look_start_x = m_offset_x;
    m_look_start_y = m_offset_y;
    m_look_elapsed = 0.0f;
    m_look_duration = lookDuration(speed);
    m_look_target = direction;
}

void EyeAnimator::lookTargetOffset(Direction direction, float travel, float &ox, float &oy) const {
    const EyeModel &left = m_eyes[index(EyeSide::LEFT)];
    const EyeModel &right = m_eyes[index(EyeSide::RIGHT)];
    float screen_w = static_cast<float>(m_config.screen.width);
    float screen_h = static_cast<float>(m_config.screen.height);
    float half_gap = m_config.spacing * 0.5f;

    float left_room = std::max(0.0f, screen_w * 0.5f - half_gap - left.width());
    float right_room = std::max(0.0f, screen_w * 0.5f - half_gap - right.width());
    float tallest = std::max(left.height(), right.height());
    float vertical_room = std::max(0.0f, (screen_h - tallest) * 0.5f);

    DirectionStep step = directionStep(direction);
    ox = 0.0f;
    oy = 0.0f;
    if (step.dx < 0) ox = -left_room * travel;
    if (step.dx > 0) ox = right_room * travel;
    if (step.dy != 0) oy = step.dy * vertical_room * travel;
}

void EyeAnimator::advanceLook(float dt) {
    if (!m_look_target) return;

    m_look_elapsed += dt;
    float t = (m_look_duration > 0.0f) ? m_look_elapsed / m_look_duration : 1.0f;

    if (t >= 1.0f) {
        m_offset_x = m_look_goal_x;
        m_offset_y = m_look_goal_y;
        m_look_target.reset();
        return;
    }

    float p = ease(m_config.easing, t);
    m_offset_x = m_look_start_x + (m_look_goal_x - m_look_start_x) * p;
    m_offset_y = m_look_start_y + (m_look_goal_y - m_look_start_y) * p;
}

// Anchors sit either side of the centre line; eyes grow outwards
void EyeAnimator::layoutEyes() {
    EyeModel &left = m_eyes[index(EyeSide::LEFT)];
    EyeModel &right = m_eyes[index(EyeSide::RIGHT)];
    float mid_x = m_config.screen.width * 0.5f;
    float mid_y = m_config.screen.height * 0.5f;
    float half_gap = m_config.spacing * 0.5f;

    left.setCenter(mid_x - half_gap - left.width() * 0.5f + m_offset_x, mid_y + m_offset_y);
    right.setCenter(mid_x + half_gap + right.width() * 0.5f + m_offset_x, mid_y + m_offset_y);
}

// ---- Idle ----

void EyeAnimator::setIdleEnabled(bool enabled) {
    if (enabled && !m_idle_enabled) {
        m_idle_clock = 0.0f;
        scheduleIdle();
    }
    m_idle_enabled = enabled;
    LOG_DEBUG(LOG_TAG_ANIM, "Idle %s", enabled ? "enabled" : "disabled");
}

float EyeAnimator::drawRange(float lo, float hi) {
    float u = static_cast<float>(m_rng() / 4294967296.0);
    return lo + (hi - lo) * u;
}

void EyeAnimator::scheduleIdle() {
    m_next_blink_at = m_idle_clock + drawRange(ROBOEYES_IDLE_BLINK_MIN_S, ROBOEYES_IDLE_BLINK_MAX_S);
    m_next_look_at = m_idle_clock + drawRange(ROBOEYES_IDLE_LOOK_MIN_S, ROBOEYES_IDLE_LOOK_MAX_S);
}

void EyeAnimator::advanceIdle(float dt) {
    m_idle_clock += dt;

    bool any_held = m_held_closed[0] || m_held_closed[1];
    if (m_idle_clock >= m_next_blink_at) {
        if (m_phase == BlinkPhase::IDLE && m_lid_queue.empty() && !any_held) {
            queueLid(LidAction::BLINK, Speed::MEDIUM, EyeSelector::BOTH);
        }
        m_next_blink_at = m_idle_clock + drawRange(ROBOEYES_IDLE_BLINK_MIN_S, ROBOEYES_IDLE_BLINK_MAX_S);
    }

    if (m_idle_clock >= m_next_look_at) {
        if (!m_look_target) {
            Direction direction = static_cast<Direction>(m_rng() % 9);
            startLook(direction, Speed::SLOW, m_config.idle_travel);
        }
        m_next_look_at = m_idle_clock + drawRange(ROBOEYES_IDLE_LOOK_MIN_S, ROBOEYES_IDLE_LOOK_MAX_S);
    }
}
