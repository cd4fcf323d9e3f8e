#ifndef EYE_ANIMATOR_HPP
#define EYE_ANIMATOR_HPP

#include "eye_config.hpp"
#include "eye_model.hpp"
#include "eye_types.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <queue>
#include <random>

/**
 * EyeAnimator - Animation controller for the eye pair
 *
 * Features:
 * - Blink, close and open (queued, never interrupted)
 * - Look towards one of 9 directions (a new look replaces the old one)
 * - Instant mood and curious changes
 * - Optional idle wander and auto-blink
 *
 * Time only advances through tick(); there are no internal timers.
 * Not thread-safe: tick, commands and rendering must be serialised
 * by the caller.
 */
class EyeAnimator {
public:
    struct LidTiming {
        float close_s;
        float hold_s;
        float open_s;
    };

    struct Status {
        Mood mood;
        BlinkPhase blink_phase;
        std::optional<Direction> look_target;
        bool curious;
        bool idle_enabled;
        bool held_closed_left;
        bool held_closed_right;
        size_t queued_lid_requests;
        bool idle;
    };

    explicit EyeAnimator(const ResolvedConfig &config);

    /**
     * Advance all animations by elapsed_s seconds.
     */
    void tick(float elapsed_s);

    CommandResult look(Direction direction, Speed speed);
    CommandResult blink(Speed speed, EyeSelector eyes = EyeSelector::BOTH);
    CommandResult close(Speed speed, EyeSelector eyes = EyeSelector::BOTH);
    CommandResult open(Speed speed, EyeSelector eyes = EyeSelector::BOTH);
    CommandResult setMood(Mood mood);
    CommandResult setCurious(bool active);

    /**
     * Set lid coverage directly. Values are clamped to [0,1]; a running
     * blink overrides the top lid on the next tick.
     */
    CommandResult setEyelidCoverage(float top, float bottom,
                                    EyeSelector eyes = EyeSelector::BOTH);

    /**
     * Enable/disable idle wander and auto-blink.
     */
    void setIdleEnabled(bool enabled);
    bool idleEnabled() const { return m_idle_enabled; }

    /**
     * True when no look is in flight and the lid track is empty.
     */
    bool isIdle() const;

    const EyeModel &eye(EyeSide side) const { return m_eyes[index(side)]; }
    const ResolvedConfig &config() const { return m_config; }

    Mood mood() const { return m_mood; }
    BlinkPhase blinkPhase() const { return m_phase; }
    std::optional<Direction> lookTarget() const { return m_look_target; }
    bool curious() const { return curiousEffective(); }
    bool heldClosed(EyeSide side) const { return m_held_closed[index(side)]; }
    size_t queuedLidRequests() const { return m_lid_queue.size(); }
    float lookOffsetX() const { return m_offset_x; }
    float lookOffsetY() const { return m_offset_y; }

    Status status() const;

    static LidTiming lidTiming(Speed speed);
    static float lookDuration(Speed speed);
    static float ease(Easing easing, float t);

private:
    enum class LidAction : uint8_t {
        BLINK,
        CLOSE,
        OPEN
    };

    struct LidRequest {
        LidAction action;
        Speed speed;
        EyeSelector eyes;
    };

    static size_t index(EyeSide side) { return static_cast<size_t>(side); }
    static const char *toString(LidAction action);

    CommandResult queueLid(LidAction action, Speed speed, EyeSelector eyes);
    bool startNextLid();
    void advanceLids(float dt);
    void completePhase();
    float phaseDuration() const;
    void refreshLids();

    void startLook(Direction direction, Speed speed, float travel);
    void advanceLook(float dt);
    void lookTargetOffset(Direction direction, float travel, float &ox, float &oy) const;

    bool curiousEffective() const;
    void applyCurious();
    void layoutEyes();

    void advanceIdle(float dt);
    float drawRange(float lo, float hi);
    void scheduleIdle();

    ResolvedConfig m_config;
    std::array<EyeModel, 2> m_eyes;

    Mood m_mood = Mood::DEFAULT;
    bool m_curious_toggle = false;

    // Lid track
    std::queue<LidRequest> m_lid_queue;
    LidRequest m_lid{LidAction::BLINK, Speed::MEDIUM, EyeSelector::BOTH};
    BlinkPhase m_phase = BlinkPhase::IDLE;
    float m_phase_elapsed = 0.0f;
    std::array<bool, 2> m_lid_active{{false, false}};
    std::array<EyelidCoverage, 2> m_phase_start;
    std::array<bool, 2> m_held_closed{{false, false}};

    // Look
    std::optional<Direction> m_look_target;
    int m_look_dx = 0;
    float m_offset_x = 0.0f;
    float m_offset_y = 0.0f;
    float m_look_start_x = 0.0f;
    float m_look_start_y = 0.0f;
    float m_look_goal_x = 0.0f;
    float m_look_goal_y = 0.0f;
    float m_look_elapsed = 0.0f;
    float m_look_duration = 0.0f;

    // Idle
    bool m_idle_enabled = false;
    std::mt19937 m_rng;
    float m_idle_clock = 0.0f;
    float m_next_blink_at = 0.0f;
    float m_next_look_at = 0.0f;
};

#endif // EYE_ANIMATOR_HPP
