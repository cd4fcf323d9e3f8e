#ifndef ROBOEYES_EYE_LIMITS_H
#define ROBOEYES_EYE_LIMITS_H

#include <stdint.h>

// Screen limits (smallest panel we still draw on)
#define ROBOEYES_SCREEN_MIN_W       8
#define ROBOEYES_SCREEN_MIN_H       4
#define ROBOEYES_SCREEN_MAX_DIM     4096

// Eye geometry
#define ROBOEYES_EYE_MIN_PX         2
#define ROBOEYES_CURIOUS_OUTER      1.4f
#define ROBOEYES_CURIOUS_INNER      0.6f

// Mood lid shapes (fraction of eye height)
#define ROBOEYES_MOOD_LID           0.5f

// Look durations (seconds)
#define ROBOEYES_LOOK_SLOW_S        0.8f
#define ROBOEYES_LOOK_MEDIUM_S      0.5f
#define ROBOEYES_LOOK_FAST_S        0.3f

// Lid request queue depth
#define ROBOEYES_LID_QUEUE_MAX      8

// Idle scheduling (seconds)
#define ROBOEYES_IDLE_BLINK_MIN_S   3.0f
#define ROBOEYES_IDLE_BLINK_MAX_S   6.0f
#define ROBOEYES_IDLE_LOOK_MIN_S    2.0f
#define ROBOEYES_IDLE_LOOK_MAX_S    5.0f

// Render rate
#define ROBOEYES_RENDER_FPS_DEFAULT 30
#define ROBOEYES_RENDER_FPS_MIN     1
#define ROBOEYES_RENDER_FPS_MAX     120

// NaN clamps to 0
static inline float roboeyes_clamp01(float value) {
    if (!(value >= 0.0f)) return 0.0f;
    if (value > 1.0f) return 1.0f;
    return value;
}

static inline int roboeyes_clamp_int(int value, int lo, int hi) {
    if (value < lo) return lo;
    if (value > hi) return hi;
    return value;
}

#endif // ROBOEYES_EYE_LIMITS_H
