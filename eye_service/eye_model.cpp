#include "eye_model.hpp"

#include <algorithm>
#include <cmath>

extern "C" {
#include "eye_limits.h"
}

static EyelidCoverage clampLids(const EyelidCoverage &lids) {
    EyelidCoverage out;
    out.top_inner = roboeyes_clamp01(lids.top_inner);
    out.top_outer = roboeyes_clamp01(lids.top_outer);
    out.bottom = roboeyes_clamp01(lids.bottom);
    return out;
}

static float clampSize(float value, int limit) {
    float hi = std::max<float>(ROBOEYES_EYE_MIN_PX, static_cast<float>(limit));
    if (!std::isfinite(value)) return ROBOEYES_EYE_MIN_PX;
    return std::clamp(value, static_cast<float>(ROBOEYES_EYE_MIN_PX), hi);
}

bool operator==(const EyelidCoverage &a, const EyelidCoverage &b) {
    return a.top_inner == b.top_inner && a.top_outer == b.top_outer && a.bottom == b.bottom;
}

EyeModel::EyeModel(EyeSide side, int screen_width, int screen_height)
    : m_side(side),
      m_screen_w(std::max(1, screen_width)),
      m_screen_h(std::max(1, screen_height)),
      m_base_width(ROBOEYES_EYE_MIN_PX),
      m_base_height(ROBOEYES_EYE_MIN_PX),
      m_width(ROBOEYES_EYE_MIN_PX),
      m_height(ROBOEYES_EYE_MIN_PX) {
    m_center_x = m_screen_w * 0.5f;
    m_center_y = m_screen_h * 0.5f;
}

void EyeModel::setBounds(int screen_width, int screen_height) {
    m_screen_w = std::max(1, screen_width);
    m_screen_h = std::max(1, screen_height);
    m_base_width = clampSize(m_base_width, m_screen_w);
    m_base_height = clampSize(m_base_height, m_screen_h);
    updateSize();
}

void EyeModel::setBaseSize(float width, float height) {
    m_base_width = clampSize(width, m_screen_w);
    m_base_height = clampSize(height, m_screen_h);
    updateSize();
}

void EyeModel::setBaseCornerRadius(float radius) {
    m_base_radius = std::isfinite(radius) ? std::max(0.0f, radius) : 0.0f;
}

void EyeModel::setCenter(float x, float y) {
    if (std::isfinite(x)) m_center_x = x;
    if (std::isfinite(y)) m_center_y = y;
    clampCenter();
}

float EyeModel::cornerRadius() const {
    float scale = std::min(m_width / m_base_width, m_height / m_base_height);
    float r = m_base_radius * scale;
    return std::min(r, std::min(m_width, m_height) * 0.5f);
}

RectF EyeModel::box() const {
    return RectF::fromCenter(m_center_x, m_center_y, m_width, m_height);
}

EyelidCoverage EyeModel::moodShape(Mood mood) {
    EyelidCoverage lids;
    switch (mood) {
        case Mood::ANGRY:
            lids.top_inner = ROBOEYES_MOOD_LID;
            break;
        case Mood::TIRED:
            lids.top_outer = ROBOEYES_MOOD_LID;
            break;
        case Mood::HAPPY:
            lids.bottom = ROBOEYES_MOOD_LID;
            break;
        case Mood::DEFAULT:
        case Mood::CURIOUS:
            break;
    }
    return lids;
}

EyeShape EyeModel::shapeFor(Mood mood) {
    switch (mood) {
        case Mood::ANGRY: return EyeShape::ANGRY;
        case Mood::TIRED: return EyeShape::TIRED;
        case Mood::HAPPY: return EyeShape::HAPPY;
        default:          return EyeShape::ROUND;
    }
}

void EyeModel::applyMoodShape(Mood mood) {
    m_resting = moodShape(mood);
    m_lids = m_resting;
    m_shape = shapeFor(mood);
}

void EyeModel::setCuriousRole(CuriousRole role) {
    m_role = role;
    updateSize();
}

void EyeModel::applyCuriousScale(bool active) {
    m_curious = active;
    updateSize();
}

void EyeModel::setEyelidCoverage(float top, float bottom) {
    EyelidCoverage lids;
    lids.top_inner = top;
    lids.top_outer = top;
    lids.bottom = bottom;
    m_lids = clampLids(lids);
}

void EyeModel::setLids(const EyelidCoverage &lids) {
    m_lids = clampLids(lids);
}

float EyeModel::roleFactor() const {
    switch (m_role) {
        case CuriousRole::OUTER: return ROBOEYES_CURIOUS_OUTER;
        case CuriousRole::INNER: return ROBOEYES_CURIOUS_INNER;
        case CuriousRole::NEUTRAL:
        default:
            return 1.0f;
    }
}

void EyeModel::updateSize() {
    if (m_curious) {
        float factor = roleFactor();
        m_width = clampSize(m_base_width * factor, m_screen_w);
        m_height = clampSize(m_base_height * factor, m_screen_h);
    } else {
        m_width = m_base_width;
        m_height = m_base_height;
    }
    clampCenter();
}

void EyeModel::clampCenter() {
    float half_w = m_width * 0.5f;
    float half_h = m_height * 0.5f;

    if (m_width >= m_screen_w) {
        m_center_x = m_screen_w * 0.5f;
    } else {
        m_center_x = std::clamp(m_center_x, half_w, m_screen_w - half_w);
    }

    if (m_height >= m_screen_h) {
        m_center_y = m_screen_h * 0.5f;
    } else {
        m_center_y = std::clamp(m_center_y, half_h, m_screen_h - half_h);
    }
}
