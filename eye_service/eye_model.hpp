#ifndef EYE_MODEL_HPP
#define EYE_MODEL_HPP

#include "eye_types.hpp"
#include "geometry.hpp"

/**
 * Eye shape class, picked by mood. Drives how the renderer cuts the lids.
 */
enum class EyeShape : uint8_t {
    ROUND,
    ANGRY,   // top lid slopes down towards the nose
    TIRED,   // top lid slopes down towards the outer edge
    HAPPY    // lower lid rises as a cheek
};

/**
 * Role of an eye while curious scaling is on.
 */
enum class CuriousRole : uint8_t {
    NEUTRAL,
    OUTER,
    INNER
};

/**
 * Eyelid coverage as fractions [0,1] of the eye height.
 * The top lid has an inner (nose side) and an outer edge so moods can tilt it.
 */
struct EyelidCoverage {
    float top_inner = 0.0f;
    float top_outer = 0.0f;
    float bottom = 0.0f;

    float top() const { return top_inner > top_outer ? top_inner : top_outer; }
};

bool operator==(const EyelidCoverage &a, const EyelidCoverage &b);

/**
 * EyeModel - Mutable geometry of one eye
 *
 * Holds centre, base and current size, corner radius and eyelid coverage.
 * Invariants kept by every setter:
 * - width/height within [ROBOEYES_EYE_MIN_PX, screen]
 * - eyelid coverage within [0,1]
 * - the eye box stays inside the screen
 */
class EyeModel {
public:
    EyeModel(EyeSide side, int screen_width, int screen_height);

    EyeSide side() const { return m_side; }

    void setBounds(int screen_width, int screen_height);
    int screenWidth() const { return m_screen_w; }
    int screenHeight() const { return m_screen_h; }

    /**
     * Set the configured size. The current size follows, scaled if
     * curious scaling is active.
     */
    void setBaseSize(float width, float height);
    void setBaseCornerRadius(float radius);

    void setCenter(float x, float y);

    float centerX() const { return m_center_x; }
    float centerY() const { return m_center_y; }
    float width() const { return m_width; }
    float height() const { return m_height; }
    float baseWidth() const { return m_base_width; }
    float baseHeight() const { return m_base_height; }
    float baseCornerRadius() const { return m_base_radius; }

    /**
     * Corner radius at the current size, at most half the shorter side.
     */
    float cornerRadius() const;

    RectF box() const;

    /**
     * Resting eyelid shape for a mood. Pure, left/right agnostic.
     */
    static EyelidCoverage moodShape(Mood mood);
    static EyeShape shapeFor(Mood mood);

    /**
     * Set resting and current lids to the mood's shape.
     * Idempotent for the same mood.
     */
    void applyMoodShape(Mood mood);
    EyeShape shape() const { return m_shape; }

    void setCuriousRole(CuriousRole role);
    CuriousRole curiousRole() const { return m_role; }

    /**
     * Scale to base * role factor when active, restore the exact base
     * size when not. Scaling always starts from the base, so repeated
     * calls never compound.
     */
    void applyCuriousScale(bool active);
    bool curiousActive() const { return m_curious; }

    /**
     * Flat top lid and bottom lid, clamped to [0,1].
     */
    void setEyelidCoverage(float top, float bottom);
    void setLids(const EyelidCoverage &lids);

    const EyelidCoverage &lids() const { return m_lids; }
    const EyelidCoverage &restingLids() const { return m_resting; }
    float eyelidTopCoverage() const { return m_lids.top(); }
    float eyelidBottomCoverage() const { return m_lids.bottom; }

private:
    void updateSize();
    void clampCenter();
    float roleFactor() const;

    EyeSide m_side;
    int m_screen_w;
    int m_screen_h;

    float m_center_x = 0.0f;
    float m_center_y = 0.0f;

    float m_base_width;
    float m_base_height;
    float m_base_radius = 0.0f;
    float m_width;
    float m_height;

    EyelidCoverage m_lids;
    EyelidCoverage m_resting;
    EyeShape m_shape = EyeShape::ROUND;

    CuriousRole m_role = CuriousRole::NEUTRAL;
    bool m_curious = false;
};

#endif // EYE_MODEL_HPP
