#ifndef EYE_RENDERER_HPP
#define EYE_RENDERER_HPP

#include "bitmap.hpp"
#include "eye_config.hpp"
#include "eye_model.hpp"

#include <cstdint>

class EyeAnimator;

/**
 * EyeRenderer - Rasterises the eye pair into one frame
 *
 * Read-only over the models: the same models always give the same frame.
 */
class EyeRenderer {
public:
    EyeRenderer(const ScreenConfig &screen, const Rgb &eye_color, const Rgb &background);
    explicit EyeRenderer(const ResolvedConfig &config);

    Bitmap render(const EyeAnimator &animator) const;
    Bitmap render(const EyeModel &left, const EyeModel &right) const;

    /**
     * Draw into an existing frame of the configured size, reusing its storage.
     */
    void renderInto(Bitmap &frame, const EyeModel &left, const EyeModel &right) const;

    uint32_t eyeColor() const { return m_eye_color; }
    uint32_t backgroundColor() const { return m_background; }

private:
    void renderEye(Bitmap &frame, const EyeModel &eye) const;
    void drawTopLid(Bitmap &frame, const EyeModel &eye, const RectF &box) const;
    void drawBottomLid(Bitmap &frame, const EyeModel &eye, const RectF &box) const;

    int m_width;
    int m_height;
    ColorMode m_mode;
    uint32_t m_eye_color;
    uint32_t m_background;
};

#endif // EYE_RENDERER_HPP
