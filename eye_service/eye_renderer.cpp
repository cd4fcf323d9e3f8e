#include "eye_renderer.hpp"
#include "eye_animator.hpp"
#include "geometry.hpp"

#include <vector>

EyeRenderer::EyeRenderer(const ScreenConfig &screen, const Rgb &eye_color, const Rgb &background)
    : m_width(screen.width),
      m_height(screen.height),
      m_mode(screen.mode),
      m_eye_color(encodeColor(eye_color, screen.mode)),
      m_background(encodeColor(background, screen.mode)) {
}

EyeRenderer::EyeRenderer(const ResolvedConfig &config)
    : EyeRenderer(config.screen, config.color, config.background) {
}

Bitmap EyeRenderer::render(const EyeAnimator &animator) const {
    return render(animator.eye(EyeSide::LEFT), animator.eye(EyeSide::RIGHT));
}

Bitmap EyeRenderer::render(const EyeModel &left, const EyeModel &right) const {
    Bitmap frame(m_width, m_height, m_mode);
    renderInto(frame, left, right);
    return frame;
}

void EyeRenderer::renderInto(Bitmap &frame, const EyeModel &left, const EyeModel &right) const {
    if (frame.width() != m_width || frame.height() != m_height || frame.mode() != m_mode) {
        frame = Bitmap(m_width, m_height, m_mode);
    }

    frame.fill(m_background);
    renderEye(frame, left);
    renderEye(frame, right);
}

void EyeRenderer::renderEye(Bitmap &frame, const EyeModel &eye) const {
    RectF box = eye.box();

    // Zero-size eyes draw nothing
    if (!fillRoundedRect(frame, box, eye.cornerRadius(), m_eye_color)) {
        return;
    }

    drawTopLid(frame, eye, box);
    drawBottomLid(frame, eye, box);
}

void EyeRenderer::drawTopLid(Bitmap &frame, const EyeModel &eye, const RectF &box) const {
    const EyelidCoverage &lids = eye.lids();
    if (lids.top() <= 0.0f) return;

    if (lids.top_inner == lids.top_outer) {
        RectF lid{box.left(), box.top(), box.w, box.h * lids.top_inner};
        fillRect(frame, lid, m_background);
        return;
    }

    // Inner edge faces the nose: right edge of the left eye, left edge of the right eye
    bool left_eye = eye.side() == EyeSide::LEFT;
    float left_cover = left_eye ? lids.top_outer : lids.top_inner;
    float right_cover = left_eye ? lids.top_inner : lids.top_outer;

    std::vector<PointF> lid = {
        {box.left(), box.top() - 1.0f},
        {box.right(), box.top() - 1.0f},
        {box.right(), box.top() + box.h * right_cover},
        {box.left(), box.top() + box.h * left_cover},
    };
    fillPolygon(frame, lid, m_background);
}

void EyeRenderer::drawBottomLid(Bitmap &frame, const EyeModel &eye, const RectF &box) const {
    float cover = eye.lids().bottom;
    if (cover <= 0.0f) return;

    float lid_h = box.h * cover;

    if (eye.shape() == EyeShape::HAPPY) {
        // Cheek: half ellipse rising from the bottom edge, full height at the centre column
        RectF cheek{box.left(), box.bottom() - lid_h, box.w, lid_h * 2.0f};
        fillEllipse(frame, cheek, m_background);
        return;
    }

    RectF lid{box.left(), box.bottom() - lid_h, box.w, lid_h};
    fillRect(frame, lid, m_background);
}
