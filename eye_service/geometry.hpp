#ifndef GEOMETRY_HPP
#define GEOMETRY_HPP

#include "bitmap.hpp"

#include <cstdint>
#include <vector>

struct PointF {
    float x = 0.0f;
    float y = 0.0f;
};

/**
 * Axis-aligned box in screen space, top-left origin, y down.
 */
struct RectF {
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    float left() const { return x; }
    float top() const { return y; }
    float right() const { return x + w; }
    float bottom() const { return y + h; }

    static RectF fromCenter(float cx, float cy, float w, float h) {
        return RectF{cx - w * 0.5f, cy - h * 0.5f, w, h};
    }
};

/**
 * Stateless rasterisers.
 *
 * A pixel is covered when its centre (px + 0.5, py + 0.5) falls inside the
 * shape, using half-open bounds, so adjacent shapes never overlap and a box
 * with integer edges covers exactly w * h pixels.
 *
 * All return false without drawing for degenerate input (zero or negative
 * extent, non-finite coordinates, fewer than three polygon vertices or a
 * zero-area polygon). That is a defined no-op, not a failure.
 */
bool fillRect(Bitmap &bmp, const RectF &rect, uint32_t color);
bool fillRoundedRect(Bitmap &bmp, const RectF &rect, float radius, uint32_t color);
bool fillPolygon(Bitmap &bmp, const std::vector<PointF> &vertices, uint32_t color);
bool fillEllipse(Bitmap &bmp, const RectF &bounds, uint32_t color);

bool isDegenerate(const RectF &rect);

#endif // GEOMETRY_HPP
