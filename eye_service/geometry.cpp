#include "geometry.hpp"

#include <algorithm>
#include <cmath>

// First pixel whose centre is >= a
static int firstCenter(float a) {
    return static_cast<int>(std::ceil(a - 0.5f));
}

// One past the last pixel whose centre is < b
static int endCenter(float b) {
    return static_cast<int>(std::ceil(b - 0.5f));
}

static void fillRowSpan(Bitmap &bmp, int py, float x_from, float x_to, uint32_t color) {
    if (x_to <= x_from) return;
    bmp.fillSpan(py, firstCenter(x_from), endCenter(x_to), color);
}

// Row range clipped to the surface, avoids walking off-screen rows
static void clipRows(const Bitmap &bmp, float top, float bottom, int &y_start, int &y_end) {
    y_start = std::max(0, firstCenter(top));
    y_end = std::min(bmp.height(), endCenter(bottom));
}

bool isDegenerate(const RectF &rect) {
    if (!std::isfinite(rect.x) || !std::isfinite(rect.y) ||
        !std::isfinite(rect.w) || !std::isfinite(rect.h)) {
        return true;
    }
    return rect.w <= 0.0f || rect.h <= 0.0f;
}

bool fillRect(Bitmap &bmp, const RectF &rect, uint32_t color) {
    if (isDegenerate(rect)) return false;

    int y_start, y_end;
    clipRows(bmp, rect.top(), rect.bottom(), y_start, y_end);
    for (int py = y_start; py < y_end; py++) {
        fillRowSpan(bmp, py, rect.left(), rect.right(), color);
    }
    return true;
}

bool fillRoundedRect(Bitmap &bmp, const RectF &rect, float radius, uint32_t color) {
    if (isDegenerate(rect)) return false;

    float r = std::min(std::max(0.0f, radius), std::min(rect.w, rect.h) * 0.5f);
    if (!std::isfinite(r)) r = 0.0f;

    int y_start, y_end;
    clipRows(bmp, rect.top(), rect.bottom(), y_start, y_end);

    for (int py = y_start; py < y_end; py++) {
        float yc = py + 0.5f;
        float inset = 0.0f;

        // Inside a corner band: narrow the span along the corner circle
        bool in_corner = false;
        float corner_cy = 0.0f;
        if (yc < rect.top() + r) {
            in_corner = true;
            corner_cy = rect.top() + r;
        } else if (yc > rect.bottom() - r) {
            in_corner = true;
            corner_cy = rect.bottom() - r;
        }
        if (in_corner) {
            float dy = yc - corner_cy;
            float rem = r * r - dy * dy;
            if (rem <= 0.0f) continue;
            inset = r - std::sqrt(rem);
        }

        fillRowSpan(bmp, py, rect.left() + inset, rect.right() - inset, color);
    }
    return true;
}

bool fillPolygon(Bitmap &bmp, const std::vector<PointF> &vertices, uint32_t color) {
    if (vertices.size() < 3) return false;

    // Shoelace area, rejects collinear or collapsed outlines
    float area2 = 0.0f;
    float min_y = vertices[0].y;
    float max_y = vertices[0].y;
    for (size_t i = 0; i < vertices.size(); i++) {
        const PointF &a = vertices[i];
        const PointF &b = vertices[(i + 1) % vertices.size()];
        if (!std::isfinite(a.x) || !std::isfinite(a.y)) return false;
        area2 += a.x * b.y - b.x * a.y;
        min_y = std::min(min_y, a.y);
        max_y = std::max(max_y, a.y);
    }
    if (std::fabs(area2) < 1e-6f) return false;

    int y_start, y_end;
    clipRows(bmp, min_y, max_y, y_start, y_end);

    std::vector<float> crossings;
    crossings.reserve(vertices.size());

    for (int py = y_start; py < y_end; py++) {
        float yc = py + 0.5f;
        crossings.clear();

        for (size_t i = 0; i < vertices.size(); i++) {
            const PointF &a = vertices[i];
            const PointF &b = vertices[(i + 1) % vertices.size()];
            // Half-open in y so shared vertices are counted once
            if ((a.y <= yc) != (b.y <= yc)) {
                float t = (yc - a.y) / (b.y - a.y);
                crossings.push_back(a.x + t * (b.x - a.x));
            }
        }

        std::sort(crossings.begin(), crossings.end());
        for (size_t i = 0; i + 1 < crossings.size(); i += 2) {
            fillRowSpan(bmp, py, crossings[i], crossings[i + 1], color);
        }
    }
    return true;
}

bool fillEllipse(Bitmap &bmp, const RectF &bounds, uint32_t color) {
    if (isDegenerate(bounds)) return false;

    float rx = bounds.w * 0.5f;
    float ry = bounds.h * 0.5f;
    float cx = bounds.x + rx;
    float cy = bounds.y + ry;

    int y_start, y_end;
    clipRows(bmp, bounds.top(), bounds.bottom(), y_start, y_end);

    for (int py = y_start; py < y_end; py++) {
        float t = (py + 0.5f - cy) / ry;
        float rem = 1.0f - t * t;
        if (rem <= 0.0f) continue;
        float dx = rx * std::sqrt(rem);
        fillRowSpan(bmp, py, cx - dx, cx + dx, color);
    }
    return true;
}
