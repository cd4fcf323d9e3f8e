#include "bitmap.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

bool operator==(const Rgb &a, const Rgb &b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

bool parseColorMode(const std::string &name, ColorMode &out) {
    if (name == "1" || name == "mono") out = ColorMode::MONO;
    else if (name == "565" || name == "RGB565" || name == "rgb565") out = ColorMode::RGB565;
    else if (name == "RGB" || name == "rgb" || name == "RGB888") out = ColorMode::RGB888;
    else return false;
    return true;
}

const char *toString(ColorMode mode) {
    switch (mode) {
        case ColorMode::MONO:   return "1";
        case ColorMode::RGB565: return "565";
        case ColorMode::RGB888: return "RGB";
    }
    return "?";
}

static int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

bool parseRgb(const std::string &text, Rgb &out) {
    std::string hex = text;
    if (!hex.empty() && hex[0] == '#') hex.erase(0, 1);
    if (hex.size() != 6) return false;

    uint8_t channels[3];
    for (int i = 0; i < 3; i++) {
        int hi = hexDigit(hex[i * 2]);
        int lo = hexDigit(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) return false;
        channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    out.r = channels[0];
    out.g = channels[1];
    out.b = channels[2];
    return true;
}

std::string formatRgb(const Rgb &color) {
    char buf[8];
    snprintf(buf, sizeof(buf), "#%02X%02X%02X", color.r, color.g, color.b);
    return buf;
}

uint32_t encodeColor(const Rgb &color, ColorMode mode) {
    switch (mode) {
        case ColorMode::MONO: {
            // Rec. 601 luma, integer weights summing to 1000
            uint32_t luma = (299u * color.r + 587u * color.g + 114u * color.b) / 1000u;
            return luma >= 128 ? 1u : 0u;
        }
        case ColorMode::RGB565:
            return ((color.r & 0xF8u) << 8) | ((color.g & 0xFCu) << 3) | (color.b >> 3);
        case ColorMode::RGB888:
            return (static_cast<uint32_t>(color.r) << 16) |
                   (static_cast<uint32_t>(color.g) << 8) |
                   color.b;
    }
    return 0;
}

Bitmap::Bitmap() = default;

Bitmap::Bitmap(int width, int height, ColorMode mode)
    : m_width(std::max(0, width)),
      m_height(std::max(0, height)),
      m_mode(mode),
      m_pixels(static_cast<size_t>(m_width) * m_height, 0u) {
}

void Bitmap::fill(uint32_t value) {
    std::fill(m_pixels.begin(), m_pixels.end(), value);
}

void Bitmap::setPixel(int x, int y, uint32_t value) {
    if (x < 0 || y < 0 || x >= m_width || y >= m_height) return;
    m_pixels[static_cast<size_t>(y) * m_width + x] = value;
}

uint32_t Bitmap::getPixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= m_width || y >= m_height) return 0;
    return m_pixels[static_cast<size_t>(y) * m_width + x];
}

void Bitmap::fillSpan(int y, int x_start, int x_end, uint32_t value) {
    if (y < 0 || y >= m_height) return;
    x_start = std::max(0, x_start);
    x_end = std::min(m_width, x_end);
    if (x_start >= x_end) return;
    auto row = m_pixels.begin() + static_cast<size_t>(y) * m_width;
    std::fill(row + x_start, row + x_end, value);
}

size_t Bitmap::count(uint32_t value) const {
    return static_cast<size_t>(std::count(m_pixels.begin(), m_pixels.end(), value));
}

std::vector<uint8_t> Bitmap::toBytes() const {
    std::vector<uint8_t> out;

    switch (m_mode) {
        case ColorMode::MONO: {
            size_t stride = static_cast<size_t>((m_width + 7) / 8);
            out.assign(stride * m_height, 0);
            for (int y = 0; y < m_height; y++) {
                for (int x = 0; x < m_width; x++) {
                    if (getPixel(x, y)) {
                        out[y * stride + x / 8] |= static_cast<uint8_t>(0x80u >> (x % 8));
                    }
                }
            }
            break;
        }
        case ColorMode::RGB565:
            out.reserve(m_pixels.size() * 2);
            for (uint32_t px : m_pixels) {
                out.push_back(static_cast<uint8_t>((px >> 8) & 0xFF));
                out.push_back(static_cast<uint8_t>(px & 0xFF));
            }
            break;
        case ColorMode::RGB888:
            out.reserve(m_pixels.size() * 3);
            for (uint32_t px : m_pixels) {
                out.push_back(static_cast<uint8_t>((px >> 16) & 0xFF));
                out.push_back(static_cast<uint8_t>((px >> 8) & 0xFF));
                out.push_back(static_cast<uint8_t>(px & 0xFF));
            }
            break;
    }
    return out;
}

Bitmap Bitmap::rotated(int quarter_turns) const {
    int turns = ((quarter_turns % 4) + 4) % 4;
    if (turns == 0) return *this;

    bool swap = (turns % 2) == 1;
    Bitmap out(swap ? m_height : m_width, swap ? m_width : m_height, m_mode);

    for (int y = 0; y < m_height; y++) {
        for (int x = 0; x < m_width; x++) {
            uint32_t px = getPixel(x, y);
            switch (turns) {
                case 1: out.setPixel(m_height - 1 - y, x, px); break;
                case 2: out.setPixel(m_width - 1 - x, m_height - 1 - y, px); break;
                case 3: out.setPixel(y, m_width - 1 - x, px); break;
            }
        }
    }
    return out;
}

bool Bitmap::operator==(const Bitmap &other) const {
    return m_width == other.m_width &&
           m_height == other.m_height &&
           m_mode == other.m_mode &&
           m_pixels == other.m_pixels;
}
