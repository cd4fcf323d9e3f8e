#ifndef BITMAP_HPP
#define BITMAP_HPP

#include <cstdint>
#include <string>
#include <vector>

/**
 * Pixel encodings a panel can be driven in.
 */
enum class ColorMode : uint8_t {
    MONO,     // "1"   - 1 bit per pixel (SSD1306, SH1106, ...)
    RGB565,   // "565" - 16 bit, big-endian on the wire
    RGB888    // "RGB" - 24 bit
};

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

bool operator==(const Rgb &a, const Rgb &b);

bool parseColorMode(const std::string &name, ColorMode &out);
const char *toString(ColorMode mode);

/**
 * Parse "#RRGGBB" (or "RRGGBB"). Returns false on malformed input.
 */
bool parseRgb(const std::string &text, Rgb &out);
std::string formatRgb(const Rgb &color);

/**
 * Encode a colour in the mode's native pixel value.
 * MONO maps colours at or above half luma to 1.
 */
uint32_t encodeColor(const Rgb &color, ColorMode mode);

/**
 * Bitmap - fixed-size framebuffer in one colour mode.
 *
 * One stored value per pixel, row-major. Writes outside the
 * surface are clipped silently.
 */
class Bitmap {
public:
    Bitmap();
    Bitmap(int width, int height, ColorMode mode);

    int width() const { return m_width; }
    int height() const { return m_height; }
    ColorMode mode() const { return m_mode; }
    bool empty() const { return m_pixels.empty(); }

    void fill(uint32_t value);
    void setPixel(int x, int y, uint32_t value);
    uint32_t getPixel(int x, int y) const;

    /**
     * Fill [x_start, x_end) of row y. Clipped.
     */
    void fillSpan(int y, int x_start, int x_end, uint32_t value);

    /**
     * Count pixels with the given value.
     */
    size_t count(uint32_t value) const;

    /**
     * Pack for transport: MONO rows MSB-first (each row padded to a byte),
     * RGB565 big-endian, RGB888 as r,g,b.
     */
    std::vector<uint8_t> toBytes() const;

    /**
     * Copy rotated clockwise by quarter_turns * 90 degrees.
     */
    Bitmap rotated(int quarter_turns) const;

    const std::vector<uint32_t> &pixels() const { return m_pixels; }

    bool operator==(const Bitmap &other) const;
    bool operator!=(const Bitmap &other) const { return !(*this == other); }

private:
    int m_width = 0;
    int m_height = 0;
    ColorMode m_mode = ColorMode::MONO;
    std::vector<uint32_t> m_pixels;
};

#endif // BITMAP_HPP
