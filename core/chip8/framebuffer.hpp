// ==============================================================================
// CHIP-8 Framebuffer
// ==============================================================================
// The 64x32 monochrome display. Pixels are addressed (x, y) with x the
// column (0-63) and y the row (0-31); (0, 0) is the top-left corner.
//
// Only the engine mutates it. Renderers receive a const reference between
// cycles and read rows() or get_pixel().
// ==============================================================================

#ifndef CHIP8_FRAMEBUFFER_HPP
#define CHIP8_FRAMEBUFFER_HPP

#include "types.hpp"
#include <array>
#include <string>

namespace chip8 {

constexpr int DISPLAY_WIDTH = 64;
constexpr int DISPLAY_HEIGHT = 32;

class Framebuffer {
public:
    using Row = std::array<bool, DISPLAY_WIDTH>;
    using Grid = std::array<Row, DISPLAY_HEIGHT>;

    Framebuffer();

    /**
     * @brief Turn every pixel off.
     */
    void clear();

    /**
     * @brief Check if a pixel is lit. Out-of-range coordinates read as off.
     */
    bool get_pixel(int x, int y) const;

    /**
     * @brief Set a pixel on or off. Out-of-range coordinates are ignored.
     */
    void set_pixel(int x, int y, bool on);

    /**
     * @brief XOR a sprite bit onto a pixel.
     *
     * @return true if the pixel was lit and the sprite bit was set
     *         (the pixel got erased), which is a collision
     */
    bool xor_pixel(int x, int y, bool sprite_bit);

    /**
     * @brief Read-only view of the whole grid, row-major.
     */
    const Grid& rows() const { return pixels_; }

    /**
     * @brief Number of lit pixels.
     */
    int lit_count() const;

    /**
     * @brief Check if the display changed since the last clear_dirty().
     */
    bool dirty() const { return dirty_; }
    void clear_dirty() { dirty_ = false; }

    /**
     * @brief Render as text, one line per row.
     */
    std::string to_string(char on = '#', char off = '.') const;

private:
    Grid pixels_;
    bool dirty_ = false;

    static bool in_bounds(int x, int y) {
        return x >= 0 && x < DISPLAY_WIDTH && y >= 0 && y < DISPLAY_HEIGHT;
    }
};

}  // namespace chip8

#endif  // CHIP8_FRAMEBUFFER_HPP
