// ==============================================================================
// CHIP-8 Framebuffer Implementation
// ==============================================================================

#include "framebuffer.hpp"

namespace chip8 {

Framebuffer::Framebuffer() {
    for (auto& row : pixels_) {
        row.fill(false);
    }
}

void Framebuffer::clear() {
    for (auto& row : pixels_) {
        row.fill(false);
    }
    dirty_ = true;
}

bool Framebuffer::get_pixel(int x, int y) const {
    if (!in_bounds(x, y)) {
        return false;
    }
    return pixels_[y][x];
}

void Framebuffer::set_pixel(int x, int y, bool on) {
    if (!in_bounds(x, y)) {
        return;
    }
    pixels_[y][x] = on;
    dirty_ = true;
}

bool Framebuffer::xor_pixel(int x, int y, bool sprite_bit) {
    if (!in_bounds(x, y) || !sprite_bit) {
        return false;
    }

    bool& pixel = pixels_[y][x];
    bool collision = pixel;
    pixel = !pixel;
    dirty_ = true;
    return collision;
}

int Framebuffer::lit_count() const {
    int count = 0;
    for (const auto& row : pixels_) {
        for (bool pixel : row) {
            if (pixel) count++;
        }
    }
    return count;
}

std::string Framebuffer::to_string(char on, char off) const {
    std::string out;
    out.reserve(static_cast<size_t>((DISPLAY_WIDTH + 1) * DISPLAY_HEIGHT));

    for (const auto& row : pixels_) {
        for (bool pixel : row) {
            out += pixel ? on : off;
        }
        out += '\n';
    }

    return out;
}

}  // namespace chip8
