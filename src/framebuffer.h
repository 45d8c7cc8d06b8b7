// -*- mode: c++; c-basic-offset: 4; indent-tabs-mode: nil; -*-
// (c) 2016-2024 Henner Zeller <h.zeller@acm.org>
//
// This program is free software; you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation version 2.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://gnu.org/licenses/gpl-2.0.txt>

#ifndef RASTERM_FRAMEBUFFER_H
#define RASTERM_FRAMEBUFFER_H

#include <stdint.h>

#include <vector>

namespace rasterm {
struct rgba_t {
    uint8_t r, g, b;  // Color components, gamma corrected (non-linear)
    uint8_t a;        // Alpha channel. Linear. [transparent..opaque]=0..255

    inline bool operator==(const rgba_t &o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    inline bool operator!=(const rgba_t &o) const { return !(*this == o); }
};
static_assert(sizeof(rgba_t) == 4, "Unexpected size for rgba_t struct");

// Very simple framebuffer, storing width*height pixels in RGBA format.
//
// A framebuffer created with a palette is an indexed image: every pixel
// refers to one of at most 256 palette entries. The RGBA pixels are kept
// up-to-date, so all consumers can just use begin()/end(); encoders that
// can make use of the palette check is_paletted().
class Framebuffer {
public:
    typedef rgba_t *iterator;
    typedef const rgba_t *const_iterator;

    static constexpr int kMaxPaletteSize = 256;

    Framebuffer() = delete;
    Framebuffer(int width, int height);

    // Create paletted framebuffer. Only the first kMaxPaletteSize entries of
    // "palette" are used. All pixels start out with palette index 0.
    Framebuffer(int width, int height, const std::vector<rgba_t> &palette);

    Framebuffer(const Framebuffer &other) = delete;
    ~Framebuffer();

    // Set a pixel at position X/Y with rgba_t color value. In a paletted
    // framebuffer, the closest palette color is chosen.
    void SetPixel(int x, int y, rgba_t value);

    // Set pixel to given palette index. Only valid for paletted framebuffers.
    void SetPaletteIndex(int x, int y, uint8_t index);

    // Get pixel data at given position.
    rgba_t at(int x, int y) const;

    // Clear to fully transparent black pixels (index 0 if paletted).
    void Clear();

    inline int width() const { return width_; }
    inline int height() const { return height_; }

    bool is_paletted() const { return !palette_.empty(); }
    const std::vector<rgba_t> &palette() const { return palette_; }

    // Palette indices, one byte per pixel, organized like the pixels.
    // Empty if not paletted.
    const std::vector<uint8_t> &palette_indices() const { return indices_; }

    // If all pixels are fully opaque.
    bool IsOpaque() const;

    // The raw internal buffer containing width()*height() pixels organized
    // from top left to bottom right.
    const_iterator begin() const { return pixels_; }
    iterator begin() { return pixels_; }
    const_iterator end() const { return end_; }
    iterator end() { return end_; }

private:
    uint8_t ClosestPaletteIndex(rgba_t value) const;

    const int width_;
    const int height_;
    rgba_t *const pixels_;
    rgba_t *const end_;
    std::vector<rgba_t> palette_;
    std::vector<uint8_t> indices_;
};

}  // namespace rasterm

#endif  // RASTERM_FRAMEBUFFER_H
