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

#include "framebuffer.h"

#include <assert.h>
#include <stdint.h>
#include <string.h>

#include <algorithm>

namespace rasterm {

Framebuffer::Framebuffer(int w, int h)
    : width_(w < 0 ? 0 : w),
      height_(h < 0 ? 0 : h),
      pixels_(new rgba_t[width_ * height_]),
      end_(pixels_ + width_ * height_) {
    Clear();
}

Framebuffer::Framebuffer(int w, int h, const std::vector<rgba_t> &palette)
    : Framebuffer(w, h) {
    palette_.assign(palette.begin(),
                    palette.size() > kMaxPaletteSize
                        ? palette.begin() + kMaxPaletteSize
                        : palette.end());
    if (palette_.empty()) return;
    indices_.resize(width_ * height_, 0);
    std::fill(pixels_, end_, palette_[0]);
}

Framebuffer::~Framebuffer() { delete[] pixels_; }

void Framebuffer::SetPixel(int x, int y, rgba_t value) {
    if (x < 0 || x >= width() || y < 0 || y >= height()) return;
    if (is_paletted()) {
        SetPaletteIndex(x, y, ClosestPaletteIndex(value));
        return;
    }
    pixels_[width_ * y + x] = value;
}

void Framebuffer::SetPaletteIndex(int x, int y, uint8_t index) {
    assert(is_paletted());
    if (x < 0 || x >= width() || y < 0 || y >= height()) return;
    if (index >= palette_.size()) index = 0;
    indices_[width_ * y + x] = index;
    pixels_[width_ * y + x]  = palette_[index];
}

rgba_t Framebuffer::at(int x, int y) const {
    assert(x >= 0 && x < width() && y >= 0 && y < height());
    return pixels_[width_ * y + x];
}

void Framebuffer::Clear() {
    if (is_paletted()) {
        std::fill(indices_.begin(), indices_.end(), 0);
        std::fill(pixels_, end_, palette_[0]);
        return;
    }
    memset(pixels_, 0, sizeof(*pixels_) * width_ * height_);
}

bool Framebuffer::IsOpaque() const {
    for (const_iterator pos = begin(); pos < end(); ++pos) {
        if (pos->a != 0xff) return false;
    }
    return true;
}

// Plain euclidean distance including alpha, good enough for palette lookup.
uint8_t Framebuffer::ClosestPaletteIndex(rgba_t value) const {
    int best_index    = 0;
    int64_t best_dist = INT64_MAX;
    for (size_t i = 0; i < palette_.size(); ++i) {
        const rgba_t &p    = palette_[i];
        const int dr       = p.r - value.r;
        const int dg       = p.g - value.g;
        const int db       = p.b - value.b;
        const int da       = p.a - value.a;
        const int64_t dist = dr * dr + dg * dg + db * db + da * da;
        if (dist < best_dist) {
            best_dist  = dist;
            best_index = i;
            if (dist == 0) break;
        }
    }
    return best_index;
}

}  // namespace rasterm
