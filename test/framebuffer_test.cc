// -*- mode: c++; c-basic-offset: 4; indent-tabs-mode: nil; -*-
// (c) 2024 Henner Zeller <h.zeller@acm.org>
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

#include <catch2/catch.hpp>
#include <vector>

using namespace rasterm;

TEST_CASE("Framebuffer starts transparent black", "[framebuffer]") {
    Framebuffer fb(3, 2);
    REQUIRE(fb.width() == 3);
    REQUIRE(fb.height() == 2);
    CHECK_FALSE(fb.is_paletted());
    CHECK(fb.palette_indices().empty());
    CHECK(fb.end() - fb.begin() == 6);
    for (const rgba_t &pixel : fb) CHECK(pixel == rgba_t{0, 0, 0, 0});
    CHECK_FALSE(fb.IsOpaque());
}

TEST_CASE("Framebuffer pixel access", "[framebuffer]") {
    Framebuffer fb(4, 4);
    const rgba_t red{0xff, 0, 0, 0xff};
    fb.SetPixel(1, 2, red);
    CHECK(fb.at(1, 2) == red);
    CHECK(fb.begin()[2 * 4 + 1] == red);

    // Outside coordinates are ignored.
    fb.SetPixel(-1, 0, red);
    fb.SetPixel(4, 0, red);
    fb.SetPixel(0, 4, red);
    int red_count = 0;
    for (const rgba_t &pixel : fb) red_count += (pixel == red);
    CHECK(red_count == 1);

    fb.Clear();
    CHECK(fb.at(1, 2) == rgba_t{0, 0, 0, 0});
}

TEST_CASE("Framebuffer opaque detection", "[framebuffer]") {
    Framebuffer fb(2, 2);
    for (rgba_t &pixel : fb) pixel = {10, 20, 30, 0xff};
    CHECK(fb.IsOpaque());
    fb.SetPixel(1, 1, {10, 20, 30, 0xfe});
    CHECK_FALSE(fb.IsOpaque());
}

TEST_CASE("Paletted framebuffer maps to closest color", "[framebuffer]") {
    const std::vector<rgba_t> palette = {
        {0, 0, 0, 0xff}, {0xff, 0, 0, 0xff}, {0, 0, 0xff, 0xff}};
    Framebuffer fb(2, 2, palette);
    REQUIRE(fb.is_paletted());
    REQUIRE(fb.palette().size() == 3);
    REQUIRE(fb.palette_indices().size() == 4);
    CHECK(fb.at(0, 0) == palette[0]);  // index 0 initially.

    fb.SetPixel(1, 0, {0xf0, 0x10, 0x10, 0xff});
    CHECK(fb.palette_indices()[1] == 1);
    CHECK(fb.at(1, 0) == palette[1]);

    fb.SetPaletteIndex(0, 1, 2);
    CHECK(fb.palette_indices()[2] == 2);
    CHECK(fb.at(0, 1) == palette[2]);

    fb.SetPaletteIndex(1, 1, 200);  // Out of palette range.
    CHECK(fb.palette_indices()[3] == 0);

    fb.Clear();
    for (uint8_t index : fb.palette_indices()) CHECK(index == 0);
}

TEST_CASE("Palette is limited to 256 entries", "[framebuffer]") {
    std::vector<rgba_t> palette(300, rgba_t{1, 2, 3, 0xff});
    Framebuffer fb(1, 1, palette);
    CHECK(fb.palette().size() == Framebuffer::kMaxPaletteSize);
}
