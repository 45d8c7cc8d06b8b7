// -*- mode: c++; c-basic-offset: 4; indent-tabs-mode: nil; -*-
// (c) 2021-2024 Henner Zeller <h.zeller@acm.org>
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

#ifndef RASTERM_PNG_H
#define RASTERM_PNG_H

// This implements a simple and fast PNG encoder https://w3.org/TR/png/

#include <stddef.h>

#include <string>

#include "rasterm-status.h"

namespace rasterm {
class Framebuffer;

namespace png {
// The ColorEncoding enum requests if 24Bit RGB, full 32Bit RGBA or 8 bit
// palette indices are encoded.
enum class ColorEncoding {
    kRGBA_32,
    kRGB_24,
    kPalette_8,
};

// Choose the most compact lossless encoding for the framebuffer: palette
// for paletted images, RGB if all pixels are opaque, RGBA otherwise.
ColorEncoding ChooseColorEncoding(const Framebuffer &fb);

// Encode framebuffer as PNG and store the result in "out".
//
// "compression_level" is the libdeflate compression level; 0 means
// essentially plain bytes without compression, 1 and more compresses.
//
// Returns kEncodeError for empty images or if the compressor fails.
Status Encode(const Framebuffer &fb, int compression_level,
              ColorEncoding encoding, std::string *out);

// Same, with ChooseColorEncoding().
Status Encode(const Framebuffer &fb, int compression_level, std::string *out);

// Return estimate of maximum size needed to encode image of given size.
size_t UpperBound(int width, int height);

}  // namespace png
}  // namespace rasterm
#endif  // RASTERM_PNG_H
