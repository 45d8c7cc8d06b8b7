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

#ifndef RASTERM_ENCODE_OPTIONS_H
#define RASTERM_ENCODE_OPTIONS_H

#include "rasterm-jpeg.h"

namespace rasterm {
// Options influencing the encoding, chosen on the command-line or
// programmatically.
struct EncodeOptions {
    // Don't emit the newline after an image. Useful if the caller wants to
    // take care of cursor placement themselves.
    bool no_newline = false;

    // Quality used for lossy JPEG transmission with the iTerm protocol.
    int jpeg_quality = jpeg::kDefaultQuality;

    // Compression for lossless PNG transmission. Higher values reduce the
    // amount of data that has to be sent to the terminal (in particular
    // useful when SSH-ed in remotely), at the expense of more CPU time.
    int png_compression_level = 1;
};
}  // namespace rasterm
#endif  // RASTERM_ENCODE_OPTIONS_H
