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

#include "iterm2-encoder.h"

#include "graphics-framing.h"
#include "rasterm-base64.h"
#include "rasterm-jpeg.h"
#include "rasterm-png.h"

namespace rasterm {
ITermEncoder::ITermEncoder(const TermEnvironment &env,
                           const EncodeOptions &opts)
    : env_(env), options_(opts) {}

bool ITermEncoder::Available() { return env_.SuggestsITerm(); }

Status ITermEncoder::Encode(Writer *out, const Framebuffer &fb) {
    std::string image_data;
    const Status encoded =
        fb.is_paletted()
            ? png::Encode(fb, options_.png_compression_level, &image_data)
            : jpeg::Encode(fb, options_.jpeg_quality, &image_data);
    if (!encoded.ok()) return encoded;

    const Status status =
        out->WriteString(FrameITermInlineImage(EncodeBase64(image_data)));
    if (!status.ok() || options_.no_newline) return status;
    return out->Write("\n", 1);
}
}  // namespace rasterm
