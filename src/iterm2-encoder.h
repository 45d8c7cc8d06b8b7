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

#ifndef RASTERM_ITERM2_ENCODER_H
#define RASTERM_ITERM2_ENCODER_H

#include "encode-options.h"
#include "graphics-encoder.h"
#include "term-environment.h"

namespace rasterm {
// Implements https://iterm2.com/documentation-images.html
class ITermEncoder final : public GraphicsEncoder {
public:
    ITermEncoder(const TermEnvironment &env, const EncodeOptions &opts);

    TermType type() const final { return TermType::kITerm; }
    bool Available() final;

    // Paletted images are sent losslessly as PNG, everything else as JPEG.
    Status Encode(Writer *out, const Framebuffer &framebuffer) final;

private:
    const TermEnvironment &env_;
    const EncodeOptions options_;
};
}  // namespace rasterm
#endif  // RASTERM_ITERM2_ENCODER_H
