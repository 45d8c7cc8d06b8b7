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

#ifndef RASTERM_GRAPHICS_ENCODER_H_
#define RASTERM_GRAPHICS_ENCODER_H_

#include "framebuffer.h"
#include "rasterm-status.h"
#include "term-type.h"
#include "writer.h"

namespace rasterm {

// Encoder that can send a framebuffer as terminal graphics.
class GraphicsEncoder {
public:
    GraphicsEncoder() {}
    GraphicsEncoder(const GraphicsEncoder &) = delete;
    virtual ~GraphicsEncoder() {}

    // Protocol implemented by this encoder.
    virtual TermType type() const = 0;

    // Returns true if the terminal is expected to understand this protocol.
    // Never fails: any problem figuring this out results in false.
    virtual bool Available() = 0;

    // Encode framebuffer and write it to "out". Errors of the codecs and the
    // writer are passed on unchanged.
    virtual Status Encode(Writer *out, const Framebuffer &framebuffer) = 0;
};
}  // namespace rasterm

#endif  // RASTERM_GRAPHICS_ENCODER_H_
