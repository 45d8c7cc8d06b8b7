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

#ifndef RASTERM_RASTERM_H
#define RASTERM_RASTERM_H

// Encode images as terminal graphics, supporting Kitty, iTerm and Sixel.
//
// The process-wide encoders use the environment of the process, read on first
// use, and default EncodeOptions. The default encoder picks the first
// available protocol in the order Kitty, iTerm, Sixel; this is determined
// only once per process.

#include "framebuffer.h"
#include "graphics-encoder.h"
#include "rasterm-status.h"
#include "term-type.h"
#include "writer.h"

namespace rasterm {
// Process-wide encoder for the given type; nullptr for kNone or unknown
// values.
GraphicsEncoder *EncoderFor(TermType type);

// If the given type is available on this terminal.
bool TermTypeAvailable(TermType type);

// Encode using the given type. Types without encoder return
// kTermGraphicsNotAvailable.
Status EncodeWith(TermType type, Writer *out, const Framebuffer &framebuffer);

// Same as TermTypeAvailable(TermType::kDefault).
bool Available();

// Same as EncodeWith(TermType::kDefault, ...).
Status Encode(Writer *out, const Framebuffer &framebuffer);

// The protocol the default encoder resolved to, kNone if none available.
TermType ResolvedTermType();
}  // namespace rasterm

#endif  // RASTERM_RASTERM_H
