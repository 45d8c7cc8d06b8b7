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

#include "rasterm.h"

#include "default-encoder.h"
#include "encode-options.h"
#include "iterm2-encoder.h"
#include "kitty-encoder.h"
#include "sixel-encoder.h"
#include "term-environment.h"

namespace rasterm {
namespace {
struct EncoderRegistry {
    EncoderRegistry()
        : kitty(ProcessTermEnvironment(), EncodeOptions()),
          iterm(ProcessTermEnvironment(), EncodeOptions()),
          sixel(ProcessTermEnvironment(), EncodeOptions()),
          default_encoder({&kitty, &iterm, &sixel}) {}

    KittyEncoder kitty;
    ITermEncoder iterm;
    SixelEncoder sixel;
    DefaultEncoder default_encoder;
};

// Never deleted: lives until the process exits.
EncoderRegistry &Registry() {
    static EncoderRegistry *const registry = new EncoderRegistry();
    return *registry;
}
}  // namespace

GraphicsEncoder *EncoderFor(TermType type) {
    switch (type) {
    case TermType::kKitty: return &Registry().kitty;
    case TermType::kITerm: return &Registry().iterm;
    case TermType::kSixel: return &Registry().sixel;
    case TermType::kDefault: return &Registry().default_encoder;
    case TermType::kNone: break;
    }
    return nullptr;
}

bool TermTypeAvailable(TermType type) {
    GraphicsEncoder *const encoder = EncoderFor(type);
    return encoder && encoder->Available();
}

Status EncodeWith(TermType type, Writer *out, const Framebuffer &fb) {
    GraphicsEncoder *const encoder = EncoderFor(type);
    if (!encoder) return Status(ErrorCode::kTermGraphicsNotAvailable);
    return encoder->Encode(out, fb);
}

bool Available() { return TermTypeAvailable(TermType::kDefault); }

Status Encode(Writer *out, const Framebuffer &fb) {
    return EncodeWith(TermType::kDefault, out, fb);
}

TermType ResolvedTermType() {
    return Registry().default_encoder.resolved_type();
}
}  // namespace rasterm
