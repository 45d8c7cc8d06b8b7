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

#include "default-encoder.h"

namespace rasterm {
DefaultEncoder::DefaultEncoder(const std::vector<GraphicsEncoder *> &candidates)
    : candidates_(candidates) {}

void DefaultEncoder::ChooseEncoder() {
    for (GraphicsEncoder *encoder : candidates_) {
        if (encoder && encoder->Available()) {
            chosen_ = encoder;
            return;
        }
    }
    resolve_status_ = Status(ErrorCode::kTermGraphicsNotAvailable);
}

GraphicsEncoder *DefaultEncoder::Resolve(Status *status) {
    std::call_once(resolve_once_, &DefaultEncoder::ChooseEncoder, this);
    if (status) *status = resolve_status_;
    return chosen_;
}

TermType DefaultEncoder::resolved_type() {
    GraphicsEncoder *const encoder = Resolve();
    return encoder ? encoder->type() : TermType::kNone;
}

bool DefaultEncoder::Available() { return Resolve() != nullptr; }

Status DefaultEncoder::Encode(Writer *out, const Framebuffer &fb) {
    Status status;
    GraphicsEncoder *const encoder = Resolve(&status);
    if (!encoder) return status;
    return encoder->Encode(out, fb);
}
}  // namespace rasterm
