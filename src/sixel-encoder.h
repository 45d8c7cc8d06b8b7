// -*- mode: c++; c-basic-offset: 4; indent-tabs-mode: nil; -*-
// (c) 2023-2024 Henner Zeller <h.zeller@acm.org>
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

#ifndef RASTERM_SIXEL_ENCODER_H
#define RASTERM_SIXEL_ENCODER_H

#include <functional>

#include "encode-options.h"
#include "graphics-encoder.h"
#include "term-environment.h"

namespace rasterm {
// Encode framebuffer as sixel data, including the DCS envelope, and stream it
// to "out". Errors reported by libsixel or the writer are returned.
Status EncodeSixel(const Framebuffer &framebuffer, Writer *out);

// Sixel graphics, https://vt100.net/docs/vt3xx-gp/chapter14.html
//
// Unlike the other protocols, the environment does not tell if sixel is
// supported, so the terminal is asked with a device attribute query.
class SixelEncoder final : public GraphicsEncoder {
public:
    using SupportProbe = std::function<bool()>;

    // Using DetectSixelSupport() on stdin/stdout as probe.
    SixelEncoder(const TermEnvironment &env, const EncodeOptions &opts);
    SixelEncoder(const TermEnvironment &env, const EncodeOptions &opts,
                 const SupportProbe &probe);

    TermType type() const final { return TermType::kSixel; }
    bool Available() final;
    Status Encode(Writer *out, const Framebuffer &framebuffer) final;

private:
    const TermEnvironment &env_;
    const EncodeOptions options_;
    const SupportProbe probe_;
};
}  // namespace rasterm
#endif  // RASTERM_SIXEL_ENCODER_H
