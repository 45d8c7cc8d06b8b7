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

#include "sixel-encoder.h"

#include <sixel.h>

#include <memory>
#include <vector>

#include "term-query.h"

namespace rasterm {
namespace {
// Passed to libsixel as private data to the output callback; remembers the
// first write error as the callback can't report it back through libsixel.
struct SixelSink {
    Writer *out;
    Status status;
};

// Char needs to be non-const to be compatible sixel-callback.
int WriteToSink(char *data, int size, void *sink_param) {
    SixelSink *sink = (SixelSink *)sink_param;
    if (!sink->status.ok()) return -1;
    sink->status = sink->out->Write(data, size);
    return sink->status.ok() ? size : -1;
}

struct SixelOutputDeleter {
    void operator()(sixel_output_t *o) const { sixel_output_unref(o); }
};
struct SixelDitherDeleter {
    void operator()(sixel_dither_t *d) const { sixel_dither_unref(d); }
};

Status SixelError(SIXELSTATUS status) {
    return Status(ErrorCode::kEncodeError, sixel_helper_format_error(status));
}
}  // namespace

Status EncodeSixel(const Framebuffer &fb, Writer *out) {
    if (fb.width() <= 0 || fb.height() <= 0) {
        return Status(ErrorCode::kEncodeError, "sixel: invalid image size");
    }
    SixelSink sink = {out, Status()};

    sixel_output_t *raw_output = nullptr;
    SIXELSTATUS status =
        sixel_output_new(&raw_output, WriteToSink, &sink, nullptr);
    if (SIXEL_FAILED(status)) return SixelError(status);
    std::unique_ptr<sixel_output_t, SixelOutputDeleter> output(raw_output);

    const bool paletted = fb.is_paletted();
    sixel_dither_t *raw_dither = nullptr;
    status = sixel_dither_new(&raw_dither,
                              paletted ? (int)fb.palette().size() : 256,
                              nullptr);
    if (SIXEL_FAILED(status)) return SixelError(status);
    std::unique_ptr<sixel_dither_t, SixelDitherDeleter> dither(raw_dither);

    // libsixel wants non-const pixels, though it does not modify them.
    unsigned char *pixels;
    std::vector<unsigned char> palette_rgb;
    if (paletted) {
        // Use the image palette directly, no need to quantize.
        for (const rgba_t &c : fb.palette()) {
            palette_rgb.push_back(c.r);
            palette_rgb.push_back(c.g);
            palette_rgb.push_back(c.b);
        }
        sixel_dither_set_palette(dither.get(), palette_rgb.data());
        sixel_dither_set_pixelformat(dither.get(), SIXEL_PIXELFORMAT_PAL8);
        pixels = const_cast<unsigned char *>(fb.palette_indices().data());
    }
    else {
        pixels = (unsigned char *)fb.begin();
        status = sixel_dither_initialize(
            dither.get(), pixels, fb.width(), fb.height(),
            SIXEL_PIXELFORMAT_RGBA8888, SIXEL_LARGE_LUM,
            SIXEL_REP_AVERAGE_COLORS, SIXEL_QUALITY_AUTO);
        if (SIXEL_FAILED(status)) return SixelError(status);
    }

    status = sixel_encode(pixels, fb.width(), fb.height(), 0, dither.get(),
                          output.get());
    if (!sink.status.ok()) return sink.status;  // Writer errors first.
    if (SIXEL_FAILED(status)) return SixelError(status);
    return Status();
}

SixelEncoder::SixelEncoder(const TermEnvironment &env,
                           const EncodeOptions &opts)
    : SixelEncoder(env, opts, []() { return DetectSixelSupport(); }) {}

SixelEncoder::SixelEncoder(const TermEnvironment &env,
                           const EncodeOptions &opts, const SupportProbe &probe)
    : env_(env), options_(opts), probe_(probe) {}

bool SixelEncoder::Available() {
    if (env_.GraphicsOverrideIs(TermType::kNone)) return false;
    if (env_.GraphicsOverrideIs(TermType::kSixel)) return true;
    return probe_ && probe_();
}

Status SixelEncoder::Encode(Writer *out, const Framebuffer &fb) {
    const Status status = EncodeSixel(fb, out);
    if (!status.ok() || options_.no_newline) return status;
    return out->Write("\n", 1);
}
}  // namespace rasterm
