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

#include "rasterm-jpeg.h"

#include <jconfig.h>
#include <turbojpeg.h>

#include <functional>

#include "framebuffer.h"

namespace rasterm {
namespace {
// Scoped clean-up of c objects.
struct ScopeGuard {
    explicit ScopeGuard(const std::function<void()> &f) : f_(f) {}
    ~ScopeGuard() { f_(); }
    std::function<void()> f_;
};
}  // namespace

namespace jpeg {
Status Encode(const Framebuffer &fb, int quality, std::string *out) {
    if (fb.width() <= 0 || fb.height() <= 0) {
        return Status(ErrorCode::kEncodeError, "jpeg: invalid image size");
    }
    if (quality < 1) quality = 1;
    if (quality > 100) quality = 100;

    tjhandle handle = tjInitCompress();
    if (!handle) {
        return Status(ErrorCode::kEncodeError, tjGetErrorStr2(nullptr));
    }
    unsigned char *jpeg_buf = nullptr;
    unsigned long jpeg_size = 0;
    ScopeGuard s([handle, &jpeg_buf]() {  // cleanup C-objects
        tjFree(jpeg_buf);
        tjDestroy(handle);
    });

    // TurboJPEG does not modify the source, the API is just not const.
    unsigned char *const pixels = (unsigned char *)fb.begin();
    if (tjCompress2(handle, pixels, fb.width(), 0 /* pitch: width * bpp */,
                    fb.height(), TJPF_RGBA, &jpeg_buf, &jpeg_size, TJSAMP_420,
                    quality, TJFLAG_FASTDCT) != 0) {
        return Status(ErrorCode::kEncodeError, tjGetErrorStr2(handle));
    }
    out->assign((const char *)jpeg_buf, jpeg_size);
    return Status();
}

const char *VersionInfo() {
#ifdef LIBJPEG_TURBO_VERSION
#define jpeg_xstr(s) jpeg_str(s)
#define jpeg_str(s)  #s
    return "TurboJPEG " jpeg_xstr(LIBJPEG_TURBO_VERSION);
#else
    return "TurboJPEG";
#endif
}
}  // namespace jpeg
}  // namespace rasterm
