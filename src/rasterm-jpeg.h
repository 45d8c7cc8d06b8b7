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

#ifndef RASTERM_JPEG_H
#define RASTERM_JPEG_H

#include <string>

#include "rasterm-status.h"

namespace rasterm {
class Framebuffer;

namespace jpeg {
static constexpr int kDefaultQuality = 93;

// Encode framebuffer as JPEG with given "quality" (1..100) and store in
// "out". Alpha channel is ignored. Errors are reported with the message
// provided by TurboJPEG.
Status Encode(const Framebuffer &fb, int quality, std::string *out);

const char *VersionInfo();
}  // namespace jpeg
}  // namespace rasterm

#endif  // RASTERM_JPEG_H
