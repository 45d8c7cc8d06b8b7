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

#include "graphics-framing.h"

#include <algorithm>

#define KITTY_START   "\e_G"
#define KITTY_END     "\e\\"
#define ITERM2_START  "\e]1337;"
#define ITERM2_END    "\a"

namespace rasterm {
std::string FrameKittyTransmission(const std::string &payload,
                                   size_t chunk_size) {
    if (chunk_size == 0) chunk_size = kKittyChunkSize;
    const size_t chunks = std::max<size_t>(
        1, (payload.size() + chunk_size - 1) / chunk_size);

    std::string result;
    result.reserve(payload.size() + (chunks + 1) * 16);
    result.append(KITTY_START "a=T,f=100,m=1;" KITTY_END);

    size_t pos = 0;
    for (size_t i = 0; i < chunks; ++i) {
        const size_t len = std::min(chunk_size, payload.size() - pos);
        const bool more  = (i + 1 < chunks);
        result.append(more ? KITTY_START "m=1;" : KITTY_START "m=0;");
        result.append(payload, pos, len);
        result.append(KITTY_END);
        pos += len;
    }
    return result;
}

std::string FrameITermInlineImage(const std::string &payload) {
    std::string result;
    result.reserve(payload.size() + 32);
    result.append(ITERM2_START "File=inline=1:");
    result.append(payload);
    result.append(ITERM2_END);
    return result;
}
}  // namespace rasterm
