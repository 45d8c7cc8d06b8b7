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

#ifndef RASTERM_GRAPHICS_FRAMING_H
#define RASTERM_GRAPHICS_FRAMING_H

#include <stddef.h>

#include <string>

// Escape sequence framing of already base64 encoded image payloads. These are
// pure functions; the encoders take care of the image encoding and output.

namespace rasterm {
// Maximum payload per chunk the Kitty protocol allows.
static constexpr size_t kKittyChunkSize = 4096;

// Implements the transmission part of
// https://sw.kovidgoyal.net/kitty/graphics-protocol.html
//
// Emits a preamble "\e_Ga=T,f=100,m=1;\e\\" (transmit and display, PNG data,
// more to come) followed by the payload split into chunks of at most
// "chunk_size" bytes, each "\e_Gm=<more>;<data>\e\\". The last chunk has
// m=0. An empty payload still emits a single (empty) final chunk.
std::string FrameKittyTransmission(const std::string &base64_payload,
                                   size_t chunk_size = kKittyChunkSize);

// Implements https://iterm2.com/documentation-images.html
// The whole payload goes into one "\e]1337;File=inline=1:<data>\a" sequence.
std::string FrameITermInlineImage(const std::string &base64_payload);
}  // namespace rasterm

#endif  // RASTERM_GRAPHICS_FRAMING_H
