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

#ifndef RASTERM_TERM_TYPE_H
#define RASTERM_TERM_TYPE_H

#include <stdint.h>

#include <string>

#include "rasterm-status.h"

namespace rasterm {
// Terminal graphics protocol.
enum class TermType : uint8_t {
    kNone = 0,  // No graphics.
    kKitty,
    kITerm,
    kSixel,
    kDefault = 0xff,  // Resolve to the first available protocol on first use.
};

// Name of the type: "kitty", "iterm", "sixel", "default"; everything else,
// including out of range values, is "none".
const char *TermTypeName(TermType type);

// Value as used in the TERM_GRAPHICS environment variable. Same as the name,
// but empty for kDefault.
std::string TermTypeEnvValue(TermType type);

// Text serialization. kNone, kKitty, kITerm and kSixel serialize to their
// environment value, kDefault to the empty string. Values outside of the
// known set return kUnknownTermType.
Status MarshalTermType(TermType type, std::string *out);

// Parse text (case-insensitive) as written by MarshalTermType(). The empty
// string is kDefault.
// Note: any unrecognized text is kNone, not an error.
TermType ParseTermType(const std::string &text);

}  // namespace rasterm

#endif  // RASTERM_TERM_TYPE_H
