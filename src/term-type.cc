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

#include "term-type.h"

#include "utils.h"

namespace rasterm {
namespace {
const struct {
    TermType type;
    const char *name;
} kTermTypeNames[] = {
    {TermType::kKitty, "kitty"},
    {TermType::kITerm, "iterm"},
    {TermType::kSixel, "sixel"},
    {TermType::kDefault, "default"},
};
}  // namespace

const char *TermTypeName(TermType type) {
    for (const auto &entry : kTermTypeNames) {
        if (entry.type == type) return entry.name;
    }
    return "none";
}

std::string TermTypeEnvValue(TermType type) {
    if (type == TermType::kDefault) return "";
    return TermTypeName(type);
}

Status MarshalTermType(TermType type, std::string *out) {
    out->clear();
    switch (type) {
    case TermType::kNone:
    case TermType::kKitty:
    case TermType::kITerm:
    case TermType::kSixel: *out = TermTypeEnvValue(type); return Status();
    case TermType::kDefault: return Status();
    }
    return Status(ErrorCode::kUnknownTermType);
}

TermType ParseTermType(const std::string &text) {
    if (text.empty()) return TermType::kDefault;
    const std::string lower = ToLower(text);
    for (const auto &entry : kTermTypeNames) {
        if (entry.type != TermType::kDefault && lower == entry.name) {
            return entry.type;
        }
    }
    return TermType::kNone;
}

}  // namespace rasterm
