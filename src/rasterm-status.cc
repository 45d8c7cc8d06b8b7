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

#include "rasterm-status.h"

#include <string.h>

namespace rasterm {
const char *ErrorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::kOk: return "ok";
    case ErrorCode::kTermGraphicsNotAvailable:
        return "term graphics not available";
    case ErrorCode::kNonTTY: return "non tty";
    case ErrorCode::kTermResponseTimedOut: return "term response timed out";
    case ErrorCode::kUnknownTermType: return "unknown term type";
    case ErrorCode::kEncodeError: return "encode error";
    case ErrorCode::kIOError: return "i/o error";
    }
    return "unknown error";
}

Status::Status(ErrorCode code) : code_(code), message_(ErrorCodeName(code)) {}

Status::Status(ErrorCode code, const std::string &message)
    : code_(code), message_(message) {}

Status Status::FromErrno(const char *context, int errnum) {
    std::string msg = context;
    msg.append(": ").append(strerror(errnum));
    return Status(ErrorCode::kIOError, msg);
}

}  // namespace rasterm
