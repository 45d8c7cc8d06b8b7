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

#ifndef RASTERM_STATUS_H
#define RASTERM_STATUS_H

#include <string>

namespace rasterm {
enum class ErrorCode {
    kOk,
    kTermGraphicsNotAvailable,  // No graphics protocol usable.
    kNonTTY,                    // Query attempted on non-terminal.
    kTermResponseTimedOut,      // Terminal did not answer in time.
    kUnknownTermType,           // TermType outside the known set.
    kEncodeError,               // Pixel codec failed; message from codec.
    kIOError,                   // Writing or terminal setup failed.
};

// Short textual name of the error code, e.g. "non tty".
const char *ErrorCodeName(ErrorCode code);

// Result of an operation: ok, or an error code with a human readable message.
class Status {
public:
    Status() : code_(ErrorCode::kOk) {}

    // Error with the default message of that error code.
    explicit Status(ErrorCode code);
    Status(ErrorCode code, const std::string &message);

    // Create a kIOError from an errno value, prefixed with "context".
    static Status FromErrno(const char *context, int errnum);

    bool ok() const { return code_ == ErrorCode::kOk; }
    ErrorCode code() const { return code_; }
    const std::string &message() const { return message_; }

    bool operator==(ErrorCode code) const { return code_ == code; }
    bool operator!=(ErrorCode code) const { return code_ != code; }

private:
    ErrorCode code_;
    std::string message_;
};

}  // namespace rasterm

#endif  // RASTERM_STATUS_H
