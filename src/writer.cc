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

#include "writer.h"

#include <errno.h>
#include <unistd.h>

namespace rasterm {
Status FileDescriptorWriter::Write(const char *buffer, size_t remaining) {
    while (remaining) {
        const ssize_t written = write(fd_, buffer, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            return Status::FromErrno("write", errno);
        }
        remaining -= written;
        buffer += written;
    }
    return Status();
}
}  // namespace rasterm
