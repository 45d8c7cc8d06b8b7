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

#ifndef RASTERM_WRITER_H_
#define RASTERM_WRITER_H_

#include <stddef.h>

#include <string>

#include "rasterm-status.h"

namespace rasterm {
// Destination of encoded terminal graphics. Not synchronized; if used from
// multiple threads, the implementation needs to take care of that.
class Writer {
public:
    virtual ~Writer() {}

    // Write all "len" bytes or return an error.
    virtual Status Write(const char *data, size_t len) = 0;

    Status WriteString(const std::string &str) {
        return Write(str.data(), str.size());
    }
};

// Writes to a file descriptor, e.g. STDOUT_FILENO. Does not own the fd.
class FileDescriptorWriter final : public Writer {
public:
    explicit FileDescriptorWriter(int fd) : fd_(fd) {}

    Status Write(const char *data, size_t len) final;

private:
    const int fd_;
};

// Collects everything written in memory.
class StringWriter final : public Writer {
public:
    Status Write(const char *data, size_t len) final {
        data_.append(data, len);
        return Status();
    }

    const std::string &data() const { return data_; }
    void Clear() { data_.clear(); }

private:
    std::string data_;
};
}  // namespace rasterm

#endif  // RASTERM_WRITER_H_
