// -*- mode: c++; c-basic-offset: 4; indent-tabs-mode: nil; -*-
// (c) 2016-2024 Henner Zeller <h.zeller@acm.org>
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

#include "term-query.h"

#include <ctype.h>
#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "utils.h"

namespace rasterm {
namespace {
constexpr char kDeviceAttributesQuery[] = "\033[0c";

// "Report Cursor Position (CPR)". We don't care about the answer, this is
// just to get some bytes to stdin so that a pending read() finishes.
// Seems to work for everything except mlterm.
constexpr char kCursorPositionQuery[] = "\033\033[6n";

constexpr size_t kMaxResponseLen = 1024;

bool DebugQuery() {
    static const bool debug = GetBoolenEnv("RASTERM_DEBUG");
    return debug;
}

Status WriteAll(int fd, const char *data, size_t len) {
    while (len) {
        const ssize_t w = write(fd, data, len);
        if (w < 0) {
            if (errno == EINTR) continue;
            return Status::FromErrno("write query", errno);
        }
        data += w;
        len -= w;
    }
    return Status();
}

// Put a terminal into raw mode and restore the original settings exactly
// once, either explicitly with Restore() or latest when going out of scope.
class RawTerminalMode {
public:
    explicit RawTerminalMode(int fd) : fd_(fd) {}
    RawTerminalMode(const RawTerminalMode &) = delete;
    ~RawTerminalMode() { Restore(); }

    Status Enable() {
        if (tcgetattr(fd_, &orig_terminal_setting_) != 0) {
            return Status::FromErrno("tcgetattr", errno);
        }
        struct termios raw = orig_terminal_setting_;
        raw.c_iflag &= ~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR |
                         ICRNL | IXON);
        raw.c_oflag &= ~OPOST;
        raw.c_lflag &= ~(ECHO | ECHONL | ICANON | ISIG | IEXTEN);
        raw.c_cflag &= ~(CSIZE | PARENB);
        raw.c_cflag |= CS8;
        raw.c_cc[VMIN]  = 1;  // Blocking read of at least one byte.
        raw.c_cc[VTIME] = 0;
        if (tcsetattr(fd_, TCSANOW, &raw) != 0) {
            return Status::FromErrno("tcsetattr", errno);
        }
        active_ = true;
        return Status();
    }

    Status Restore() {
        if (!active_) return Status();
        active_ = false;
        if (tcsetattr(fd_, TCSAFLUSH, &orig_terminal_setting_) != 0) {
            return Status::FromErrno("restore terminal", errno);
        }
        return Status();
    }

private:
    const int fd_;
    bool active_ = false;
    struct termios orig_terminal_setting_;
};

// Rendezvous between the reading caller and the timeout helper.
struct ResponseRace {
    std::mutex lock;
    std::condition_variable cv;
    bool read_done = false;
    bool timed_out = false;
};

std::string EscapeForDebug(const std::string &data) {
    std::string result;
    for (const char c : data) {
        if (isprint((unsigned char)c)) {
            result.push_back(c);
            continue;
        }
        char buf[8];
        snprintf(buf, sizeof(buf), "\\x%02x", (unsigned char)c);
        result.append(buf);
    }
    return result;
}
}  // namespace

Status TermRequestResponse(int in_fd, int out_fd, const std::string &query,
                           std::string *response) {
    response->clear();
    if (!isatty(in_fd) || !isatty(out_fd)) {
        return Status(ErrorCode::kNonTTY);
    }

    // Without raw mode, the response bypasses our read and is written
    // directly to the console.
    RawTerminalMode raw_mode(in_fd);
    Status status = raw_mode.Enable();
    if (!status.ok()) return status;

    status = WriteAll(out_fd, query.data(), query.size());
    if (!status.ok()) return status;

    ResponseRace race;
    std::thread timeout_nudge([&race, out_fd]() {
        const auto timeout =
            std::chrono::nanoseconds(kTermResponseTimeout.nanoseconds());
        std::unique_lock<std::mutex> l(race.lock);
        if (race.cv.wait_for(l, timeout, [&race]() { return race.read_done; }))
            return;  // Read finished before we had to do anything.
        race.timed_out = true;
        l.unlock();
        const Status nudged = WriteAll(out_fd, kCursorPositionQuery,
                                       strlen(kCursorPositionQuery));
        if (!nudged.ok() && DebugQuery()) {
            fprintf(stderr, "term-query: nudge failed: %s\n",
                    nudged.message().c_str());
        }
    });

    char buffer[kMaxResponseLen];
    ssize_t n;
    do {
        n = read(in_fd, buffer, sizeof(buffer));
    } while (n < 0 && errno == EINTR);
    const int read_errno = errno;

    bool timed_out;
    {
        std::lock_guard<std::mutex> l(race.lock);
        timed_out = race.timed_out;
        if (!timed_out) race.read_done = true;
    }
    race.cv.notify_all();
    timeout_nudge.join();

    if (timed_out) {
        status = (n > 0) ? Status() : Status(ErrorCode::kTermResponseTimedOut);
    }
    else if (n < 0) {
        status = Status::FromErrno("read response", read_errno);
    }

    // Capture a restore error if there hasn't already been an error.
    const Status restored = raw_mode.Restore();
    if (status.ok() && !restored.ok()) return restored;
    if (!status.ok()) return status;

    if (timed_out) response->assign(buffer, n);
    if (DebugQuery()) {
        fprintf(stderr, "term-query: '%s' -> '%s'%s\n",
                EscapeForDebug(query).c_str(),
                EscapeForDebug(*response).c_str(),
                timed_out ? "" : " (answered before timeout; ignored)");
    }
    return status;
}

std::vector<int> ParseDeviceAttributes(const char *data, size_t len) {
    std::vector<int> result;
    const char *const end = data + len;
    for (const char *pos = data; pos < end; /**/) {
        if (!isdigit((unsigned char)*pos)) {
            ++pos;
            continue;
        }
        int value = 0;
        for (/**/; pos < end && isdigit((unsigned char)*pos); ++pos) {
            value = value * 10 + (*pos - '0');
        }
        result.push_back(value);
    }
    return result;
}

bool HasSixelAttribute(const std::vector<int> &attributes) {
    // Ignore a 4 at index 0: that is the terminal id, not sixel support.
    for (size_t i = 1; i < attributes.size(); ++i) {
        if (attributes[i] == 4) return true;
    }
    return false;
}

Status QueryDeviceAttributes(int in_fd, int out_fd,
                             std::vector<int> *attributes) {
    attributes->clear();
    std::string response;
    const Status status =
        TermRequestResponse(in_fd, out_fd, kDeviceAttributesQuery, &response);
    if (!status.ok()) return status;
    *attributes = ParseDeviceAttributes(response.data(), response.size());
    return status;
}

bool DetectSixelSupport(int in_fd, int out_fd) {
    std::vector<int> attributes;
    const Status status = QueryDeviceAttributes(in_fd, out_fd, &attributes);
    if (!status.ok()) {
        if (DebugQuery()) {
            fprintf(stderr, "term-query: no sixel: %s\n",
                    status.message().c_str());
        }
        return false;
    }
    return HasSixelAttribute(attributes);
}

bool DetectSixelSupport() {
    return DetectSixelSupport(STDIN_FILENO, STDOUT_FILENO);
}

}  // namespace rasterm
