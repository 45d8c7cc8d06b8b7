// -*- mode: c++; c-basic-offset: 4; indent-tabs-mode: nil; -*-
// (c) 2021-2024 Henner Zeller <h.zeller@acm.org>
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

#ifndef RASTERM_TIME_H_
#define RASTERM_TIME_H_

#include <stdint.h>
#include <time.h>

// Type-safe representation of time and duration.
// Inspired by golang and absl.

namespace rasterm {
class Duration {
public:
    constexpr Duration(const Duration &other) : duration_(other.duration_) {}

    static constexpr Duration Nanos(int64_t nanos) {
        return Duration(nanos / 1000000000, nanos % 1000000000);
    }

    int64_t nanoseconds() const {
        return (int64_t)duration_.tv_sec * 1000000000 + duration_.tv_nsec;
    }

    int64_t milliseconds() const { return nanoseconds() / 1000000; }

private:
    constexpr Duration(time_t sec, long ns) : duration_({sec, ns}) {}  // NOLINT
    struct timespec duration_;
};

class Time {
public:
    static Time Now() { return Time(); }

    Time() { clock_gettime(CLOCK_MONOTONIC, &time_); }

    inline int64_t nanoseconds() const {
        return (int64_t)time_.tv_sec * 1000000000 + time_.tv_nsec;
    }

    Duration operator-(const Time &other) const {
        return Duration::Nanos(nanoseconds() - other.nanoseconds());
    }

private:
    struct timespec time_;
};

}  // namespace rasterm

#endif  // RASTERM_TIME_H_
