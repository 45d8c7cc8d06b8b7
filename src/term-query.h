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

#ifndef RASTERM_TERM_QUERY_H
#define RASTERM_TERM_QUERY_H

#include <stddef.h>

#include <string>
#include <vector>

#include "rasterm-status.h"
#include "rasterm-time.h"

namespace rasterm {
// Time we give the terminal to answer a query before we nudge it with
// a cursor position request.
static constexpr Duration kTermResponseTimeout =
    Duration::Nanos(1000000000 / 16);

// Send "query" to the terminal at "out_fd" and capture up to 1KiB of the
// response from "in_fd", with "in_fd" temporarily put into raw mode.
//
// Both need to be connected to a terminal, otherwise kNonTTY is returned.
//
// If the terminal does not respond within kTermResponseTimeout, a cursor
// position request is sent, just to get _some_ bytes to the input so that
// the blocking read() can finish. A response is only considered if it
// arrived after this timeout fired. A timeout with no data read at all is
// reported as kTermResponseTimedOut. If the read finishes before the
// timeout, the returned "response" is empty.
//
// The original terminal settings are always restored before returning.
// Only one query can be going on in parallel.
Status TermRequestResponse(int in_fd, int out_fd, const std::string &query,
                           std::string *response);

// Extract all decimal numbers found in a device attribute response such
// as "\e[?62;1;4c", in order of appearance. Everything else is ignored.
std::vector<int> ParseDeviceAttributes(const char *data, size_t len);

// The first attribute is the terminal id, all others are feature flags.
// Sixel graphics is announced with 4.
bool HasSixelAttribute(const std::vector<int> &attributes);

// Send a primary device attributes request (CSI 0 c) and parse the response.
//
//   Ps = 1    ⇒  132-columns.
//   Ps = 2    ⇒  Printer.
//   Ps = 3    ⇒  ReGIS graphics.
//   Ps = 4    ⇒  Sixel graphics.
//   Ps = 6    ⇒  Selective erase.
//   ...
// See https://invisible-island.net/xterm/ctlseqs/ctlseqs.html (CSI Ps c)
Status QueryDeviceAttributes(int in_fd, int out_fd,
                             std::vector<int> *attributes);

// Query terminal at stdin/stdout if it supports sixel. Any failure to
// query the terminal is treated as 'not supported'.
bool DetectSixelSupport();
bool DetectSixelSupport(int in_fd, int out_fd);

}  // namespace rasterm

#endif  // RASTERM_TERM_QUERY_H
