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

#ifndef RASTERM_PRINT_VERSION_H
#define RASTERM_PRINT_VERSION_H

#include <cstdio>

namespace rasterm {
// Return rasterm version.
const char *rastermVersion();

// Print versions of rasterm and all components to stream. Always return 0.
int PrintComponentVersions(FILE *stream);
}  // namespace rasterm

#endif  // RASTERM_PRINT_VERSION_H
