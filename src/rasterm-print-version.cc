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

#include "rasterm-print-version.h"

#include <libdeflate.h>
#include <sixel.h>

#include <cstdio>

#include "rasterm-jpeg.h"

#ifndef RASTERM_VERSION
#define RASTERM_VERSION "(unknown)"
#endif

namespace rasterm {
const char *rastermVersion() { return RASTERM_VERSION; }

int PrintComponentVersions(FILE *stream) {
    fprintf(stream,
            "rasterm %s\n"
            "This program is free software; license GPL 2.0.\n\n",
            rastermVersion());
    fprintf(stream, "PNG: libdeflate %s\n", LIBDEFLATE_VERSION_STRING);
    fprintf(stream, "JPEG: %s\n", jpeg::VersionInfo());
    fprintf(stream, "Libsixel version %s\n", LIBSIXEL_VERSION);
    fprintf(stream,
            "Kitty and iTerm2 framing, terminal query: rasterm builtin.\n");
    return 0;
}
}  // namespace rasterm
