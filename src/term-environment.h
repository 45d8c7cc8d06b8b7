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

#ifndef RASTERM_TERM_ENVIRONMENT_H
#define RASTERM_TERM_ENVIRONMENT_H

#include <string>

#include "term-type.h"

namespace rasterm {
// Environment signals that hint at the graphics capabilities of the
// terminal. All values are lowercased; unset variables are empty.
//
// Environment variables can be changed, so guesses from environment
// variables are just that: guesses. Only very specific content is matched.
struct TermEnvironment {
    std::string term;          // $TERM
    std::string term_program;  // $TERM_PROGRAM
    std::string lc_terminal;   // $LC_TERMINAL
    std::string graphics;      // $TERM_GRAPHICS: override; e.g. "none", "kitty"

    // Read the current process environment.
    static TermEnvironment FromEnv();

    // If the TERM_GRAPHICS override names the given type.
    bool GraphicsOverrideIs(TermType type) const;

    // Protocol guesses from the environment, honoring the override.
    bool SuggestsKitty() const;
    bool SuggestsITerm() const;
};

// The process environment, read once on first access and never changed
// afterwards.
const TermEnvironment &ProcessTermEnvironment();

}  // namespace rasterm

#endif  // RASTERM_TERM_ENVIRONMENT_H
