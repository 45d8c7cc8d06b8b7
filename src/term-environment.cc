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

#include "term-environment.h"

#include <mutex>

#include "utils.h"

namespace rasterm {
TermEnvironment TermEnvironment::FromEnv() {
    TermEnvironment env;
    env.term         = GetLowercaseEnv("TERM");
    env.term_program = GetLowercaseEnv("TERM_PROGRAM");
    env.lc_terminal  = GetLowercaseEnv("LC_TERMINAL");
    env.graphics     = GetLowercaseEnv("TERM_GRAPHICS");
    return env;
}

bool TermEnvironment::GraphicsOverrideIs(TermType type) const {
    return graphics == TermTypeEnvValue(type);
}

bool TermEnvironment::SuggestsKitty() const {
    if (GraphicsOverrideIs(TermType::kNone)) return false;
    return GraphicsOverrideIs(TermType::kKitty) ||  //
           term == "xterm-kitty" || term == "xterm-ghostty" ||
           term_program == "ghostty";
}

bool TermEnvironment::SuggestsITerm() const {
    if (GraphicsOverrideIs(TermType::kNone)) return false;
    // vscode doesn't provide a way to query the terminal, but can do
    // iterm graphics.
    return GraphicsOverrideIs(TermType::kITerm) ||  //
           term == "mintty" || lc_terminal == "iterm2" ||
           term_program == "wezterm" || term_program == "vscode";
}

const TermEnvironment &ProcessTermEnvironment() {
    static std::once_flag once;
    static TermEnvironment env;
    std::call_once(once, []() { env = TermEnvironment::FromEnv(); });
    return env;
}

}  // namespace rasterm
