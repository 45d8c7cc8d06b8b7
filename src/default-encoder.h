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

#ifndef RASTERM_DEFAULT_ENCODER_H
#define RASTERM_DEFAULT_ENCODER_H

#include <mutex>
#include <vector>

#include "graphics-encoder.h"

namespace rasterm {
// Wraps a list of encoders in priority order and delegates to the first one
// that is available.
//
// Which one that is is determined exactly once, on first use, even if called
// concurrently from multiple threads. The result, including the error if
// none is available, is kept for the lifetime of this object.
class DefaultEncoder final : public GraphicsEncoder {
public:
    // Candidates are not owned and need to outlive this object.
    explicit DefaultEncoder(const std::vector<GraphicsEncoder *> &candidates);

    TermType type() const final { return TermType::kDefault; }

    bool Available() final;

    // Returns kTermGraphicsNotAvailable without writing anything if there
    // is no usable encoder.
    Status Encode(Writer *out, const Framebuffer &framebuffer) final;

    // The chosen encoder, or nullptr with "status" (if given) set to the
    // reason.
    GraphicsEncoder *Resolve(Status *status = nullptr);

    // Type of the chosen encoder or kNone if none is available.
    TermType resolved_type();

private:
    void ChooseEncoder();

    const std::vector<GraphicsEncoder *> candidates_;
    std::once_flag resolve_once_;
    GraphicsEncoder *chosen_ = nullptr;
    Status resolve_status_;
};
}  // namespace rasterm

#endif  // RASTERM_DEFAULT_ENCODER_H
