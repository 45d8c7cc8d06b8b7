// -*- mode: c++; c-basic-offset: 4; indent-tabs-mode: nil; -*-
// (c) 2016-2024 Henner Zeller <h.zeller@acm.org>
//
// rasterm - show which terminal graphics protocol is usable and emit a
// test pattern with it.
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

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <memory>
#include <string>
#include <vector>

#include "encode-options.h"
#include "framebuffer.h"
#include "iterm2-encoder.h"
#include "kitty-encoder.h"
#include "rasterm-print-version.h"
#include "rasterm-time.h"
#include "rasterm.h"
#include "sixel-encoder.h"
#include "term-environment.h"
#include "term-query.h"
#include "term-type.h"
#include "writer.h"

using rasterm::Framebuffer;
using rasterm::rgba_t;
using rasterm::Status;
using rasterm::TermType;

enum class ExitCode {
    kSuccess              = 0,
    kGraphicsNotAvailable = 1,
    kParameterError       = 2,
};

static int usage(const char *progname, ExitCode exit_code) {
    fprintf(stderr, "usage: %s [options]\n", progname);
    fprintf(stderr,
            "\e[1mOptions\e[0m:\n"
            "\t-p<protocol>   : One of 'kitty', 'iterm', 'sixel'. Default: "
            "auto-detect.\n"
            "\t-g<w>x<h>      : Size of the test pattern in pixels "
            "(default 256x128).\n"
            "\t-P             : Use a paletted test pattern.\n"
            "\t-n             : No newline after the image.\n"
            "\t-q             : Only report the detected protocol, don't "
            "send image.\n"
            "\t-d             : Query and print the device attributes.\n"
            "\t-V, --version  : Print version and exit.\n"
            "\t-h, --help     : Print this help and exit.\n"
            "\n\e[1mEnvironment\e[0m:\n"
            "\tTERM_GRAPHICS  : Force protocol ('kitty', 'iterm', 'sixel') "
            "or 'none'.\n"
            "\tRASTERM_DEBUG  : Print terminal query details to stderr.\n");
    return (int)exit_code;
}

// Horizontal hue gradient, fading out to transparent towards the bottom.
static std::unique_ptr<Framebuffer> CreateTestPattern(int width, int height,
                                                      bool paletted) {
    std::unique_ptr<Framebuffer> result;
    if (paletted) {
        std::vector<rgba_t> palette;
        for (int i = 0; i < 16; ++i) {
            palette.push_back({(uint8_t)(i * 17), (uint8_t)(255 - i * 17),
                               (uint8_t)(i % 2 ? 0xff : 0x40), 0xff});
        }
        result.reset(new Framebuffer(width, height, palette));
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                result->SetPaletteIndex(x, y, ((x * 16 / width) + y / 8) % 16);
            }
        }
        return result;
    }
    result.reset(new Framebuffer(width, height));
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const uint8_t r = x * 255 / width;
            const uint8_t g = y * 255 / height;
            const uint8_t b = 255 - r;
            const uint8_t a = 255 - (y * 128 / height);
            result->SetPixel(x, y, {r, g, b, a});
        }
    }
    return result;
}

static void PrintDeviceAttributes() {
    std::vector<int> attributes;
    const rasterm::Time start;
    const Status status = rasterm::QueryDeviceAttributes(
        STDIN_FILENO, STDOUT_FILENO, &attributes);
    const rasterm::Duration elapsed = rasterm::Time::Now() - start;
    if (!status.ok()) {
        fprintf(stderr, "Device attributes: %s (%lldms)\n",
                status.message().c_str(), (long long)elapsed.milliseconds());
        return;
    }
    fprintf(stderr, "Device attributes:");
    for (int a : attributes) fprintf(stderr, " %d", a);
    fprintf(stderr, " (%lldms); sixel: %s\n", (long long)elapsed.milliseconds(),
            rasterm::HasSixelAttribute(attributes) ? "yes" : "no");
}

int main(int argc, char *argv[]) {
    enum LongOptionIds {
        OPT_VERSION = 1000,
    };

    // clang-format off
    static constexpr struct option long_options[] = {
        {"help",     no_argument,       NULL, 'h'        },
        {"protocol", required_argument, NULL, 'p'        },
        {"version",  no_argument,       NULL, OPT_VERSION},
        {0,          0,                 0,    0          }
    };
    // clang-format on

    TermType requested = TermType::kDefault;
    int width          = 256;
    int height         = 128;
    bool paletted      = false;
    bool query_only    = false;
    bool print_attrs   = false;
    rasterm::EncodeOptions encode_options;

    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, "p:g:PnqdVh", long_options,
                              &option_index)) != -1) {
        switch (opt) {
        case 'p':
            requested = rasterm::ParseTermType(optarg);
            if (requested == TermType::kNone ||
                requested == TermType::kDefault) {
                fprintf(stderr, "Unknown protocol '%s'\n", optarg);
                return usage(argv[0], ExitCode::kParameterError);
            }
            break;
        case 'g':
            if (sscanf(optarg, "%dx%d", &width, &height) != 2 || width <= 0 ||
                height <= 0) {
                fprintf(stderr, "Invalid size spec '%s'\n", optarg);
                return usage(argv[0], ExitCode::kParameterError);
            }
            break;
        case 'P': paletted = true; break;
        case 'n': encode_options.no_newline = true; break;
        case 'q': query_only = true; break;
        case 'd': print_attrs = true; break;
        case 'V':
        case OPT_VERSION: return rasterm::PrintComponentVersions(stdout);
        case 'h': return usage(argv[0], ExitCode::kSuccess);
        default: return usage(argv[0], ExitCode::kParameterError);
        }
    }

    if (print_attrs) PrintDeviceAttributes();

    // Explicitly chosen protocols use our options, the default goes through
    // the process-wide encoders.
    const rasterm::TermEnvironment &env = rasterm::ProcessTermEnvironment();
    std::unique_ptr<rasterm::GraphicsEncoder> explicit_encoder;
    switch (requested) {
    case TermType::kKitty:
        explicit_encoder.reset(new rasterm::KittyEncoder(env, encode_options));
        break;
    case TermType::kITerm:
        explicit_encoder.reset(new rasterm::ITermEncoder(env, encode_options));
        break;
    case TermType::kSixel:
        explicit_encoder.reset(new rasterm::SixelEncoder(env, encode_options));
        break;
    case TermType::kNone:
    case TermType::kDefault: break;
    }

    if (query_only) {
        const bool available = explicit_encoder ? explicit_encoder->Available()
                                                : rasterm::Available();
        const TermType type =
            explicit_encoder ? requested : rasterm::ResolvedTermType();
        printf("%s: %s\n", rasterm::TermTypeName(type),
               available ? "available" : "not available");
        return (int)(available ? ExitCode::kSuccess
                               : ExitCode::kGraphicsNotAvailable);
    }

    std::unique_ptr<Framebuffer> pattern =
        CreateTestPattern(width, height, paletted);
    rasterm::FileDescriptorWriter out(STDOUT_FILENO);
    const Status status = explicit_encoder
                              ? explicit_encoder->Encode(&out, *pattern)
                              : rasterm::Encode(&out, *pattern);
    if (!status.ok()) {
        fprintf(stderr, "%s\n", status.message().c_str());
        return (int)ExitCode::kGraphicsNotAvailable;
    }
    return (int)ExitCode::kSuccess;
}
