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

#include "kitty-encoder.h"

#include <catch2/catch.hpp>
#include <string>

#include "rasterm-base64.h"

using namespace rasterm;

namespace {
const char kPreamble[] = "\x1b_Ga=T,f=100,m=1;\x1b\\";

// Collect the base64 payload of all m= chunks.
std::string ExtractPayload(const std::string &data) {
    std::string payload;
    size_t pos = data.find("\x1b_Gm=");
    while (pos != std::string::npos) {
        const size_t start = pos + 7;
        const size_t end   = data.find("\x1b\\", start);
        REQUIRE(end != std::string::npos);
        payload += data.substr(start, end - start);
        pos = data.find("\x1b_Gm=", end);
    }
    return payload;
}

void FillGradient(Framebuffer *fb) {
    for (int y = 0; y < fb->height(); ++y) {
        for (int x = 0; x < fb->width(); ++x) {
            fb->SetPixel(x, y, {(uint8_t)(x * 16), (uint8_t)(y * 16), 0x80,
                                0xff});
        }
    }
}
}  // namespace

TEST_CASE("Kitty encoder transmits PNG", "[kitty]") {
    const TermEnvironment env{};
    KittyEncoder encoder(env, EncodeOptions());
    CHECK(encoder.type() == TermType::kKitty);

    Framebuffer fb(16, 8);
    FillGradient(&fb);
    StringWriter out;
    REQUIRE(encoder.Encode(&out, fb).ok());

    const std::string &data = out.data();
    REQUIRE(data.compare(0, sizeof(kPreamble) - 1, kPreamble) == 0);
    REQUIRE(data.size() > 3);
    CHECK(data.substr(data.size() - 3) == "\x1b\\\n");
    CHECK(data.find("\x1b_Gm=0;") != std::string::npos);

    std::string png;
    REQUIRE(DecodeBase64(ExtractPayload(data), &png));
    CHECK(png.compare(0, 8, "\x89PNG\r\n\x1a\n") == 0);
}

TEST_CASE("Kitty encoder large image uses multiple chunks", "[kitty]") {
    const TermEnvironment env{};
    EncodeOptions options;
    options.png_compression_level = 0;
    KittyEncoder encoder(env, options);

    Framebuffer fb(64, 64);
    FillGradient(&fb);
    StringWriter out;
    REQUIRE(encoder.Encode(&out, fb).ok());
    CHECK(out.data().find("\x1b_Gm=1;") != std::string::npos);
    CHECK(out.data().find("\x1b_Gm=0;") != std::string::npos);
}

TEST_CASE("Kitty encoder can omit trailing newline", "[kitty]") {
    const TermEnvironment env{};
    EncodeOptions options;
    options.no_newline = true;
    KittyEncoder encoder(env, options);

    Framebuffer fb(2, 2);
    StringWriter out;
    REQUIRE(encoder.Encode(&out, fb).ok());
    REQUIRE(out.data().size() > 2);
    CHECK(out.data().substr(out.data().size() - 2) == "\x1b\\");
}

TEST_CASE("Kitty encoder reports invalid image", "[kitty]") {
    const TermEnvironment env{};
    KittyEncoder encoder(env, EncodeOptions());
    Framebuffer fb(0, 0);
    StringWriter out;
    CHECK(encoder.Encode(&out, fb) == ErrorCode::kEncodeError);
    CHECK(out.data().empty());
}

TEST_CASE("Kitty availability from environment", "[kitty]") {
    TermEnvironment env;
    KittyEncoder encoder(env, EncodeOptions());
    CHECK_FALSE(encoder.Available());

    env.term = "xterm-kitty";
    CHECK(encoder.Available());

    env.graphics = "none";
    CHECK_FALSE(encoder.Available());

    env.term     = "xterm";
    env.graphics = "kitty";
    CHECK(encoder.Available());
}
