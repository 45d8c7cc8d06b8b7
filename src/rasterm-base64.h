// -*- mode: c++; c-basic-offset: 4; indent-tabs-mode: nil; -*-
// (c) 2020-2024 Henner Zeller <h.zeller@acm.org>
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
//
// Header named rasterm-base64.h to avoid potential clashes with headers on
// system.

#ifndef RASTERM_BASE64_H_
#define RASTERM_BASE64_H_

#include <stdint.h>

#include <iterator>
#include <string>

namespace rasterm {
// Encode data as base64.
// input_iterator "begin" yields chars, output_iterator "out" receives chars.
// State of output iterator after end of encoding is returned.
template <typename input_iterator, typename output_iterator>
inline output_iterator EncodeBase64(input_iterator begin, size_t input_len,
                                    output_iterator out) {
    static constexpr char b64[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    for (/**/; input_len >= 3; input_len -= 3) {
        uint8_t b0 = *begin;
        ++begin;
        uint8_t b1 = *begin;
        ++begin;
        uint8_t b2 = *begin;
        ++begin;
        *out++ = b64[(b0 >> 2) & 0x3f];
        *out++ = b64[((b0 & 0x03) << 4) | ((int)(b1 & 0xf0) >> 4)];
        *out++ = b64[((b1 & 0x0f) << 2) | ((int)(b2 & 0xc0) >> 6)];
        *out++ = b64[b2 & 0x3f];
    }
    if (input_len > 0) {
        uint8_t b0 = *begin;
        ++begin;
        uint8_t b1 = input_len > 1 ? *begin : 0;
        *out++     = b64[(b0 >> 2) & 0x3f];
        *out++     = b64[((b0 & 0x03) << 4) | ((int)(b1 & 0xf0) >> 4)];
        *out++     = input_len > 1 ? b64[((b1 & 0x0f) << 2)] : '=';
        *out++     = '=';
    }
    return out;
}

// Length of base64 encoding "input_len" bytes, including padding.
inline size_t Base64EncodedSize(size_t input_len) {
    return (input_len + 2) / 3 * 4;
}

inline std::string EncodeBase64(const std::string &data) {
    std::string result;
    result.reserve(Base64EncodedSize(data.size()));
    EncodeBase64(data.begin(), data.size(), std::back_inserter(result));
    return result;
}

// Decode standard base64 with padding. Returns false on characters outside
// the alphabet or a length that is not a multiple of four.
inline bool DecodeBase64(const std::string &in, std::string *out) {
    auto value = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };
    out->clear();
    if (in.size() % 4 != 0) return false;
    out->reserve(in.size() / 4 * 3);
    for (size_t i = 0; i < in.size(); i += 4) {
        const bool last  = (i + 4 == in.size());
        const int pad    = last ? (in[i + 3] == '=') + (in[i + 2] == '=') : 0;
        uint32_t quantum = 0;
        for (int j = 0; j < 4; ++j) {
            int v = (j >= 4 - pad) ? 0 : value(in[i + j]);
            if (v < 0) return false;
            quantum = (quantum << 6) | v;
        }
        out->push_back((char)((quantum >> 16) & 0xff));
        if (pad < 2) out->push_back((char)((quantum >> 8) & 0xff));
        if (pad < 1) out->push_back((char)(quantum & 0xff));
    }
    return true;
}
}  // namespace rasterm

#endif  // RASTERM_BASE64_H_
