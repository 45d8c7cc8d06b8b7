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

#include "rasterm-png.h"

#include <arpa/inet.h>
#include <assert.h>
#include <libdeflate.h>
#include <string.h>

#include <memory>

#include "framebuffer.h"

namespace rasterm {
namespace {
// https://w3.org/TR/png/#5PNG-file-signature
constexpr uint8_t kPNGHeader[] = {0x89, 0x50, 0x4E, 0x47,
                                  '\r', '\n', 0x1A, '\n'};

// Writing PNG-style chunks into provided buffer.
// [4 len][4 chunk]<data>[4 CRC]
// https://w3.org/TR/png/#5Chunk-layout
class ChunkWriter {
public:
    explicit ChunkWriter(uint8_t *pos) : start_block_(pos), pos_(pos) {}

    ~ChunkWriter() { assert(finalized_); }

    // Finish last chunk, start new chunk.
    uint8_t *StartNextChunk(const char *chunk_type) {
        if (!finalized_) start_block_ = Finalize();
        assert(strlen(chunk_type) == 4);
        // We fix up the initial 4 bytes later once we know the length.
        memcpy(pos_ + 4, chunk_type, 4);
        pos_ += 8;
        finalized_ = false;
        return pos_;
    }

    // Finish chunk and return position of next write.
    uint8_t *Finalize() {
        assert(!finalized_);
        const uint32_t data_len = pos_ - start_block_ - 8;
        const uint32_t crc =
            libdeflate_crc32(0, start_block_ + 4, data_len + 4);
        const uint32_t crc_bigint = htonl(crc);
        memcpy(pos_, &crc_bigint, 4);
        pos_ += 4;

        // Length. At the very beginning of block.
        const uint32_t bigint_len = htonl(data_len);
        memcpy(start_block_, &bigint_len, 4);

        finalized_ = true;
        return pos_;
    }

    void writeByte(uint8_t value) { *pos_++ = value; }

    void writeInt(uint32_t value) {
        value = htonl(value);
        memcpy(pos_, &value, 4);
        pos_ += 4;
    }

    // Tell how many bytes have been written.
    void updateWritten(size_t written) { pos_ += written; }

private:
    bool finalized_ = true;
    uint8_t *start_block_;  // Where our block started.
    uint8_t *pos_;          // Current write position
};

struct CompressorDeleter {
    void operator()(libdeflate_compressor *c) const {
        libdeflate_free_compressor(c);
    }
};

int BytesPerPixel(png::ColorEncoding encoding) {
    switch (encoding) {
    case png::ColorEncoding::kRGBA_32: return 4;
    case png::ColorEncoding::kRGB_24: return 3;
    case png::ColorEncoding::kPalette_8: return 1;
    }
    return 4;
}

uint8_t PNGColorType(png::ColorEncoding encoding) {
    switch (encoding) {
    case png::ColorEncoding::kRGBA_32: return 6;
    case png::ColorEncoding::kRGB_24: return 2;
    case png::ColorEncoding::kPalette_8: return 3;
    }
    return 6;
}

// Prepare the filtered scanlines: each row starts with the filter type
// followed by the pixel bytes with the 'sub' filter applied.
size_t FilterImageData(const Framebuffer &fb, png::ColorEncoding encoding,
                       uint8_t *out_start) {
    static constexpr uint8_t kFilterType = 0x01;  // simplest substract filter
    const int width  = fb.width();
    const int height = fb.height();
    const int bpp    = BytesPerPixel(encoding);
    uint8_t *out     = out_start;
    for (int y = 0; y < height; ++y) {
        *out++ = kFilterType;
        if (encoding == png::ColorEncoding::kPalette_8) {
            const uint8_t *line = fb.palette_indices().data() + y * width;
            *out++              = line[0];
            for (int i = 1; i < width; ++i) {
                *out++ = line[i] - line[i - 1];
            }
            continue;
        }
        const rgba_t *line = fb.begin() + y * width;
        memcpy(out, line, bpp);  // First pixel
        out += bpp;
        for (int i = 1; i < width; ++i) {
            *out++ = line[i].r - line[i - 1].r;
            *out++ = line[i].g - line[i - 1].g;
            *out++ = line[i].b - line[i - 1].b;
            if (bpp == 4) *out++ = line[i].a - line[i - 1].a;
        }
    }
    return out - out_start;
}

bool HasTransparentPaletteEntry(const Framebuffer &fb) {
    for (const rgba_t &c : fb.palette()) {
        if (c.a != 0xff) return true;
    }
    return false;
}
}  // namespace

namespace png {
ColorEncoding ChooseColorEncoding(const Framebuffer &fb) {
    if (fb.is_paletted()) return ColorEncoding::kPalette_8;
    return fb.IsOpaque() ? ColorEncoding::kRGB_24 : ColorEncoding::kRGBA_32;
}

Status Encode(const Framebuffer &fb, int compression_level, std::string *out) {
    return Encode(fb, compression_level, ChooseColorEncoding(fb), out);
}

Status Encode(const Framebuffer &fb, int compression_level,
              ColorEncoding encoding, std::string *out) {
    const int width  = fb.width();
    const int height = fb.height();
    if (width <= 0 || height <= 0) {
        return Status(ErrorCode::kEncodeError, "png: invalid image size");
    }
    if (encoding == ColorEncoding::kPalette_8 && !fb.is_paletted()) {
        return Status(ErrorCode::kEncodeError, "png: image has no palette");
    }

    const size_t size = UpperBound(width, height);
    std::unique_ptr<uint8_t[]> buffer(new uint8_t[size]);
    uint8_t *pos = buffer.get();
    memcpy(pos, kPNGHeader, sizeof(kPNGHeader));
    pos += sizeof(kPNGHeader);

    ChunkWriter block(pos);

    // Image header
    block.StartNextChunk("IHDR");
    block.writeInt(width);
    block.writeInt(height);
    block.writeByte(8);                        // bit depth
    block.writeByte(PNGColorType(encoding));  // PNG color type
    block.writeByte(0);                        // compression type: deflate()
    block.writeByte(0);                        // filter method.
    block.writeByte(0);                        // interlace. None.

    if (encoding == ColorEncoding::kPalette_8) {
        block.StartNextChunk("PLTE");
        for (const rgba_t &c : fb.palette()) {
            block.writeByte(c.r);
            block.writeByte(c.g);
            block.writeByte(c.b);
        }
        if (HasTransparentPaletteEntry(fb)) {
            block.StartNextChunk("tRNS");
            for (const rgba_t &c : fb.palette()) block.writeByte(c.a);
        }
    }

    const size_t cbuffer_size =
        (size_t)width * height * sizeof(rgba_t) + height;
    std::unique_ptr<uint8_t[]> compress_buffer(new uint8_t[cbuffer_size]);
    const size_t filtered_size =
        FilterImageData(fb, encoding, compress_buffer.get());

    // Write image IDAT data.
    uint8_t *const start_data   = block.StartNextChunk("IDAT");
    const size_t compress_avail = size - (start_data - buffer.get()) - 12;
    std::unique_ptr<libdeflate_compressor, CompressorDeleter> compressor(
        libdeflate_alloc_compressor(compression_level));
    if (!compressor) {
        block.Finalize();
        return Status(ErrorCode::kEncodeError,
                      "png: can't allocate compressor at level " +
                          std::to_string(compression_level));
    }
    const size_t written_size = libdeflate_zlib_compress(
        compressor.get(), compress_buffer.get(), filtered_size,  //
        start_data, compress_avail);
    if (written_size == 0) {
        block.Finalize();
        return Status(ErrorCode::kEncodeError, "png: compression overflow");
    }
    block.updateWritten(written_size);

    block.StartNextChunk("IEND");
    const uint8_t *end = block.Finalize();
    out->assign((const char *)buffer.get(), end - buffer.get());
    return Status();
}

size_t UpperBound(int width, int height) {
    // Header, IHDR, IEND and a maximum sized PLTE + tRNS.
    static constexpr size_t kPNGHeaderOverhead = 128 + 3 * 256 + 256 + 24;
    const size_t image_data_size =
        (size_t)width * height * sizeof(rgba_t) + height * 1 /*filter-per-row*/;
    return libdeflate_zlib_compress_bound(nullptr, image_data_size) +
           kPNGHeaderOverhead;
}
}  // namespace png
}  // namespace rasterm
