// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <documentwriter.hpp>
#include <textmeasurer.hpp>

#include <png.h>
#include <zlib.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

#include <jpeglib.h>

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

// Expects the statement to throw the given exception type.
#define CHECK_THROWS(statement, exception_type)                                                    \
    {                                                                                              \
        bool thrown_ = false;                                                                      \
        try {                                                                                      \
            statement;                                                                             \
        } catch(const exception_type &) {                                                          \
            thrown_ = true;                                                                        \
        }                                                                                          \
        CHECK(thrown_);                                                                            \
    }

// Every byte is half an em wide. Makes line breaks easy to predict.
class FixedWidthMeasurer : public TextMeasurer {
public:
    Length text_width(std::string_view utf8_text, Length font_size) const override {
        return font_size * (0.5 * utf8_text.size());
    }
};

// Writes every call down as a line of text. save() returns the log, so
// two writers fed the same calls produce the same bytes.
class RecordingWriter : public DocumentWriter {
public:
    PageHandle add_page(Length w, Length h) override {
        log("add_page " + num(w) + " " + num(h));
        return num_pages++;
    }

    FontHandle embed_font(const std::string &family) override {
        log("embed_font " + family);
        return ++num_fonts;
    }

    ImageHandle embed_image(const EncodedImage &image) override {
        if(fail_embed) {
            throw std::runtime_error("decoder exploded");
        }
        log("embed_image " + std::to_string(image.bytes.size()));
        return ImageHandle{++num_images, 1, 1};
    }

    void draw_text(PageHandle page,
                   FontHandle font,
                   Length x,
                   Length y,
                   Length size,
                   const RgbColor &color,
                   const std::string &text) override {
        (void)color;
        log("draw_text " + std::to_string(page) + " " + std::to_string(font) + " " + num(x) + " " +
            num(y) + " " + num(size) + " " + text);
    }

    void draw_image(
        PageHandle page, const ImageHandle &image, Length x, Length y, Length w, Length h) override {
        log("draw_image " + std::to_string(page) + " " + std::to_string(image.id) + " " + num(x) +
            " " + num(y) + " " + num(w) + " " + num(h));
    }

    std::string save() override {
        if(fail_save) {
            throw std::runtime_error("corrupt object graph");
        }
        log("save");
        std::string bytes;
        for(const auto &e : events) {
            bytes += e;
            bytes += '\n';
        }
        return bytes;
    }

    size_t count(const std::string &prefix) const {
        size_t n = 0;
        for(const auto &e : events) {
            if(e.compare(0, prefix.size(), prefix) == 0) {
                ++n;
            }
        }
        return n;
    }

    std::vector<std::string> events;
    bool fail_save = false;
    bool fail_embed = false;

private:
    void log(std::string s) { events.emplace_back(std::move(s)); }
    static std::string num(Length l) {
        char buf[64];
        snprintf(buf, sizeof(buf), "%.2f", l.pt());
        return buf;
    }

    int32_t num_pages = 0;
    int32_t num_fonts = 0;
    int32_t num_images = 0;
};

inline std::string make_png(uint32_t w, uint32_t h) {
    png_image image;
    memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;
    image.width = w;
    image.height = h;
    image.format = PNG_FORMAT_GRAY;
    std::vector<png_byte> pixels(size_t(w) * h, 128);
    png_alloc_size_t size = 0;
    if(!png_image_write_to_memory(&image, nullptr, &size, 0, pixels.data(), 0, nullptr)) {
        printf("Could not size test PNG: %s\n", image.message);
        std::abort();
    }
    std::string out(size, '\0');
    if(!png_image_write_to_memory(&image, out.data(), &size, 0, pixels.data(), 0, nullptr)) {
        printf("Could not create test PNG: %s\n", image.message);
        std::abort();
    }
    out.resize(size);
    return out;
}

inline std::string make_jpeg(uint32_t w, uint32_t h) {
    jpeg_compress_struct cinfo;
    jpeg_error_mgr jerr;
    cinfo.err = jpeg_std_error(&jerr);
    jpeg_create_compress(&cinfo);
    unsigned char *outbuf = nullptr;
    unsigned long outsize = 0;
    jpeg_mem_dest(&cinfo, &outbuf, &outsize);
    cinfo.image_width = w;
    cinfo.image_height = h;
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, 90, TRUE);
    jpeg_start_compress(&cinfo, TRUE);
    std::vector<JSAMPLE> pixels(size_t(w) * 3, 90);
    while(cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = pixels.data();
        jpeg_write_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_compress(&cinfo);
    std::string out(reinterpret_cast<const char *>(outbuf), outsize);
    jpeg_destroy_compress(&cinfo);
    free(outbuf);
    return out;
}

inline void append_be32(std::string &out, uint32_t v) {
    out += char((v >> 24) & 0xff);
    out += char((v >> 16) & 0xff);
    out += char((v >> 8) & 0xff);
    out += char(v & 0xff);
}

inline void append_png_chunk(std::string &out, const char *type, const std::string &data) {
    append_be32(out, (uint32_t)data.size());
    const std::string body = std::string(type) + data;
    out += body;
    append_be32(
        out, (uint32_t)crc32(0, reinterpret_cast<const Bytef *>(body.data()), (uInt)body.size()));
}

// A well formed PNG whose header claims the given size but which has
// no pixel data at all.
inline std::string make_png_header_only(uint32_t w, uint32_t h) {
    std::string png("\x89PNG\r\n\x1a\n", 8);
    std::string ihdr;
    append_be32(ihdr, w);
    append_be32(ihdr, h);
    ihdr += char(8); // Bit depth.
    ihdr += char(0); // Grayscale.
    ihdr += std::string(3, '\0');
    append_png_chunk(png, "IHDR", ihdr);
    append_png_chunk(png, "IDAT", "");
    append_png_chunk(png, "IEND", "");
    return png;
}
