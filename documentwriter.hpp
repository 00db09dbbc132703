// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <reportcommon.hpp>

#include <cstdint>
#include <string>

typedef int32_t PageHandle;
typedef int32_t FontHandle;

struct ImageHandle {
    int32_t id;
    uint32_t w;
    uint32_t h;
};

// Lower level document backend. Pages are written in order: drawing
// always goes to the page returned by the most recent add_page call.
// Implementations throw on failure.
class DocumentWriter {
public:
    virtual ~DocumentWriter() = default;

    virtual PageHandle add_page(Length w, Length h) = 0;

    virtual FontHandle embed_font(const std::string &family) = 0;

    virtual ImageHandle embed_image(const EncodedImage &image) = 0;

    virtual void draw_text(PageHandle page,
                           FontHandle font,
                           Length x,
                           Length y,
                           Length size,
                           const RgbColor &color,
                           const std::string &text) = 0;

    virtual void
    draw_image(PageHandle page, const ImageHandle &image, Length x, Length y, Length w, Length h) = 0;

    // Can only be called once.
    virtual std::string save() = 0;
};
