/*
 * Copyright 2022 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <documentwriter.hpp>
#include <ephemeralstorage.hpp>
#include <hbfontcache.hpp>

#include <capypdf.hpp>

#include <filesystem>
#include <string>
#include <vector>

// DocumentWriter on top of CapyPDF. Text is shaped with HarfBuzz using
// the same font files that get embedded, so glyph ids match.
class CapyDocumentWriter : public DocumentWriter {
public:
    CapyDocumentWriter(const std::filesystem::path &ofname,
                       Length pagew_,
                       Length pageh_,
                       const capypdf::DocumentProperties &docprop,
                       HBFontCache &fc_,
                       EphemeralStorage &storage_);

    PageHandle add_page(Length w, Length h) override;

    FontHandle embed_font(const std::string &family) override;

    ImageHandle embed_image(const EncodedImage &image) override;

    void draw_text(PageHandle page,
                   FontHandle font,
                   Length x,
                   Length y,
                   Length size,
                   const RgbColor &color,
                   const std::string &text) override;

    void draw_image(
        PageHandle page, const ImageHandle &image, Length x, Length y, Length w, Length h) override;

    std::string save() override;

    int page_num() const { return pages; }

private:
    struct LoadedFont {
        FontInfo info;
        CapyPDF_FontId id;
    };

    void check_page(PageHandle page) const;

    capypdf::Generator capygen;
    capypdf::DrawContext ctx;
    std::filesystem::path outname;
    double pagew, pageh;
    int pages = 0;
    bool saved = false;
    std::vector<LoadedFont> loaded_fonts;
    std::vector<CapyPDF_ImageId> loaded_images;
    HBFontCache &fc;
    EphemeralStorage &storage;
};

capypdf::DocumentProperties report_document_properties(Length pagew,
                                                       Length pageh,
                                                       const std::string &title);
