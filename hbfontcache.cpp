// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include "hbfontcache.hpp"
#include "fchelpers.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <stdexcept>

FontInfo HBFontCache::get_font(const std::string &family) {
    auto it = fonts.find(family);
    if(it != fonts.end()) {
        return FontInfo(it->second);
    }
    auto font_file = find_font_file(family);
    if(!font_file) {
        throw std::runtime_error("No font file found for family \"" + family + "\".");
    }
    return add_font_file(family, *font_file);
}

FontInfo HBFontCache::add_font_file(const std::string &family,
                                    const std::filesystem::path &font_file) {
    auto [it, inserted] = fonts.insert_or_assign(family, open_file(font_file));
    (void)inserted;
    return FontInfo(it->second);
}

FontOwner HBFontCache::open_file(const std::filesystem::path &fontfile) {
    hb_blob_t *blob = hb_blob_create_from_file_or_fail(fontfile.string().c_str());
    if(!blob) {
        throw std::runtime_error("HB file open failed: " + fontfile.string());
    }
    hb_face_t *face = hb_face_create(blob, 0);
    hb_blob_destroy(blob);
    if(!face) {
        throw std::runtime_error("HB face creation failed.");
    }
    hb_font_t *font = hb_font_create(face);
    hb_face_destroy(face);
    if(!font) {
        throw std::runtime_error("HB font creation failed.");
    }
    std::unique_ptr<hb_font_t, HBFontCloser> h{font};
    FontOwner result{std::move(h), fontfile, get_em_units(fontfile)};

    return result;
}

uint32_t HBFontCache::get_em_units(const std::filesystem::path &fontfile) {
    // HB does not seem to expose this value to end users, but it
    // is required to make PDF kerning work.
    FT_Library ft;
    FT_Face ftface;
    FT_Error fte;
    fte = FT_Init_FreeType(&ft);
    if(fte != 0) {
        throw std::runtime_error("FreeType initialization failed.");
    }
    fte = FT_New_Face(ft, fontfile.string().c_str(), 0, &ftface);
    if(fte != 0) {
        FT_Done_FreeType(ft);
        throw std::runtime_error("FreeType could not open " + fontfile.string());
    }
    uint32_t units = ftface->units_per_EM;
    FT_Done_Face(ftface);
    FT_Done_FreeType(ft);
    return units;
}
