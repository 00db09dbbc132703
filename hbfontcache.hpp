// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <hb.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>

struct HBFontCloser {
    void operator()(hb_font_t *f) const noexcept { hb_font_destroy(f); }
};

struct HBBufferCloser {
    void operator()(hb_buffer_t *b) const noexcept { hb_buffer_destroy(b); }
};

struct FontOwner {
    std::unique_ptr<hb_font_t, HBFontCloser> handle;
    std::filesystem::path file;
    uint32_t units_per_em;
};

struct FontInfo {
    FontInfo() = default;
    FontInfo(const FontOwner &o) {
        f = o.handle.get();
        fname = &o.file;
        units_per_em = o.units_per_em;
    }
    hb_font_t *f = nullptr;
    const std::filesystem::path *fname = nullptr;
    uint32_t units_per_em = 0;
};

// Fonts are looked up by family name and opened on first use. The
// returned FontInfo points into the cache and stays valid for the
// lifetime of the cache.
class HBFontCache {
public:
    HBFontCache() = default;

    HBFontCache(const HBFontCache &) = delete;
    HBFontCache &operator=(const HBFontCache &) = delete;

    FontInfo get_font(const std::string &family);

    // For fonts that are not installed system wide.
    FontInfo add_font_file(const std::string &family, const std::filesystem::path &font_file);

    static constexpr double NUM_STEPS = 64;

private:
    FontOwner open_file(const std::filesystem::path &font_file);

    uint32_t get_em_units(const std::filesystem::path &fontfile);

    std::unordered_map<std::string, FontOwner> fonts;
};
