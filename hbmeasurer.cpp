/*
 * Copyright 2025 Jussi Pakkanen
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

#include "hbmeasurer.hpp"

#include <stdexcept>

HBMeasurer::HBMeasurer(HBFontCache &cache, const std::string &family, const char *language)
    : font{cache.get_font(family)} {
    buf = hb_buffer_create();
    if(!hb_buffer_allocation_successful(buf)) {
        hb_buffer_destroy(buf);
        throw std::runtime_error("Could not allocate HarfBuzz buffer.");
    }
    hb_buffer_set_direction(buf, HB_DIRECTION_LTR);
    hb_buffer_set_script(buf, HB_SCRIPT_LATIN);
    hb_buffer_set_language(buf, hb_language_from_string(language, -1));
}

HBMeasurer::~HBMeasurer() { hb_buffer_destroy(buf); }

Length HBMeasurer::text_width(std::string_view utf8_text, Length font_size) const {
    if(utf8_text.empty()) {
        return Length::zero();
    }
    std::string key{utf8_text};
    auto f = unit_widths.find(key);
    if(f != unit_widths.end()) {
        return Length::from_pt(f->second * font_size.pt());
    }
    const Length unit_width = compute_width(utf8_text, Length::from_pt(1));
    unit_widths[std::move(key)] = unit_width.pt();
    return unit_width * font_size.pt();
}

Length HBMeasurer::compute_width(std::string_view utf8_text, Length font_size) const {
    const double hbscale = font_size.pt() * HBFontCache::NUM_STEPS;
    double total_width = 0;
    hb_buffer_clear_contents(buf);
    hb_buffer_add_utf8(buf, utf8_text.data(), (int)utf8_text.size(), 0, -1);
    hb_buffer_guess_segment_properties(buf);

    hb_font_set_scale(font.f, hbscale, hbscale);
    hb_shape(font.f, buf, nullptr, 0);

    unsigned int glyph_count;
    hb_glyph_position_t *glyph_pos = hb_buffer_get_glyph_positions(buf, &glyph_count);
    if(!glyph_pos && glyph_count > 0) {
        throw std::runtime_error("Could not get glyph positions.");
    }

    for(unsigned int i = 0; i < glyph_count; i++) {
        const hb_glyph_position_t *curpos = glyph_pos + i;
        total_width += curpos->x_advance / hbscale;
    }
    return Length::from_pt(total_width * font_size.pt());
}
