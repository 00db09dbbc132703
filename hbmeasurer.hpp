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

#pragma once

#include <hbfontcache.hpp>
#include <textmeasurer.hpp>

#include <string>
#include <unordered_map>

// Measures text set in a single font with HarfBuzz shaping, so kerning
// and ligatures are accounted for the same way they are when the text
// is drawn.
class HBMeasurer : public TextMeasurer {
public:
    HBMeasurer(HBFontCache &cache, const std::string &family, const char *language);
    ~HBMeasurer() override;

    HBMeasurer(const HBMeasurer &) = delete;
    HBMeasurer &operator=(const HBMeasurer &) = delete;

    Length text_width(std::string_view utf8_text, Length font_size) const override;

private:
    Length compute_width(std::string_view utf8_text, Length font_size) const;

    FontInfo font;
    hb_buffer_t *buf;
    // Widths at 1pt, scaled linearly to the requested size.
    mutable std::unordered_map<std::string, double> unit_widths;
};
