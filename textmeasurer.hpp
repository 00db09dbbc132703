// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <units.hpp>

#include <string_view>

class TextMeasurer {
public:
    virtual ~TextMeasurer() = default;

    // Advance width of a single line of UTF-8 text set in the given size.
    virtual Length text_width(std::string_view utf8_text, Length font_size) const = 0;
};
