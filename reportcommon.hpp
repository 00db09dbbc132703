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

#include <units.hpp>

#include <cstdint>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

enum class TextAlignment : int {
    Left,
    Centered,
    Right,
};

enum class ImageFormat : uint8_t {
    Jpeg,
    Png,
};

struct RgbColor {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;

    bool operator==(const RgbColor &o) const noexcept {
        return r == o.r && g == o.g && b == o.b;
    }
};

// Image bytes exactly as they were uploaded. The format comes from the
// mime type that accompanied the upload, never from the bytes.
struct EncodedImage {
    std::string bytes;
    ImageFormat format;
};

struct TextStyle {
    Length size = Length::from_pt(12);
    Length line_height = Length::from_pt(18);
    RgbColor color;
};

// All vertical positions are PDF coordinates, i.e. measured upwards
// from the bottom edge of the page. top_margin is the baseline of the
// first line on a page, bottom_margin is the lowest y any content may
// reach.
struct LayoutConfig {
    Length page_width = Length::from_pt(595.28);
    Length page_height = Length::from_pt(841.89);
    Length left_margin = Length::from_pt(50);
    Length right_margin = Length::from_pt(45.28);
    Length top_margin = Length::from_pt(750);
    Length bottom_margin = Length::from_pt(50);
    Length max_line_width = Length::from_pt(500);
    Length line_height = Length::from_pt(18);
    Length font_size = Length::from_pt(12);
    Length image_gap = Length::from_pt(20);

    Length content_width() const { return page_width - left_margin - right_margin; }
    Length usable_height() const { return top_margin - bottom_margin; }
};

struct LayoutCursor {
    size_t page = 0;
    Length y;

    Length remaining(const LayoutConfig &config) const { return y - config.bottom_margin; }
};

struct TextLineCommand {
    Length x;
    Length y;
    std::string content;
    Length font_size;
    RgbColor color;
};

struct ImageCommand {
    Length x;
    Length y;
    Length width;
    Length height;
    const EncodedImage *image;
};

typedef std::variant<TextLineCommand, ImageCommand> DrawCommand;

struct PlannedPage {
    std::vector<DrawCommand> commands;
};

struct PlannedDocument {
    Length page_width;
    Length page_height;
    std::string font_family;
    std::vector<PlannedPage> pages;
};

struct ImagePlacement {
    size_t page;
    Length x;
    Length y;
    Length width;
    Length height;
};
