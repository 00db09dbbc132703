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

#include <reportsettings.hpp>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::runtime_error bad_type(const char *key, const char *expected) {
    return std::runtime_error(std::string("Element ") + key + " is not " + expected + ".");
}

std::string get_string(const json &data, const char *key, const std::string &fallback) {
    if(!data.contains(key)) {
        return fallback;
    }
    const auto &value = data[key];
    if(!value.is_string()) {
        throw bad_type(key, "a string");
    }
    return value.get<std::string>();
}

double get_double(const json &data, const char *key, double fallback) {
    if(!data.contains(key)) {
        return fallback;
    }
    const auto &value = data[key];
    if(!value.is_number()) {
        throw bad_type(key, "a number");
    }
    return value.get<double>();
}

bool get_bool(const json &data, const char *key, bool fallback) {
    if(!data.contains(key)) {
        return fallback;
    }
    const auto &value = data[key];
    if(!value.is_boolean()) {
        throw bad_type(key, "a boolean");
    }
    return value.get<bool>();
}

Length get_length(const json &data, const char *key, Length fallback) {
    return Length::from_pt(get_double(data, key, fallback.pt()));
}

RgbColor get_color(const json &data, const char *key, const RgbColor &fallback) {
    if(!data.contains(key)) {
        return fallback;
    }
    const auto &arr = data[key];
    if(!arr.is_array() || arr.size() != 3) {
        throw bad_type(key, "an array of three numbers");
    }
    for(const auto &e : arr) {
        if(!e.is_number() || e.get<double>() < 0 || e.get<double>() > 1) {
            throw std::runtime_error(std::string("Color components of ") + key +
                                     " must be numbers between 0 and 1.");
        }
    }
    return RgbColor{arr[0].get<double>(), arr[1].get<double>(), arr[2].get<double>()};
}

const json &get_object(const json &data, const char *key) {
    static const json empty = json::object();
    if(!data.contains(key)) {
        return empty;
    }
    const auto &value = data[key];
    if(!value.is_object()) {
        throw bad_type(key, "an object");
    }
    return value;
}

void load_layout(LayoutConfig &l, const json &data) {
    const auto &page = get_object(data, "page");
    l.page_width = get_length(page, "width", l.page_width);
    l.page_height = get_length(page, "height", l.page_height);

    const auto &margins = get_object(data, "margins");
    l.left_margin = get_length(margins, "left", l.left_margin);
    l.right_margin = get_length(margins, "right", l.right_margin);
    l.top_margin = get_length(margins, "top", l.top_margin);
    l.bottom_margin = get_length(margins, "bottom", l.bottom_margin);

    const auto &text = get_object(data, "text");
    l.font_size = get_length(text, "size", l.font_size);
    l.line_height = get_length(text, "line_height", l.line_height);
    l.max_line_width = get_length(text, "max_line_width", l.max_line_width);

    const auto &image = get_object(data, "image");
    l.image_gap = get_length(image, "gap", l.image_gap);
}

void validate_layout(const LayoutConfig &l) {
    if(l.page_width <= Length::zero() || l.page_height <= Length::zero()) {
        throw std::runtime_error("Page size must be positive.");
    }
    if(l.bottom_margin < Length::zero() || l.top_margin > l.page_height ||
       l.bottom_margin >= l.top_margin) {
        throw std::runtime_error("Top and bottom margins must satisfy 0 <= bottom < top <= "
                                 "page height.");
    }
    if(l.line_height <= Length::zero() || l.font_size <= Length::zero()) {
        throw std::runtime_error("Font size and line height must be positive.");
    }
    if(l.max_line_width <= Length::zero() || l.content_width() <= Length::zero()) {
        throw std::runtime_error("Text block has no width.");
    }
}

void validate_line_height(const char *what, const TextStyle &style, const LayoutConfig &l) {
    if(style.size <= Length::zero() || style.line_height <= Length::zero()) {
        throw std::runtime_error(std::string(what) +
                                 " font size and line height must be positive.");
    }
    if(style.line_height > l.usable_height()) {
        throw std::runtime_error(std::string(what) +
                                 " line height does not fit between the top and bottom margins.");
    }
}

void validate_settings(const ReportSettings &s) {
    validate_layout(s.layout);
    TextStyle body;
    body.size = s.layout.font_size;
    body.line_height = s.layout.line_height;
    validate_line_height("Text", body, s.layout);
    if(s.heading.enabled) {
        validate_line_height("Title", s.heading.title_style, s.layout);
        validate_line_height("Date", s.heading.date_style, s.layout);
    }
}

} // namespace

ReportSettings default_report_settings() {
    ReportSettings s;
    // Title at 800, date at 770 and body text from 750 downwards, as
    // in the original single page layout.
    s.layout.top_margin = Length::from_pt(800);
    s.heading.title_style.size = Length::from_pt(20);
    s.heading.title_style.line_height = Length::from_pt(30);
    s.heading.title_style.color = RgbColor{0.2, 0.4, 0.6};
    s.heading.date_style.size = Length::from_pt(14);
    s.heading.date_style.line_height = Length::from_pt(20);
    return s;
}

ReportSettings load_report_json(const char *path) {
    ReportSettings s = default_report_settings();
    std::filesystem::path json_file(path);
    std::ifstream ifile(path);
    if(ifile.fail()) {
        throw std::runtime_error(std::string("Could not open file ") + path + ".");
    }

    json data = json::parse(ifile);
    if(!data.is_object()) {
        throw std::runtime_error("Top level element of the settings file must be an object.");
    }
    load_layout(s.layout, data);

    const auto &text = get_object(data, "text");
    s.font_family = get_string(text, "font", s.font_family);
    s.text_color = get_color(text, "color", s.text_color);
    s.language = get_string(data, "language", s.language);

    const auto &image = get_object(data, "image");
    s.default_scale = get_double(image, "scale", s.default_scale);
    if(!(s.default_scale > 0)) {
        throw std::runtime_error("Image scale must be positive.");
    }

    const auto &heading = get_object(data, "heading");
    s.heading.enabled = get_bool(heading, "enabled", s.heading.enabled);
    s.heading.title = get_string(heading, "title", s.heading.title);
    s.heading.title_style.size = get_length(heading, "title_size", s.heading.title_style.size);
    s.heading.title_style.line_height =
        get_length(heading, "title_line_height", s.heading.title_style.line_height);
    s.heading.title_style.color = get_color(heading, "title_color", s.heading.title_style.color);
    s.heading.date_style.size = get_length(heading, "date_size", s.heading.date_style.size);
    s.heading.date_style.line_height =
        get_length(heading, "date_line_height", s.heading.date_style.line_height);

    // All paths are relative to the directory of the settings file.
    if(data.contains("storage_dir")) {
        s.storage_dir = json_file.parent_path() / get_string(data, "storage_dir", "");
    }
    validate_settings(s);
    return s;
}
