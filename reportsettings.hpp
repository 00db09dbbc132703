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

#include <reportcommon.hpp>

#include <filesystem>
#include <string>

struct HeadingSettings {
    bool enabled = true;
    std::string title = "Plant Analysis Report";
    TextStyle title_style;
    TextStyle date_style;
};

struct ReportSettings {
    LayoutConfig layout;
    HeadingSettings heading;
    std::string font_family = "DejaVu Sans";
    std::string language = "en";
    RgbColor text_color;
    double default_scale = 0.5;
    std::filesystem::path storage_dir = "reports";
};

// The layout of the original single page report, extended with a
// bottom margin so text can flow onto more pages.
ReportSettings default_report_settings();

// Keys missing from the file keep their default values. Throws
// std::runtime_error on malformed input.
ReportSettings load_report_json(const char *path);
