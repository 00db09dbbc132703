// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <reportcommon.hpp>
#include <textmeasurer.hpp>

#include <string>
#include <string_view>
#include <vector>

struct TextFlow {
    std::vector<PlannedPage> pages;
    LayoutCursor cursor;
};

// Flows lines of text down the page and onto new pages. Pages are
// created lazily, the first one when the first command is added.
class TextFlowPlanner {
public:
    TextFlowPlanner(const LayoutConfig &config, const TextMeasurer &meas);

    // Greedy word wrap. A word wider than the line is put on a line of
    // its own without splitting it.
    std::vector<std::string> wrap(std::string_view logical_line, Length font_size) const;

    void add_text(const std::string &text, const TextStyle &style);

    void add_line(const std::string &line, const TextStyle &style, TextAlignment alignment);

    const LayoutCursor &cursor() const { return cur; }

    TextFlow finish();

private:
    void ensure_space(Length line_height);
    void add_blank_line(Length line_height);
    PlannedPage &current_page();
    Length aligned_x(const std::string &line, Length font_size, TextAlignment alignment) const;

    const LayoutConfig &config;
    const TextMeasurer &meas;
    LayoutCursor cur;
    std::vector<PlannedPage> pages;
};

TextFlow plan_text(const std::string &text, const LayoutConfig &config, const TextMeasurer &meas);

size_t count_text_lines(const std::vector<PlannedPage> &pages);
size_t count_images(const std::vector<PlannedPage> &pages);
