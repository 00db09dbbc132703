// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <textflow.hpp>
#include <utils.hpp>

namespace {

void trim_blank_lines(std::vector<std::string> &lines) {
    while(!lines.empty() && is_blank(lines.back())) {
        lines.pop_back();
    }
    size_t first = 0;
    while(first < lines.size() && is_blank(lines[first])) {
        ++first;
    }
    lines.erase(lines.begin(), lines.begin() + first);
}

} // namespace

TextFlowPlanner::TextFlowPlanner(const LayoutConfig &config_, const TextMeasurer &meas_)
    : config{config_}, meas{meas_} {
    cur.page = 0;
    cur.y = config.top_margin;
}

std::vector<std::string> TextFlowPlanner::wrap(std::string_view logical_line,
                                               Length font_size) const {
    std::vector<std::string> lines;
    std::string current_line;
    for(auto &w : split_to_words(logical_line)) {
        if(current_line.empty()) {
            current_line = std::move(w);
            continue;
        }
        std::string appended = current_line;
        appended += ' ';
        appended += w;
        if(meas.text_width(appended, font_size) > config.max_line_width) {
            lines.emplace_back(std::move(current_line));
            current_line = std::move(w);
        } else {
            current_line = std::move(appended);
        }
    }
    if(!current_line.empty()) {
        lines.emplace_back(std::move(current_line));
    }
    return lines;
}

void TextFlowPlanner::add_text(const std::string &text, const TextStyle &style) {
    if(is_blank(text)) {
        return;
    }
    auto logical_lines = split_to_lines(text);
    trim_blank_lines(logical_lines);
    for(const auto &logical : logical_lines) {
        if(is_blank(logical)) {
            add_blank_line(style.line_height);
            continue;
        }
        for(const auto &line : wrap(logical, style.size)) {
            add_line(line, style, TextAlignment::Left);
        }
    }
}

void TextFlowPlanner::add_line(const std::string &line,
                               const TextStyle &style,
                               TextAlignment alignment) {
    ensure_space(style.line_height);
    const Length x = aligned_x(line, style.size, alignment);
    current_page().commands.emplace_back(
        TextLineCommand{x, cur.y, line, style.size, style.color});
    cur.y -= style.line_height;
    // Only an oversize line can end up here. The next line starts a new
    // page either way.
    if(cur.y < config.bottom_margin) {
        cur.y = config.bottom_margin;
    }
}

void TextFlowPlanner::ensure_space(Length line_height) {
    if(cur.y - line_height >= config.bottom_margin) {
        return;
    }
    // A line taller than the whole text block still has to go
    // somewhere. Put it at the top of a page rather than looping.
    if(cur.y == config.top_margin) {
        return;
    }
    ++cur.page;
    cur.y = config.top_margin;
}

void TextFlowPlanner::add_blank_line(Length line_height) {
    // Whitespace at the bottom of a page is invisible, whitespace at the
    // top of the next one is not. Drop it.
    if(cur.y - line_height < config.bottom_margin) {
        return;
    }
    cur.y -= line_height;
}

PlannedPage &TextFlowPlanner::current_page() {
    while(pages.size() <= cur.page) {
        pages.emplace_back();
    }
    return pages[cur.page];
}

Length TextFlowPlanner::aligned_x(const std::string &line,
                                  Length font_size,
                                  TextAlignment alignment) const {
    if(alignment == TextAlignment::Left) {
        return config.left_margin;
    }
    const Length slack = config.max_line_width - meas.text_width(line, font_size);
    if(slack < Length::zero()) {
        return config.left_margin;
    }
    switch(alignment) {
    case TextAlignment::Left:
        break;
    case TextAlignment::Centered:
        return config.left_margin + slack / 2;
    case TextAlignment::Right:
        return config.left_margin + slack;
    }
    return config.left_margin;
}

TextFlow TextFlowPlanner::finish() { return TextFlow{std::move(pages), cur}; }

TextFlow plan_text(const std::string &text, const LayoutConfig &config, const TextMeasurer &meas) {
    TextFlowPlanner planner(config, meas);
    TextStyle body;
    body.size = config.font_size;
    body.line_height = config.line_height;
    planner.add_text(text, body);
    return planner.finish();
}

size_t count_text_lines(const std::vector<PlannedPage> &pages) {
    size_t num_lines = 0;
    for(const auto &p : pages) {
        for(const auto &c : p.commands) {
            if(std::holds_alternative<TextLineCommand>(c)) {
                ++num_lines;
            }
        }
    }
    return num_lines;
}

size_t count_images(const std::vector<PlannedPage> &pages) {
    size_t num_images = 0;
    for(const auto &p : pages) {
        for(const auto &c : p.commands) {
            if(std::holds_alternative<ImageCommand>(c)) {
                ++num_images;
            }
        }
    }
    return num_images;
}
