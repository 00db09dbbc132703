// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <testcommon.hpp>
#include <imageformat.hpp>
#include <imageplacement.hpp>
#include <reporterror.hpp>
#include <textflow.hpp>
#include <utils.hpp>

#include <glib.h>

#include <cmath>

namespace {

const FixedWidthMeasurer meas;

// 10pt text is 5pt per byte, so a line holds 20 bytes. A page holds
// seven lines between 750 and 50.
LayoutConfig small_config() {
    LayoutConfig c;
    c.top_margin = Length::from_pt(750);
    c.bottom_margin = Length::from_pt(50);
    c.font_size = Length::from_pt(10);
    c.line_height = Length::from_pt(100);
    c.max_line_width = Length::from_pt(100);
    return c;
}

std::vector<TextLineCommand> all_lines(const std::vector<PlannedPage> &pages) {
    std::vector<TextLineCommand> lines;
    for(const auto &p : pages) {
        for(const auto &c : p.commands) {
            if(const auto *l = std::get_if<TextLineCommand>(&c)) {
                lines.push_back(*l);
            }
        }
    }
    return lines;
}

const TextLineCommand &line_at(const PlannedPage &p, size_t i) {
    return std::get<TextLineCommand>(p.commands.at(i));
}

} // namespace

void test_split_lines() {
    auto lines = split_to_lines("one\r\ntwo  \n\nthree");
    CHECK(lines.size() == 4);
    CHECK(lines[0] == "one");
    CHECK(lines[1] == "two");
    CHECK(lines[2].empty());
    CHECK(lines[3] == "three");

    auto words = split_to_words("  a\tb  c\n");
    CHECK(words.size() == 3);
    CHECK(words[2] == "c");
}

void test_greedy_wrap() {
    const auto config = small_config();
    TextFlowPlanner planner(config, meas);
    auto lines = planner.wrap("aaaa bbbb cccc dddd eeee", config.font_size);
    CHECK(lines.size() == 2);
    CHECK(lines[0] == "aaaa bbbb cccc dddd");
    CHECK(lines[1] == "eeee");
    for(const auto &l : lines) {
        CHECK(meas.text_width(l, config.font_size) <= config.max_line_width);
    }
}

void test_overlong_word() {
    const auto config = small_config();
    TextFlowPlanner planner(config, meas);
    const std::string longword(30, 'x');
    auto lines = planner.wrap("a " + longword + " b", config.font_size);
    CHECK(lines.size() == 3);
    CHECK(lines[0] == "a");
    CHECK(lines[1] == longword);
    CHECK(lines[2] == "b");
}

void test_empty_text() {
    const auto config = small_config();
    for(const char *text : {"", "   ", "\n\n \t\n"}) {
        auto flow = plan_text(text, config, meas);
        CHECK(flow.pages.empty());
        CHECK(flow.cursor.page == 0);
        CHECK(flow.cursor.y == config.top_margin);
    }
}

void test_single_page() {
    const auto config = small_config();
    auto flow = plan_text("first\nsecond", config, meas);
    CHECK(flow.pages.size() == 1);
    CHECK(line_at(flow.pages[0], 0).y == Length::from_pt(750));
    CHECK(line_at(flow.pages[0], 0).x == config.left_margin);
    CHECK(line_at(flow.pages[0], 1).y == Length::from_pt(650));
    CHECK(line_at(flow.pages[0], 1).content == "second");
    CHECK(flow.cursor.page == 0);
    CHECK(flow.cursor.y == Length::from_pt(550));
}

void test_overflow_to_second_page() {
    const auto config = small_config();
    const size_t per_page = (size_t)std::floor(config.usable_height() / config.line_height);
    CHECK(per_page == 7);

    std::string text;
    for(size_t i = 0; i < per_page; ++i) {
        text += "line" + std::to_string(i) + "\n";
    }
    auto exact = plan_text(text, config, meas);
    CHECK(exact.pages.size() == 1);
    CHECK(count_text_lines(exact.pages) == per_page);

    text += "overflow";
    auto flow = plan_text(text, config, meas);
    CHECK(flow.pages.size() == 2);
    CHECK(flow.pages[0].commands.size() == per_page);
    CHECK(flow.pages[1].commands.size() == 1);
    CHECK(line_at(flow.pages[1], 0).content == "overflow");
    CHECK(line_at(flow.pages[1], 0).y == config.top_margin);
    CHECK(flow.cursor.page == 1);
}

void test_pagination_is_complete() {
    auto config = small_config();
    config.line_height = Length::from_pt(18);
    std::string text;
    for(int i = 0; i < 200; ++i) {
        text += "word" + std::to_string(i);
        text += (i % 7 == 0) ? "\n" : " ";
    }
    TextFlowPlanner planner(config, meas);
    size_t expected = 0;
    for(const auto &logical : split_to_lines(text)) {
        expected += planner.wrap(logical, config.font_size).size();
    }

    auto flow = plan_text(text, config, meas);
    CHECK(flow.pages.size() > 1);
    CHECK(count_text_lines(flow.pages) == expected);

    std::string words_out;
    for(const auto &l : all_lines(flow.pages)) {
        for(const auto &w : split_to_words(l.content)) {
            words_out += w + " ";
        }
    }
    std::string words_in;
    for(const auto &w : split_to_words(text)) {
        words_in += w + " ";
    }
    CHECK(words_in == words_out);
}

void test_lines_stay_inside_margins() {
    auto config = small_config();
    config.line_height = Length::from_pt(13);
    std::string text;
    for(int i = 0; i < 500; ++i) {
        text += "lorem ipsum dolor ";
    }
    auto flow = plan_text(text, config, meas);
    CHECK(flow.pages.size() > 2);
    for(const auto &p : flow.pages) {
        CHECK(!p.commands.empty());
        for(const auto &c : p.commands) {
            const auto &l = std::get<TextLineCommand>(c);
            CHECK(l.y <= config.top_margin);
            CHECK(l.y - config.line_height >= config.bottom_margin);
        }
    }
}

void test_blank_lines() {
    const auto config = small_config();
    auto flow = plan_text("\n\na\n\nb\n\n\n", config, meas);
    CHECK(flow.pages.size() == 1);
    CHECK(flow.pages[0].commands.size() == 2);
    CHECK(line_at(flow.pages[0], 0).y == config.top_margin);
    CHECK(line_at(flow.pages[0], 1).y == config.top_margin - config.line_height * 2);
    // Trailing blank lines do not move the cursor.
    CHECK(flow.cursor.y == config.top_margin - config.line_height * 3);
}

void test_blank_line_at_page_end() {
    const auto config = small_config();
    std::string text;
    for(int i = 0; i < 7; ++i) {
        text += "x\n";
    }
    text += "\ny";
    auto flow = plan_text(text, config, meas);
    CHECK(flow.pages.size() == 2);
    CHECK(line_at(flow.pages[1], 0).content == "y");
    CHECK(line_at(flow.pages[1], 0).y == config.top_margin);
}

void test_centered_line() {
    const auto config = small_config();
    TextFlowPlanner planner(config, meas);
    TextStyle style;
    style.size = Length::from_pt(10);
    style.line_height = Length::from_pt(30);
    style.color = RgbColor{0.2, 0.4, 0.6};
    planner.add_line("abcd", style, TextAlignment::Centered);
    planner.add_line("abcd", style, TextAlignment::Right);
    auto flow = planner.finish();
    const auto &centered = line_at(flow.pages[0], 0);
    CHECK(centered.x == config.left_margin + Length::from_pt(40));
    CHECK(centered.color == style.color);
    CHECK(line_at(flow.pages[0], 1).x == config.left_margin + Length::from_pt(80));
    CHECK(flow.cursor.y == config.top_margin - Length::from_pt(60));
}

void test_oversize_line() {
    auto config = small_config();
    TextFlowPlanner planner(config, meas);
    TextStyle huge;
    huge.line_height = Length::from_pt(1000);
    planner.add_line("big", huge, TextAlignment::Left);
    CHECK(planner.cursor().y == config.bottom_margin);
    planner.add_line("after", huge, TextAlignment::Left);
    auto flow = planner.finish();
    CHECK(flow.pages.size() == 2);
    CHECK(line_at(flow.pages[0], 0).y == config.top_margin);
    CHECK(line_at(flow.pages[1], 0).content == "after");
    CHECK(flow.cursor.y >= Length::zero());
}

void test_image_fits_current_page() {
    const auto config = small_config();
    LayoutCursor cursor{0, Length::from_pt(700)};
    auto p = resolve_image_placement(100, 100, 1.0, cursor, config);
    CHECK(p.page == 0);
    CHECK(p.x == config.left_margin);
    CHECK(p.width == Length::from_pt(100));
    CHECK(p.height == Length::from_pt(100));
    CHECK(p.y == Length::from_pt(580));
}

void test_image_moves_to_new_page() {
    const auto config = small_config();
    LayoutCursor cursor{0, config.bottom_margin + Length::from_pt(1)};
    auto p = resolve_image_placement(100, 100, 0.5, cursor, config);
    CHECK(p.page == 1);
    CHECK(p.height == Length::from_pt(50));
    CHECK(p.y == config.top_margin - Length::from_pt(50));
    CHECK(p.y >= config.bottom_margin);
}

void test_image_on_untouched_page() {
    const auto config = small_config();
    // Too tall for the gap, short enough for the page.
    auto flow = plan_text("", config, meas);
    EncodedImage image{"bytes", ImageFormat::Png};
    auto p = resolve_image_placement(100, 690, 1.0, flow.cursor, config);
    CHECK(p.page == 0);
    CHECK(p.y == config.top_margin - Length::from_pt(690));
    CHECK(p.y >= config.bottom_margin);
    append_image(flow.pages, p, &image);
    CHECK(flow.pages.size() == 1);
    CHECK(flow.pages[0].commands.size() == 1);

    // With text above it the same image needs the next page.
    auto text_flow = plan_text("one line", config, meas);
    auto moved = resolve_image_placement(100, 690, 1.0, text_flow.cursor, config);
    CHECK(moved.page == 1);
    CHECK(moved.y == config.top_margin - Length::from_pt(690));
}

void test_image_too_tall() {
    const auto config = small_config();
    LayoutCursor cursor{3, config.top_margin};
    CHECK_THROWS(resolve_image_placement(100, 1500, 1.0, cursor, config), ImageTooTallError);
    CHECK_THROWS(resolve_image_placement(100, 100, 0.0, cursor, config), std::invalid_argument);
    CHECK_THROWS(resolve_image_placement(100, 100, -1.0, cursor, config), std::invalid_argument);
}

void test_image_width_clipped() {
    const auto config = small_config();
    const Length content = config.content_width();
    LayoutCursor cursor{0, config.top_margin};
    auto p = resolve_image_placement(2000, 1000, 1.0, cursor, config);
    CHECK(p.width == content);
    CHECK(std::abs((p.height - content * 0.5).pt()) < 1e-9);
    CHECK(p.page == 0);

    auto scaled = resolve_image_placement(400, 300, 0.5, cursor, config);
    CHECK(scaled.width == Length::from_pt(200));
    CHECK(scaled.height == Length::from_pt(150));
}

void test_append_image() {
    const auto config = small_config();
    auto flow = plan_text("just one line", config, meas);
    EncodedImage image{"bytes", ImageFormat::Png};
    LayoutCursor cursor{0, config.bottom_margin + Length::from_pt(1)};
    auto p = resolve_image_placement(100, 100, 1.0, cursor, config);
    append_image(flow.pages, p, &image);
    CHECK(flow.pages.size() == 2);
    CHECK(count_images(flow.pages) == 1);
    CHECK(count_text_lines(flow.pages) == 1);
    const auto &cmd = std::get<ImageCommand>(flow.pages[1].commands.at(0));
    CHECK(cmd.image == &image);
}

void test_image_formats() {
    CHECK(parse_image_format("image/png") == ImageFormat::Png);
    CHECK(parse_image_format("image/jpeg") == ImageFormat::Jpeg);
    CHECK(parse_image_format("image/jpg") == ImageFormat::Jpeg);
    CHECK(parse_image_format("IMAGE/JPEG") == ImageFormat::Jpeg);
    CHECK_THROWS(parse_image_format("image/gif"), UnsupportedImageFormatError);
    CHECK_THROWS(parse_image_format("image/webp"), UnsupportedImageFormatError);
    CHECK_THROWS(parse_image_format(""), UnsupportedImageFormatError);
    CHECK(std::string(file_extension_of(ImageFormat::Png)) == ".png");
    CHECK(std::string(mime_type_of(ImageFormat::Jpeg)) == "image/jpeg");
}

void test_png_size() {
    EncodedImage image{make_png(40, 30), ImageFormat::Png};
    auto size = read_image_size(image);
    CHECK(size.w == 40);
    CHECK(size.h == 30);
}

void test_jpeg_size() {
    EncodedImage image{make_jpeg(64, 48), ImageFormat::Jpeg};
    auto size = read_image_size(image);
    CHECK(size.w == 64);
    CHECK(size.h == 48);
}

void test_huge_images_rejected() {
    const auto header = make_png_header_only(30000, 30000);
    bool thrown = false;
    try {
        read_image_size(EncodedImage{header, ImageFormat::Png});
    } catch(const ImageDecodeError &e) {
        thrown = true;
        CHECK(std::string(e.what()).find("30000x30000") != std::string::npos);
    }
    CHECK(thrown);
    // Small dimensions get past the size check and fail on the missing
    // pixel data instead.
    CHECK_THROWS(read_image_size(EncodedImage{make_png_header_only(4, 4), ImageFormat::Png}),
                 ImageDecodeError);
}

void test_broken_images() {
    CHECK_THROWS(read_image_size(EncodedImage{"", ImageFormat::Png}), ImageDecodeError);
    CHECK_THROWS(read_image_size(EncodedImage{"not a png at all", ImageFormat::Png}),
                 ImageDecodeError);
    CHECK_THROWS(read_image_size(EncodedImage{"\xff\xd8\xff garbage", ImageFormat::Jpeg}),
                 ImageDecodeError);
    // Right bytes, wrong declared format.
    CHECK_THROWS(read_image_size(EncodedImage{make_png(4, 4), ImageFormat::Jpeg}),
                 ImageDecodeError);
}

void test_data_uri() {
    const auto png = make_png(8, 8);
    gchar *encoded = g_base64_encode(reinterpret_cast<const guchar *>(png.data()), png.size());
    const std::string uri = std::string("data:image/png;base64,") + encoded;
    g_free(encoded);

    auto parsed = parse_data_uri(uri);
    CHECK(parsed.mime_type == "image/png");
    CHECK(parsed.bytes == png);

    CHECK_THROWS(parse_data_uri("image/png;base64,AAAA"), UnsupportedImageFormatError);
    CHECK_THROWS(parse_data_uri("data:image/png,AAAA"), UnsupportedImageFormatError);
}

int main(int, char **) {
    test_split_lines();
    test_greedy_wrap();
    test_overlong_word();
    test_empty_text();
    test_single_page();
    test_overflow_to_second_page();
    test_pagination_is_complete();
    test_lines_stay_inside_margins();
    test_blank_lines();
    test_blank_line_at_page_end();
    test_centered_line();
    test_oversize_line();

    test_image_fits_current_page();
    test_image_moves_to_new_page();
    test_image_on_untouched_page();
    test_image_too_tall();
    test_image_width_clipped();
    test_append_image();

    test_image_formats();
    test_png_size();
    test_jpeg_size();
    test_huge_images_rejected();
    test_broken_images();
    test_data_uri();
    return 0;
}
