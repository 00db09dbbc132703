// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <testcommon.hpp>
#include <capywriter.hpp>
#include <fchelpers.hpp>
#include <hbmeasurer.hpp>
#include <renderdriver.hpp>
#include <reportengine.hpp>
#include <reportsettings.hpp>
#include <utils.hpp>

#include <unistd.h>

#include <cmath>
#include <filesystem>
#include <iterator>
#include <regex>

namespace fs = std::filesystem;

namespace {

const char *test_font = "DejaVu Sans";

fs::path scratch_dir(const char *name) {
    auto dir = fs::temp_directory_path() /
               (std::string("pdftests_") + std::to_string(getpid()) + "_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

bool dir_is_empty(const fs::path &dir) {
    return fs::directory_iterator(dir) == fs::directory_iterator();
}

// Page objects, not the page tree root.
size_t count_pdf_pages(const std::string &pdf) {
    const std::regex page_type("/Type\\s*/Page\\b");
    return std::distance(std::sregex_iterator(pdf.begin(), pdf.end(), page_type),
                         std::sregex_iterator());
}

TextLineCommand body_line(Length y, const std::string &text) {
    return TextLineCommand{
        Length::from_pt(50), y, text, Length::from_pt(12), RgbColor{0.0, 0.0, 0.0}};
}

} // namespace

void test_font_lookup() {
    auto font_file = find_font_file(test_font);
    CHECK(font_file);
    CHECK(fs::exists(*font_file));
}

void test_measurer() {
    HBFontCache fc;
    HBMeasurer meas(fc, test_font, "en");
    const Length size = Length::from_pt(12);
    CHECK(meas.text_width("", size) == Length::zero());
    const Length one = meas.text_width("m", size);
    const Length two = meas.text_width("mm", size);
    const Length three = meas.text_width("mmm", size);
    CHECK(one > Length::zero());
    CHECK(two > one);
    CHECK(three > two);
    CHECK(meas.text_width("mm", size) == two);

    const Length small = meas.text_width("Leaf blight", size);
    const Length large = meas.text_width("Leaf blight", Length::from_pt(24));
    CHECK(std::abs((large - small * 2).pt()) < 1e-6);
}

void test_writer_three_pages() {
    auto dir = scratch_dir("writer");
    const auto settings = default_report_settings();
    const auto &layout = settings.layout;
    const EncodedImage png{make_png(120, 80), ImageFormat::Png};
    const EncodedImage jpeg{make_jpeg(64, 48), ImageFormat::Jpeg};

    PlannedDocument doc;
    doc.page_width = layout.page_width;
    doc.page_height = layout.page_height;
    doc.font_family = test_font;
    doc.pages.resize(3);
    doc.pages[0].commands.emplace_back(body_line(Length::from_pt(750), "Tomato, first page"));
    doc.pages[0].commands.emplace_back(ImageCommand{Length::from_pt(50),
                                                    Length::from_pt(600),
                                                    Length::from_pt(120),
                                                    Length::from_pt(80),
                                                    &png});
    doc.pages[1].commands.emplace_back(body_line(Length::from_pt(750), "Fältet är grönt"));
    doc.pages[2].commands.emplace_back(body_line(Length::from_pt(750), "Last page"));
    doc.pages[2].commands.emplace_back(ImageCommand{Length::from_pt(50),
                                                    Length::from_pt(500),
                                                    Length::from_pt(64),
                                                    Length::from_pt(48),
                                                    &jpeg});
    {
        HBFontCache fc;
        EphemeralStorage storage(dir);
        auto output = storage.create("report_", ".pdf");
        CapyDocumentWriter writer(
            output.path(),
            layout.page_width,
            layout.page_height,
            report_document_properties(layout.page_width, layout.page_height, "Writer test"),
            fc,
            storage);
        RenderDriver driver(writer);
        const auto bytes = driver.render(doc);
        CHECK(driver.pages_created() == 3);
        CHECK(bytes.starts_with("%PDF-"));
        CHECK(count_pdf_pages(bytes) == 3);
        CHECK(bytes == read_file(output.path()));
    }
    CHECK(dir_is_empty(dir));
    fs::remove_all(dir);
}

void test_writer_rejects_mixed_page_sizes() {
    auto dir = scratch_dir("sizes");
    {
        HBFontCache fc;
        EphemeralStorage storage(dir);
        auto output = storage.create("report_", ".pdf");
        const Length w = Length::from_pt(200);
        const Length h = Length::from_pt(300);
        CapyDocumentWriter writer(
            output.path(), w, h, report_document_properties(w, h, "Sizes"), fc, storage);
        CHECK(writer.add_page(w, h) == 0);
        CHECK_THROWS(writer.add_page(h, w), RenderError);
    }
    fs::remove_all(dir);
}

void test_engine_with_pdf_writer() {
    auto dir = scratch_dir("engine");
    const auto settings = default_report_settings();
    {
        HBFontCache fc;
        HBMeasurer meas(fc, test_font, "en");
        EphemeralStorage storage(dir);
        const auto docprop = report_document_properties(
            settings.layout.page_width, settings.layout.page_height, settings.heading.title);
        const auto &layout = settings.layout;
        ReportEngine engine(settings, meas, storage, [&](const fs::path &outfile) {
            return std::unique_ptr<DocumentWriter>(new CapyDocumentWriter(
                outfile, layout.page_width, layout.page_height, docprop, fc, storage));
        });

        // 38 body lines fit under the heading, 41 on later pages.
        ReportRequest req;
        for(int i = 0; i < 100; ++i) {
            req.text += "Line " + std::to_string(i) + ": small brown spots.\n";
        }
        req.image = ReportImage{make_jpeg(64, 48), "image/jpeg"};
        auto outcome = engine.generate(req);
        CHECK(std::holds_alternative<GeneratedReport>(outcome));
        const auto &report = std::get<GeneratedReport>(outcome);
        CHECK(report.num_pages == 3);
        CHECK(report.bytes.starts_with("%PDF-"));
        CHECK(count_pdf_pages(report.bytes) == report.num_pages);
        CHECK(dir_is_empty(dir));

        ReportRequest with_png;
        with_png.text = "A single line.";
        with_png.image = ReportImage{make_png(300, 200), "image/png"};
        auto png_outcome = engine.generate(with_png);
        CHECK(std::holds_alternative<GeneratedReport>(png_outcome));
        CHECK(std::get<GeneratedReport>(png_outcome).num_pages == 1);
        CHECK(dir_is_empty(dir));
    }
    fs::remove_all(dir);
}

int main(int, char **) {
    test_font_lookup();
    test_measurer();
    test_writer_three_pages();
    test_writer_rejects_mixed_page_sizes();
    test_engine_with_pdf_writer();
    return 0;
}
