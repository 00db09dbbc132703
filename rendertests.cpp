// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <testcommon.hpp>
#include <ephemeralstorage.hpp>
#include <renderdriver.hpp>
#include <reportengine.hpp>
#include <reporterror.hpp>
#include <reportsettings.hpp>
#include <utils.hpp>

#include <glib.h>
#include <unistd.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace {

const FixedWidthMeasurer meas;

fs::path scratch_dir(const char *name) {
    auto dir = fs::temp_directory_path() /
               (std::string("reporttests_") + std::to_string(getpid()) + "_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

bool dir_is_empty(const fs::path &dir) {
    return fs::directory_iterator(dir) == fs::directory_iterator();
}

bool contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}

size_t count_occurrences(const std::string &haystack, const std::string &needle) {
    size_t n = 0;
    for(auto pos = haystack.find(needle); pos != std::string::npos;
        pos = haystack.find(needle, pos + needle.size())) {
        ++n;
    }
    return n;
}

PlannedDocument two_page_document(const EncodedImage *image) {
    PlannedDocument doc;
    doc.page_width = Length::from_pt(100);
    doc.page_height = Length::from_pt(200);
    doc.font_family = "Test Sans";
    doc.pages.resize(2);
    doc.pages[0].commands.emplace_back(TextLineCommand{
        Length::from_pt(10), Length::from_pt(190), "hello", Length::from_pt(12), RgbColor{}});
    doc.pages[1].commands.emplace_back(ImageCommand{Length::from_pt(10),
                                                    Length::from_pt(20),
                                                    Length::from_pt(30),
                                                    Length::from_pt(40),
                                                    image});
    doc.pages[1].commands.emplace_back(TextLineCommand{
        Length::from_pt(10), Length::from_pt(170), "bye", Length::from_pt(12), RgbColor{}});
    return doc;
}

ReportSettings plain_settings() {
    auto s = default_report_settings();
    s.heading.enabled = false;
    return s;
}

// Counts how many writers the engine asked for.
struct EngineFixture {
    explicit EngineFixture(const char *name, ReportSettings s = plain_settings())
        : settings{std::move(s)}, dir{scratch_dir(name)}, storage{dir},
          engine{settings, meas, storage, [this](const fs::path &) {
                     ++writers_created;
                     auto w = std::make_unique<RecordingWriter>();
                     w->fail_save = fail_save;
                     return std::unique_ptr<DocumentWriter>(std::move(w));
                 }} {}

    ~EngineFixture() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    ReportSettings settings;
    fs::path dir;
    EphemeralStorage storage;
    ReportEngine engine;
    int writers_created = 0;
    bool fail_save = false;
};

ReportErrorKind failure_kind(const ReportOutcome &outcome) {
    const auto *failure = std::get_if<ReportFailure>(&outcome);
    if(!failure) {
        printf("Expected a failure, got a report.\n");
        std::abort();
    }
    return failure->kind;
}

GeneratedReport success(const ReportOutcome &outcome) {
    if(const auto *failure = std::get_if<ReportFailure>(&outcome)) {
        printf("Expected a report, got %s: %s\n",
               error_kind_name(failure->kind),
               failure->message.c_str());
        std::abort();
    }
    return std::get<GeneratedReport>(outcome);
}

ReportRequest image_request(const std::string &text, std::string bytes, const char *mime) {
    ReportRequest req;
    req.text = text;
    req.image = ReportImage{std::move(bytes), mime};
    return req;
}

} // namespace

void test_driver_call_order() {
    EncodedImage image{"12345", ImageFormat::Png};
    auto doc = two_page_document(&image);
    RecordingWriter w;
    RenderDriver driver(w);
    CHECK(driver.state() == RenderState::Empty);
    driver.render(doc);
    CHECK(driver.state() == RenderState::Serialized);
    CHECK(driver.pages_created() == 2);

    const std::vector<std::string> expected{
        "embed_image 5",
        "embed_font Test Sans",
        "add_page 100.00 200.00",
        "draw_text 0 1 10.00 190.00 12.00 hello",
        "add_page 100.00 200.00",
        "draw_image 1 1 10.00 20.00 30.00 40.00",
        "draw_text 1 1 10.00 170.00 12.00 bye",
        "save",
    };
    CHECK(w.events == expected);
}

void test_driver_embeds_shared_image_once() {
    EncodedImage image{"12345", ImageFormat::Jpeg};
    auto doc = two_page_document(&image);
    doc.pages[0].commands.emplace_back(ImageCommand{Length::from_pt(1),
                                                    Length::from_pt(2),
                                                    Length::from_pt(3),
                                                    Length::from_pt(4),
                                                    &image});
    RecordingWriter w;
    RenderDriver driver(w);
    driver.render(doc);
    CHECK(w.count("embed_image") == 1);
    CHECK(w.count("embed_font") == 1);
    CHECK(w.count("draw_image") == 2);
}

void test_driver_renders_once() {
    EncodedImage image{"12345", ImageFormat::Png};
    auto doc = two_page_document(&image);
    RecordingWriter w;
    RenderDriver driver(w);
    driver.render(doc);
    CHECK_THROWS(driver.render(doc), RenderError);
    CHECK(w.count("save") == 1);
}

void test_driver_rejects_empty_document() {
    PlannedDocument doc;
    doc.page_width = Length::from_pt(100);
    doc.page_height = Length::from_pt(100);
    RecordingWriter w;
    RenderDriver driver(w);
    CHECK_THROWS(driver.render(doc), RenderError);
    CHECK(w.events.empty());
}

void test_driver_failures() {
    EncodedImage image{"12345", ImageFormat::Png};
    auto doc = two_page_document(&image);
    {
        RecordingWriter w;
        w.fail_save = true;
        RenderDriver driver(w);
        CHECK_THROWS(driver.render(doc), RenderError);
        CHECK(driver.state() != RenderState::Serialized);
    }
    {
        RecordingWriter w;
        w.fail_embed = true;
        RenderDriver driver(w);
        CHECK_THROWS(driver.render(doc), RenderError);
        CHECK(w.count("add_page") == 0);
        CHECK(w.count("draw_") == 0);
    }
}

void test_render_is_deterministic() {
    EncodedImage image{"12345", ImageFormat::Png};
    auto doc = two_page_document(&image);
    RecordingWriter w1;
    RecordingWriter w2;
    const auto b1 = RenderDriver(w1).render(doc);
    const auto b2 = RenderDriver(w2).render(doc);
    CHECK(!b1.empty());
    CHECK(b1 == b2);
}

void test_engine_text_only() {
    EngineFixture f("text_only");
    ReportRequest req;
    req.text = "hello\nworld";
    const auto &report = success(f.engine.generate(req));
    CHECK(f.writers_created == 1);
    CHECK(report.num_pages == 1);
    CHECK(report.filename.starts_with("plant_analysis_report_"));
    CHECK(report.filename.ends_with(".pdf"));
    CHECK(contains(report.bytes, "draw_text 0 1 50.00 800.00 12.00 hello\n"));
    CHECK(contains(report.bytes, "draw_text 0 1 50.00 782.00 12.00 world\n"));
    CHECK(dir_is_empty(f.dir));
}

void test_engine_heading() {
    EngineFixture f("heading", default_report_settings());
    ReportRequest req;
    req.text = "hello";
    const auto &report = success(f.engine.generate(req));
    // 21 characters at 20pt are 210pt wide, centered in 500pt.
    CHECK(contains(report.bytes, "draw_text 0 1 195.00 800.00 20.00 Plant Analysis Report\n"));
    CHECK(contains(report.bytes, "draw_text 0 1 50.00 770.00 14.00 Date: " + current_date()));
    CHECK(contains(report.bytes, "draw_text 0 1 50.00 750.00 12.00 hello\n"));
}

void test_engine_many_pages() {
    EngineFixture f("many_pages");
    ReportRequest req;
    for(int i = 0; i < 100; ++i) {
        req.text += "Leaf " + std::to_string(i) + " shows no sign of disease.\n";
    }
    const auto &report = success(f.engine.generate(req));
    // 750pt of text block at 18pt per line is 41 lines per page.
    CHECK(report.num_pages == 3);
    CHECK(count_occurrences(report.bytes, "add_page ") == 3);
    CHECK(contains(report.bytes, "draw_text 2 1 50.00 800.00 12.00 Leaf 82 "));
}

void test_engine_scaled_png() {
    EngineFixture f("scaled_png");
    auto req = image_request("A healthy tomato plant.", make_png(400, 300), "image/png");
    const auto &report = success(f.engine.generate(req));
    CHECK(report.num_pages == 1);
    CHECK(contains(report.bytes, "embed_image "));
    // One line of text, then the gap, then the image.
    CHECK(contains(report.bytes, "draw_image 0 1 50.00 612.00 200.00 150.00\n"));
    CHECK(dir_is_empty(f.dir));

    req.scale = 1.0;
    const auto &full = success(f.engine.generate(req));
    CHECK(contains(full.bytes, "draw_image 0 1 50.00 462.00 400.00 300.00\n"));

    req.scale = -2.0;
    const auto &fallback = success(f.engine.generate(req));
    CHECK(contains(fallback.bytes, " 200.00 150.00\n"));
}

void test_engine_image_only() {
    EngineFixture f("image_only");
    auto req = image_request("  \n", make_png(40, 40), "image/PNG");
    const auto &report = success(f.engine.generate(req));
    CHECK(report.num_pages == 1);
    CHECK(contains(report.bytes, "draw_image 0 1 50.00 760.00 20.00 20.00\n"));
    CHECK(!contains(report.bytes, "draw_text"));
}

void test_engine_tall_image_without_text() {
    EngineFixture f("tall_image");
    // 1480 * 0.5 = 740pt fits in the 750pt text block but not with the
    // gap below it.
    auto req = image_request("", make_png(200, 1480), "image/png");
    const auto &report = success(f.engine.generate(req));
    CHECK(report.num_pages == 1);
    CHECK(count_occurrences(report.bytes, "add_page ") == 1);
    CHECK(contains(report.bytes, "draw_image 0 1 50.00 60.00 100.00 740.00\n"));
}

void test_engine_data_uri() {
    EngineFixture f("data_uri");
    const auto png = make_png(10, 10);
    gchar *encoded = g_base64_encode(reinterpret_cast<const guchar *>(png.data()), png.size());
    auto req = image_request("text", std::string("data:image/png;base64,") + encoded, "");
    g_free(encoded);
    const auto &report = success(f.engine.generate(req));
    CHECK(contains(report.bytes, "embed_image " + std::to_string(png.size()) + "\n"));

    auto gif = image_request("text", "data:image/gif;base64,R0lGODlh", "");
    CHECK(failure_kind(f.engine.generate(gif)) == ReportErrorKind::UnsupportedImageFormat);
}

void test_engine_rejects_before_writing() {
    EngineFixture f("rejects");

    ReportRequest empty;
    empty.text = " \n\t";
    CHECK(failure_kind(f.engine.generate(empty)) == ReportErrorKind::EmptyInput);

    auto gif = image_request("text", "GIF89a", "image/gif");
    CHECK(failure_kind(f.engine.generate(gif)) == ReportErrorKind::UnsupportedImageFormat);

    auto broken_png = image_request("text", "not a png", "image/png");
    CHECK(failure_kind(f.engine.generate(broken_png)) == ReportErrorKind::ImageDecode);

    auto broken_jpeg = image_request("text", "\xff\xd8\xff\xe0 garbage", "image/jpeg");
    CHECK(failure_kind(f.engine.generate(broken_jpeg)) == ReportErrorKind::ImageDecode);

    auto tall = image_request("text", make_png(10, 3000), "image/png");
    tall.scale = 1.0;
    CHECK(failure_kind(f.engine.generate(tall)) == ReportErrorKind::ImageTooTall);

    CHECK(f.writers_created == 0);
    CHECK(dir_is_empty(f.dir));
}

void test_engine_render_failure() {
    EngineFixture f("render_failure");
    f.fail_save = true;
    ReportRequest req;
    req.text = "hello";
    CHECK(failure_kind(f.engine.generate(req)) == ReportErrorKind::Render);
    CHECK(f.writers_created == 1);
    CHECK(dir_is_empty(f.dir));

    f.fail_save = false;
    success(f.engine.generate(req));
}

void test_scoped_temp_file() {
    auto dir = scratch_dir("tempfile");
    EphemeralStorage storage(dir);
    fs::path first;
    {
        auto f1 = storage.create("img_", ".png");
        auto f2 = storage.create("img_", ".png");
        first = f1.path();
        CHECK(f1.path() != f2.path());
        CHECK(f1.path().extension() == ".png");
        CHECK(f1.path().parent_path() == dir);
        f1.write("payload");
        CHECK(f1.read() == "payload");

        ScopedTempFile moved(std::move(f1));
        CHECK(f1.path().empty());
        CHECK(fs::exists(moved.path()));

        f2.remove();
        CHECK(f2.path().empty());
    }
    CHECK(!fs::exists(first));
    CHECK(dir_is_empty(dir));

    auto blocker = dir / "plainfile";
    write_file(blocker, "x");
    CHECK_THROWS(EphemeralStorage bad(blocker / "sub"), StorageError);
    fs::remove_all(dir);
}

void test_settings_json() {
    auto dir = scratch_dir("settings");
    auto json_file = dir / "report.json";
    write_file(json_file, R"({
  "page": {"width": 612, "height": 792},
  "margins": {"left": 72, "right": 72, "top": 720, "bottom": 72},
  "text": {"font": "Liberation Serif", "size": 11, "line_height": 15, "color": [0.1, 0.1, 0.1]},
  "image": {"gap": 10, "scale": 0.25},
  "heading": {"enabled": false, "title": "Leaf report"},
  "storage_dir": "tmp"
})");
    const auto s = load_report_json(json_file.c_str());
    CHECK(s.layout.page_width == Length::from_pt(612));
    CHECK(s.layout.top_margin == Length::from_pt(720));
    CHECK(s.layout.line_height == Length::from_pt(15));
    CHECK(s.layout.image_gap == Length::from_pt(10));
    CHECK(s.font_family == "Liberation Serif");
    CHECK(s.default_scale == 0.25);
    CHECK(!s.heading.enabled);
    CHECK(s.heading.title == "Leaf report");
    CHECK(s.text_color == (RgbColor{0.1, 0.1, 0.1}));
    CHECK(s.storage_dir == dir / "tmp");
    // Untouched keys keep their defaults.
    CHECK(s.layout.max_line_width == Length::from_pt(500));
    CHECK(s.heading.title_style.size == Length::from_pt(20));

    write_file(json_file, R"({"margins": {"top": 10, "bottom": 20}})");
    CHECK_THROWS(load_report_json(json_file.c_str()), std::runtime_error);
    write_file(json_file, R"({"text": {"size": "big"}})");
    CHECK_THROWS(load_report_json(json_file.c_str()), std::runtime_error);
    write_file(json_file, R"({"text": {"line_height": 751}})");
    CHECK_THROWS(load_report_json(json_file.c_str()), std::runtime_error);
    write_file(json_file, R"({"heading": {"title_line_height": 900}})");
    CHECK_THROWS(load_report_json(json_file.c_str()), std::runtime_error);
    write_file(json_file, R"({"heading": {"enabled": false, "title_line_height": 900}})");
    CHECK(!load_report_json(json_file.c_str()).heading.enabled);
    write_file(json_file, R"({"image": {"scale": 0}})");
    CHECK_THROWS(load_report_json(json_file.c_str()), std::runtime_error);
    write_file(json_file, "{ not json");
    CHECK_THROWS(load_report_json(json_file.c_str()), std::exception);
    CHECK_THROWS(load_report_json((dir / "missing.json").c_str()), std::runtime_error);
    fs::remove_all(dir);
}

void test_report_filename() {
    const std::chrono::system_clock::time_point t{std::chrono::milliseconds(1700000000123)};
    CHECK(report_filename(t) == "plant_analysis_report_1700000000123.pdf");
    CHECK(current_date().size() == 10);
}

void test_status_codes() {
    CHECK(http_status_for(ReportErrorKind::UnsupportedImageFormat) == 400);
    CHECK(http_status_for(ReportErrorKind::ImageDecode) == 400);
    CHECK(http_status_for(ReportErrorKind::ImageTooTall) == 400);
    CHECK(http_status_for(ReportErrorKind::EmptyInput) == 400);
    CHECK(http_status_for(ReportErrorKind::Render) == 500);
    CHECK(http_status_for(ReportErrorKind::Storage) == 500);
    const ReportError &e = ImageTooTallError("tall");
    CHECK(e.kind() == ReportErrorKind::ImageTooTall);
    CHECK(std::string(error_kind_name(ReportErrorKind::Storage)).size() > 0);
}

int main(int, char **) {
    test_driver_call_order();
    test_driver_embeds_shared_image_once();
    test_driver_renders_once();
    test_driver_rejects_empty_document();
    test_driver_failures();
    test_render_is_deterministic();

    test_engine_text_only();
    test_engine_heading();
    test_engine_many_pages();
    test_engine_scaled_png();
    test_engine_image_only();
    test_engine_tall_image_without_text();
    test_engine_data_uri();
    test_engine_rejects_before_writing();
    test_engine_render_failure();

    test_scoped_temp_file();
    test_settings_json();
    test_report_filename();
    test_status_codes();
    return 0;
}
