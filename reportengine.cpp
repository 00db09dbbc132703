// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <reportengine.hpp>
#include <imageformat.hpp>
#include <imageplacement.hpp>
#include <renderdriver.hpp>
#include <textflow.hpp>
#include <utils.hpp>

#include <glib.h>

#include <chrono>
#include <cstdio>

namespace {

// The analysis text comes from an external service. Replace broken
// UTF-8 rather than feeding it to the shaper.
std::string sanitize_text(const std::string &text) {
    if(g_utf8_validate(text.c_str(), (gssize)text.size(), nullptr)) {
        return text;
    }
    fprintf(stderr, "Analysis text is not valid UTF-8, replacing invalid bytes.\n");
    gchar *fixed = g_utf8_make_valid(text.c_str(), (gssize)text.size());
    std::string result{fixed};
    g_free(fixed);
    return result;
}

} // namespace

std::optional<EncodedImage> validate_image(const ReportRequest &req) {
    if(!req.image) {
        return {};
    }
    const auto &im = req.image.value();
    if(im.mime_type.empty() && im.bytes.starts_with("data:")) {
        auto uri = parse_data_uri(im.bytes);
        const auto format = parse_image_format(uri.mime_type);
        return EncodedImage{std::move(uri.bytes), format};
    }
    return EncodedImage{im.bytes, parse_image_format(im.mime_type)};
}

ReportEngine::ReportEngine(const ReportSettings &settings_,
                           const TextMeasurer &meas_,
                           EphemeralStorage &storage_,
                           WriterFactory factory)
    : settings{settings_}, meas{meas_}, storage{storage_}, make_writer{std::move(factory)} {}

ReportOutcome ReportEngine::generate(const ReportRequest &req) {
    try {
        return generate_or_throw(req);
    } catch(const ReportError &e) {
        fprintf(
            stderr, "Report generation failed (%s): %s\n", error_kind_name(e.kind()), e.what());
        return ReportFailure{e.kind(), e.what()};
    } catch(const std::exception &e) {
        fprintf(stderr, "Report generation failed: %s\n", e.what());
        return ReportFailure{ReportErrorKind::Render, e.what()};
    }
}

double ReportEngine::effective_scale(const ReportRequest &req) const {
    if(!req.scale) {
        return settings.default_scale;
    }
    if(!(req.scale.value() > 0)) {
        fprintf(stderr,
                "Ignoring invalid image scale %f, using %f.\n",
                req.scale.value(),
                settings.default_scale);
        return settings.default_scale;
    }
    return req.scale.value();
}

PlannedDocument ReportEngine::plan(const ReportRequest &req, const EncodedImage *image) const {
    const auto &layout = settings.layout;
    const auto text = sanitize_text(req.text);
    if(is_blank(text) && !image) {
        throw EmptyInputError("Nothing to render: the analysis text is empty and there is no "
                              "image.");
    }

    TextFlowPlanner planner(layout, meas);
    if(settings.heading.enabled) {
        const auto &heading = settings.heading;
        planner.add_line(heading.title, heading.title_style, TextAlignment::Centered);
        planner.add_line("Date: " + current_date(), heading.date_style, TextAlignment::Left);
    }
    TextStyle body;
    body.size = layout.font_size;
    body.line_height = layout.line_height;
    body.color = settings.text_color;
    planner.add_text(text, body);
    auto flow = planner.finish();

    if(image) {
        const auto size = read_image_size(*image);
        const auto placement =
            resolve_image_placement(size.w, size.h, effective_scale(req), flow.cursor, layout);
        append_image(flow.pages, placement, image);
    }

    PlannedDocument doc;
    doc.page_width = layout.page_width;
    doc.page_height = layout.page_height;
    doc.font_family = settings.font_family;
    doc.pages = std::move(flow.pages);
    return doc;
}

GeneratedReport ReportEngine::generate_or_throw(const ReportRequest &req) {
    // Format is checked before anything tries to decode the bytes.
    const auto image = validate_image(req);
    const auto doc = plan(req, image ? &image.value() : nullptr);

    auto output = storage.create("report_", ".pdf");
    std::string bytes;
    {
        std::unique_ptr<DocumentWriter> writer;
        try {
            writer = make_writer(output.path());
        } catch(const ReportError &) {
            throw;
        } catch(const std::exception &e) {
            throw RenderError(std::string("Could not create document writer: ") + e.what());
        }
        RenderDriver driver(*writer);
        bytes = driver.render(doc);
    }

    GeneratedReport report;
    report.filename = report_filename(std::chrono::system_clock::now());
    report.bytes = std::move(bytes);
    report.num_pages = doc.pages.size();
    printf("Generated %s, %zu page(s), %zu bytes.\n",
           report.filename.c_str(),
           report.num_pages,
           report.bytes.size());
    return report;
}
