// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <documentwriter.hpp>
#include <ephemeralstorage.hpp>
#include <reporterror.hpp>
#include <reportsettings.hpp>
#include <textmeasurer.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

struct ReportImage {
    std::string bytes;
    std::string mime_type;
};

struct ReportRequest {
    std::string text;
    std::optional<ReportImage> image;
    std::optional<double> scale; // Settings default if unset.
};

struct GeneratedReport {
    std::string filename;
    std::string bytes;
    size_t num_pages;
};

struct ReportFailure {
    ReportErrorKind kind;
    std::string message;
};

typedef std::variant<GeneratedReport, ReportFailure> ReportOutcome;

// Creates the writer for one report. The writer must put its output in
// the given file.
typedef std::function<std::unique_ptr<DocumentWriter>(const std::filesystem::path &outfile)>
    WriterFactory;

// Turns one analysis result into a PDF. Each request gets its own
// document, writer and temporary files. Engines can run in parallel
// only if each has its own measurer and its own HBFontCache, because
// shaping changes the scale of the cached HarfBuzz fonts.
class ReportEngine {
public:
    ReportEngine(const ReportSettings &settings,
                 const TextMeasurer &meas,
                 EphemeralStorage &storage,
                 WriterFactory factory);

    ReportOutcome generate(const ReportRequest &req);

    // Layout only, without touching the writer. Throws ReportError.
    PlannedDocument plan(const ReportRequest &req, const EncodedImage *image) const;

private:
    GeneratedReport generate_or_throw(const ReportRequest &req);
    double effective_scale(const ReportRequest &req) const;

    const ReportSettings &settings;
    const TextMeasurer &meas;
    EphemeralStorage &storage;
    WriterFactory make_writer;
};

std::optional<EncodedImage> validate_image(const ReportRequest &req);
