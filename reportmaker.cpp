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

#include <capywriter.hpp>
#include <hbmeasurer.hpp>
#include <reportengine.hpp>
#include <utils.hpp>

#include <clocale>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace {

// What an upload form would send along with the file.
std::string mime_type_for(const std::filesystem::path &p) {
    auto ext = p.extension().string();
    for(auto &c : ext) {
        c = (c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c;
    }
    if(ext == ".jpg" || ext == ".jpeg") {
        return "image/jpeg";
    }
    if(ext == ".png") {
        return "image/png";
    }
    if(ext == ".gif") {
        return "image/gif";
    }
    return "application/octet-stream";
}

void print_usage(const char *progname) {
    printf("%s [options] <analysis.txt> <output dir>\n\n", progname);
    printf("  --settings <file.json>  layout settings\n");
    printf("  --image <file>          photo to append after the text\n");
    printf("  --mime <type>           mime type of the photo (default: from extension)\n");
    printf("  --scale <factor>        image scale factor\n");
}

struct Options {
    const char *settings = nullptr;
    const char *image = nullptr;
    const char *mime = nullptr;
    const char *scale = nullptr;
    const char *text = nullptr;
    const char *outdir = nullptr;
};

bool parse_args(int argc, char **argv, Options &o) {
    int positional = 0;
    for(int i = 1; i < argc; ++i) {
        const bool has_value = i + 1 < argc;
        if(strcmp(argv[i], "--settings") == 0 && has_value) {
            o.settings = argv[++i];
        } else if(strcmp(argv[i], "--image") == 0 && has_value) {
            o.image = argv[++i];
        } else if(strcmp(argv[i], "--mime") == 0 && has_value) {
            o.mime = argv[++i];
        } else if(strcmp(argv[i], "--scale") == 0 && has_value) {
            o.scale = argv[++i];
        } else if(argv[i][0] == '-') {
            return false;
        } else if(positional == 0) {
            o.text = argv[i];
            ++positional;
        } else if(positional == 1) {
            o.outdir = argv[i];
            ++positional;
        } else {
            return false;
        }
    }
    return positional == 2;
}

int run(const Options &opts) {
    const ReportSettings settings =
        opts.settings ? load_report_json(opts.settings) : default_report_settings();

    ReportRequest req;
    req.text = read_file(opts.text);
    if(opts.image) {
        ReportImage im;
        im.bytes = read_file(opts.image);
        im.mime_type = opts.mime ? opts.mime : mime_type_for(opts.image);
        req.image = std::move(im);
    }
    if(opts.scale) {
        char *end = nullptr;
        req.scale = strtod(opts.scale, &end);
        if(end == opts.scale || *end != '\0') {
            fprintf(stderr, "Scale \"%s\" is not a number.\n", opts.scale);
            return 1;
        }
    }

    HBFontCache fc;
    HBMeasurer meas(fc, settings.font_family, settings.language.c_str());
    EphemeralStorage storage(settings.storage_dir);
    const auto docprop = report_document_properties(
        settings.layout.page_width, settings.layout.page_height, settings.heading.title);
    ReportEngine engine(settings, meas, storage, [&](const std::filesystem::path &outfile) {
        return std::unique_ptr<DocumentWriter>(new CapyDocumentWriter(outfile,
                                                                      settings.layout.page_width,
                                                                      settings.layout.page_height,
                                                                      docprop,
                                                                      fc,
                                                                      storage));
    });

    auto outcome = engine.generate(req);
    if(auto *failure = std::get_if<ReportFailure>(&outcome)) {
        fprintf(stderr,
                "%s (status %d): %s\n",
                error_kind_name(failure->kind),
                http_status_for(failure->kind),
                failure->message.c_str());
        return 1;
    }
    const auto &report = std::get<GeneratedReport>(outcome);
    std::filesystem::create_directories(opts.outdir);
    const auto ofile = std::filesystem::path(opts.outdir) / report.filename;
    write_file(ofile, report.bytes);
    printf("%s\n", ofile.c_str());
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    setlocale(LC_ALL, "");
    Options opts;
    if(!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return 1;
    }
    try {
        return run(opts);
    } catch(const std::exception &e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }
}
