// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <reporterror.hpp>

const char *error_kind_name(ReportErrorKind kind) {
    switch(kind) {
    case ReportErrorKind::UnsupportedImageFormat:
        return "UnsupportedImageFormatError";
    case ReportErrorKind::ImageDecode:
        return "ImageDecodeError";
    case ReportErrorKind::ImageTooTall:
        return "ImageTooTallError";
    case ReportErrorKind::Render:
        return "RenderError";
    case ReportErrorKind::EmptyInput:
        return "EmptyInputError";
    case ReportErrorKind::Storage:
        return "StorageError";
    }
    return "UnknownError";
}

int http_status_for(ReportErrorKind kind) {
    switch(kind) {
    case ReportErrorKind::UnsupportedImageFormat:
    case ReportErrorKind::ImageDecode:
    case ReportErrorKind::ImageTooTall:
    case ReportErrorKind::EmptyInput:
        return 400;
    case ReportErrorKind::Render:
    case ReportErrorKind::Storage:
        return 500;
    }
    return 500;
}
