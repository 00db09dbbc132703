// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <stdexcept>
#include <string>

enum class ReportErrorKind : int {
    UnsupportedImageFormat,
    ImageDecode,
    ImageTooTall,
    Render,
    EmptyInput,
    Storage,
};

const char *error_kind_name(ReportErrorKind kind);

// Status code a web front end should answer with.
int http_status_for(ReportErrorKind kind);

class ReportError : public std::runtime_error {
public:
    ReportError(ReportErrorKind kind_, const std::string &msg)
        : std::runtime_error(msg), k{kind_} {}

    ReportErrorKind kind() const { return k; }

private:
    ReportErrorKind k;
};

class UnsupportedImageFormatError : public ReportError {
public:
    explicit UnsupportedImageFormatError(const std::string &msg)
        : ReportError(ReportErrorKind::UnsupportedImageFormat, msg) {}
};

class ImageDecodeError : public ReportError {
public:
    explicit ImageDecodeError(const std::string &msg)
        : ReportError(ReportErrorKind::ImageDecode, msg) {}
};

class ImageTooTallError : public ReportError {
public:
    explicit ImageTooTallError(const std::string &msg)
        : ReportError(ReportErrorKind::ImageTooTall, msg) {}
};

class RenderError : public ReportError {
public:
    explicit RenderError(const std::string &msg) : ReportError(ReportErrorKind::Render, msg) {}
};

class EmptyInputError : public ReportError {
public:
    explicit EmptyInputError(const std::string &msg)
        : ReportError(ReportErrorKind::EmptyInput, msg) {}
};

class StorageError : public ReportError {
public:
    explicit StorageError(const std::string &msg) : ReportError(ReportErrorKind::Storage, msg) {}
};
