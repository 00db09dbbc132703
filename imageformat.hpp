// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <reportcommon.hpp>

#include <cstdint>
#include <string>
#include <string_view>

// Larger images are rejected before their pixel data is decoded.
const uint64_t MAX_IMAGE_PIXELS = 64 * 1024 * 1024;

struct ImageSize {
    uint32_t w;
    uint32_t h;
};

// Only the mime type decides the format. Throws
// UnsupportedImageFormatError for anything but JPEG and PNG.
ImageFormat parse_image_format(std::string_view mime_type);

const char *mime_type_of(ImageFormat format);
const char *file_extension_of(ImageFormat format);

// Reads the natural pixel size from the image header. Throws
// ImageDecodeError if the payload is not a valid image of the
// declared format.
ImageSize read_image_size(const EncodedImage &image);

struct DataUri {
    std::string mime_type;
    std::string bytes;
};

// Splits "data:<mime>;base64,<payload>" and decodes the payload.
DataUri parse_data_uri(std::string_view uri);
