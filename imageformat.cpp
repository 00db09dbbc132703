// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <imageformat.hpp>
#include <reporterror.hpp>

#include <glib.h>
#include <png.h>

#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <memory>

// Needs FILE from stdio.
#include <jpeglib.h>

namespace {

struct JpegErrorManager {
    jpeg_error_mgr pub;
    jmp_buf setjmp_buffer;
    char message[JMSG_LENGTH_MAX];
};

void jpeg_error_exit(j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorManager *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    longjmp(err->setjmp_buffer, 1);
}

void jpeg_silent_output(j_common_ptr) {}

bool too_many_pixels(const ImageSize &size) {
    return uint64_t(size.w) * size.h > MAX_IMAGE_PIXELS;
}

void size_limit_message(const ImageSize &size, char *message, size_t message_size) {
    snprintf(message,
             message_size,
             "image is %ux%u pixels, the limit is %llu pixels",
             size.w,
             size.h,
             (unsigned long long)MAX_IMAGE_PIXELS);
}

// Runs the whole decoder over the data so truncated files are caught
// here rather than when the PDF is written. No object with a destructor
// may live in this function because of the longjmp.
bool decode_jpeg(const std::string &bytes, ImageSize &size, char *message) {
    jpeg_decompress_struct cinfo;
    JpegErrorManager jerr;
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit;
    jerr.pub.output_message = jpeg_silent_output;
    jerr.message[0] = '\0';
    if(setjmp(jerr.setjmp_buffer)) {
        strncpy(message, jerr.message, JMSG_LENGTH_MAX);
        jpeg_destroy_decompress(&cinfo);
        return false;
    }
    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo,
                 reinterpret_cast<unsigned char *>(const_cast<char *>(bytes.data())),
                 (unsigned long)bytes.size());
    jpeg_read_header(&cinfo, TRUE);
    size.w = cinfo.image_width;
    size.h = cinfo.image_height;
    if(too_many_pixels(size)) {
        size_limit_message(size, message, JMSG_LENGTH_MAX);
        jpeg_destroy_decompress(&cinfo);
        return false;
    }
    jpeg_start_decompress(&cinfo);
    const JDIMENSION row_stride = cinfo.output_width * cinfo.output_components;
    JSAMPARRAY row = (*cinfo.mem->alloc_sarray)((j_common_ptr)&cinfo, JPOOL_IMAGE, row_stride, 1);
    while(cinfo.output_scanline < cinfo.output_height) {
        jpeg_read_scanlines(&cinfo, row, 1);
    }
    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);
    return true;
}

ImageSize read_jpeg_size(const std::string &bytes) {
    ImageSize size{0, 0};
    char message[JMSG_LENGTH_MAX];
    if(!decode_jpeg(bytes, size, message)) {
        throw ImageDecodeError(std::string("Invalid JPEG image: ") + message);
    }
    return size;
}

const size_t PNG_MESSAGE_SIZE = 256;

struct PngMemoryReader {
    const png_byte *data;
    size_t size;
    size_t offset;
};

void png_read_from_memory(png_structp png, png_bytep out, size_t length) {
    auto *reader = static_cast<PngMemoryReader *>(png_get_io_ptr(png));
    if(length > reader->size - reader->offset) {
        png_error(png, "unexpected end of data");
    }
    memcpy(out, reader->data + reader->offset, length);
    reader->offset += length;
}

void png_error_exit(png_structp png, png_const_charp msg) {
    auto *message = static_cast<char *>(png_get_error_ptr(png));
    snprintf(message, PNG_MESSAGE_SIZE, "%s", msg);
    png_longjmp(png, 1);
}

void png_silent_warning(png_structp, png_const_charp) {}

// Same rules as decode_jpeg. Only one row is held in memory, so the
// cost does not depend on what the header claims.
bool decode_png(const std::string &bytes, ImageSize &size, char *message) {
    png_structp png = png_create_read_struct(
        PNG_LIBPNG_VER_STRING, message, png_error_exit, png_silent_warning);
    if(!png) {
        snprintf(message, PNG_MESSAGE_SIZE, "could not create decoder");
        return false;
    }
    png_infop info = png_create_info_struct(png);
    if(!info) {
        png_destroy_read_struct(&png, nullptr, nullptr);
        snprintf(message, PNG_MESSAGE_SIZE, "could not create decoder");
        return false;
    }
    PngMemoryReader reader{reinterpret_cast<const png_byte *>(bytes.data()), bytes.size(), 0};
    png_bytep volatile row = nullptr;
    if(setjmp(png_jmpbuf(png))) {
        png_free(png, row);
        png_destroy_read_struct(&png, &info, nullptr);
        return false;
    }
    png_set_read_fn(png, &reader, png_read_from_memory);
    png_read_info(png, info);
    size.w = png_get_image_width(png, info);
    size.h = png_get_image_height(png, info);
    if(too_many_pixels(size)) {
        size_limit_message(size, message, PNG_MESSAGE_SIZE);
        png_destroy_read_struct(&png, &info, nullptr);
        return false;
    }
    const int passes = png_set_interlace_handling(png);
    png_read_update_info(png, info);
    row = static_cast<png_bytep>(png_malloc(png, png_get_rowbytes(png, info)));
    for(int pass = 0; pass < passes; ++pass) {
        for(uint32_t y = 0; y < size.h; ++y) {
            png_read_row(png, row, nullptr);
        }
    }
    png_read_end(png, nullptr);
    png_free(png, row);
    png_destroy_read_struct(&png, &info, nullptr);
    return true;
}

ImageSize read_png_size(const std::string &bytes) {
    ImageSize size{0, 0};
    char message[PNG_MESSAGE_SIZE];
    if(!decode_png(bytes, size, message)) {
        throw ImageDecodeError(std::string("Invalid PNG image: ") + message);
    }
    return size;
}

std::string lowercase(std::string_view s) {
    std::string result;
    result.reserve(s.size());
    for(const char c : s) {
        result.push_back((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
    }
    return result;
}

} // namespace

ImageFormat parse_image_format(std::string_view mime_type) {
    const auto mime = lowercase(mime_type);
    if(mime == "image/jpeg" || mime == "image/jpg") {
        return ImageFormat::Jpeg;
    }
    if(mime == "image/png") {
        return ImageFormat::Png;
    }
    throw UnsupportedImageFormatError("Unsupported image format \"" + std::string(mime_type) +
                                      "\". Only JPEG and PNG images are supported.");
}

const char *mime_type_of(ImageFormat format) {
    switch(format) {
    case ImageFormat::Jpeg:
        return "image/jpeg";
    case ImageFormat::Png:
        return "image/png";
    }
    return "application/octet-stream";
}

const char *file_extension_of(ImageFormat format) {
    switch(format) {
    case ImageFormat::Jpeg:
        return ".jpg";
    case ImageFormat::Png:
        return ".png";
    }
    return ".bin";
}

ImageSize read_image_size(const EncodedImage &image) {
    if(image.bytes.empty()) {
        throw ImageDecodeError("Image data is empty.");
    }
    ImageSize size{0, 0};
    switch(image.format) {
    case ImageFormat::Jpeg:
        size = read_jpeg_size(image.bytes);
        break;
    case ImageFormat::Png:
        size = read_png_size(image.bytes);
        break;
    }
    if(size.w == 0 || size.h == 0) {
        throw ImageDecodeError("Image has zero size.");
    }
    return size;
}

DataUri parse_data_uri(std::string_view uri) {
    const std::string_view prefix{"data:"};
    const std::string_view marker{";base64,"};
    if(uri.substr(0, prefix.size()) != prefix) {
        throw UnsupportedImageFormatError(
            "Invalid image format. Only JPEG and PNG images are supported.");
    }
    const auto marker_loc = uri.find(marker);
    if(marker_loc == std::string_view::npos) {
        throw UnsupportedImageFormatError(
            "Invalid image format. Only JPEG and PNG images are supported.");
    }
    DataUri result;
    result.mime_type = std::string(uri.substr(prefix.size(), marker_loc - prefix.size()));
    const std::string payload{uri.substr(marker_loc + marker.size())};
    gsize decoded_size = 0;
    guchar *decoded = g_base64_decode(payload.c_str(), &decoded_size);
    std::unique_ptr<guchar, decltype(&g_free)> guard(decoded, g_free);
    result.bytes.assign(reinterpret_cast<const char *>(decoded), decoded_size);
    return result;
}
