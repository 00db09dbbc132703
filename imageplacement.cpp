// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <imageplacement.hpp>
#include <reporterror.hpp>

#include <stdexcept>
#include <string>

ImagePlacement resolve_image_placement(uint32_t natural_width,
                                       uint32_t natural_height,
                                       double scale,
                                       const LayoutCursor &cursor,
                                       const LayoutConfig &config) {
    if(!(scale > 0)) {
        throw std::invalid_argument("Image scale must be positive, got " +
                                    std::to_string(scale) + ".");
    }
    Length imw = Length::from_pt(natural_width * scale);
    Length imh = Length::from_pt(natural_height * scale);
    const Length max_width = config.content_width();
    if(imw > max_width) {
        const double shrink = max_width / imw;
        imw = max_width;
        imh = imh * shrink;
    }

    const Length available = cursor.remaining(config);
    if(imh + config.image_gap <= available) {
        return ImagePlacement{
            cursor.page, config.left_margin, cursor.y - imh - config.image_gap, imw, imh};
    }
    if(imh > config.usable_height()) {
        throw ImageTooTallError("Image is " + std::to_string(imh.pt()) +
                                "pt tall but a page only has room for " +
                                std::to_string(config.usable_height().pt()) +
                                "pt. Use a smaller scale.");
    }
    // Nothing has been drawn on this page yet. The gap only separates
    // the image from text above it, so moving on would leave the page
    // empty.
    if(cursor.y == config.top_margin) {
        return ImagePlacement{
            cursor.page, config.left_margin, config.top_margin - imh, imw, imh};
    }
    return ImagePlacement{
        cursor.page + 1, config.left_margin, config.top_margin - imh, imw, imh};
}

void append_image(std::vector<PlannedPage> &pages,
                  const ImagePlacement &placement,
                  const EncodedImage *image) {
    while(pages.size() <= placement.page) {
        pages.emplace_back();
    }
    pages[placement.page].commands.emplace_back(
        ImageCommand{placement.x, placement.y, placement.width, placement.height, image});
}
