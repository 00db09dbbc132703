// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <reportcommon.hpp>

#include <cstdint>
#include <vector>

// Decides where an image goes once the text has been laid out. One
// pixel maps to one point before scaling. Images wider than the text
// block are shrunk, keeping the aspect ratio. Throws ImageTooTallError
// if the image does not fit on an empty page.
ImagePlacement resolve_image_placement(uint32_t natural_width,
                                       uint32_t natural_height,
                                       double scale,
                                       const LayoutCursor &cursor,
                                       const LayoutConfig &config);

// Appends the image to the page it was placed on, creating empty pages
// as needed.
void append_image(std::vector<PlannedPage> &pages,
                  const ImagePlacement &placement,
                  const EncodedImage *image);
