// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <documentwriter.hpp>
#include <reportcommon.hpp>

#include <string>
#include <unordered_map>

enum class RenderState : int {
    Empty,
    Building,
    Serialized,
};

// Replays a planned document into a writer. A driver renders exactly
// one document; rendering again needs a new driver and a new writer.
class RenderDriver {
public:
    explicit RenderDriver(DocumentWriter &w) : writer{w} {}

    std::string render(const PlannedDocument &doc);

    RenderState state() const { return current_state; }
    int pages_created() const { return num_pages; }

private:
    void embed_images(const PlannedDocument &doc);
    void draw_page(PageHandle page, FontHandle font, const PlannedPage &content);

    DocumentWriter &writer;
    RenderState current_state = RenderState::Empty;
    int num_pages = 0;
    std::unordered_map<const EncodedImage *, ImageHandle> images;
};
