// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <renderdriver.hpp>
#include <reporterror.hpp>

std::string RenderDriver::render(const PlannedDocument &doc) {
    if(current_state != RenderState::Empty) {
        throw RenderError("A render driver can only render one document.");
    }
    if(doc.pages.empty()) {
        throw RenderError("Document has no pages.");
    }
    current_state = RenderState::Building;
    try {
        // Images are embedded before any page exists so that a broken
        // image fails the report before anything has been drawn.
        embed_images(doc);
        const FontHandle font = writer.embed_font(doc.font_family);
        for(const auto &content : doc.pages) {
            const PageHandle page = writer.add_page(doc.page_width, doc.page_height);
            ++num_pages;
            draw_page(page, font, content);
        }
        auto bytes = writer.save();
        current_state = RenderState::Serialized;
        return bytes;
    } catch(const ReportError &) {
        throw;
    } catch(const std::exception &e) {
        throw RenderError(e.what());
    }
}

void RenderDriver::embed_images(const PlannedDocument &doc) {
    for(const auto &content : doc.pages) {
        for(const auto &c : content.commands) {
            if(const auto *im = std::get_if<ImageCommand>(&c)) {
                if(images.find(im->image) == images.end()) {
                    images[im->image] = writer.embed_image(*im->image);
                }
            }
        }
    }
}

void RenderDriver::draw_page(PageHandle page, FontHandle font, const PlannedPage &content) {
    for(const auto &c : content.commands) {
        if(const auto *line = std::get_if<TextLineCommand>(&c)) {
            writer.draw_text(
                page, font, line->x, line->y, line->font_size, line->color, line->content);
        } else if(const auto *im = std::get_if<ImageCommand>(&c)) {
            writer.draw_image(page, images.at(im->image), im->x, im->y, im->width, im->height);
        } else {
            throw RenderError("Unknown draw command.");
        }
    }
}
