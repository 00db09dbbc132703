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
#include <imageformat.hpp>
#include <reporterror.hpp>
#include <utils.hpp>

#include <hb.h>
#include <glib.h>

#include <cstring>
#include <memory>

namespace {

size_t get_endpoint(hb_glyph_info_t *glyph_info,
                    size_t glyph_count,
                    size_t i,
                    const std::string &unshaped_text) {
    if(i + 1 < glyph_count) {
        return glyph_info[i + 1].cluster;
    }
    return unshaped_text.size();
}

void hb_buffer_to_textsequence(hb_buffer_t *buf,
                               capypdf::TextSequence &ts,
                               const FontInfo &fontinfo,
                               double hbscale,
                               const std::string &unshaped_text) {

    unsigned int glyph_count;
    hb_glyph_info_t *glyph_info = hb_buffer_get_glyph_infos(buf, &glyph_count);
    hb_glyph_position_t *glyph_pos = hb_buffer_get_glyph_positions(buf, &glyph_count);
    const char *text_start = unshaped_text.c_str();
    for(unsigned int i = 0; i < glyph_count; i++) {
        const hb_glyph_info_t *current = glyph_info + i;
        const hb_glyph_position_t *curpos = glyph_pos + i;
        const hb_codepoint_t glyphid = current->codepoint;
        const auto original_text_start = text_start + current->cluster;
        const auto original_text_end =
            text_start + get_endpoint(glyph_info, glyph_count, i, unshaped_text);
        const auto hb_glyph_advance_in_font_units =
            hb_font_get_glyph_h_advance(fontinfo.f, glyphid) / hbscale * fontinfo.units_per_em;
        const auto hb_advance_in_font_units = curpos->x_advance / hbscale * fontinfo.units_per_em;
        const int32_t kerning_delta =
            int32_t(hb_glyph_advance_in_font_units - hb_advance_in_font_units);
        // A cluster may also map to several glyphs, in which case the
        // end is not past the start.
        if(original_text_start >= original_text_end ||
           g_utf8_next_char(original_text_start) == original_text_end) {
            ts.append_raw_glyph(glyphid, g_utf8_get_char(original_text_start));
        } else {
            ts.append_ligature_glyph(
                glyphid, std::string_view(original_text_start, original_text_end));
        }
        if(kerning_delta != 0) {
            ts.append_kerning(kerning_delta);
        }
    }
}

} // namespace

capypdf::DocumentProperties
report_document_properties(Length pagew, Length pageh, const std::string &title) {
    capypdf::DocumentProperties dp;
    capypdf::PageProperties pp;
    pp.set_pagebox(CAPY_BOX_MEDIA, 0, 0, pagew.pt(), pageh.pt());
    dp.set_default_page_properties(pp);
    dp.set_title(title);
    return dp;
}

CapyDocumentWriter::CapyDocumentWriter(const std::filesystem::path &ofname,
                                       Length pagew_,
                                       Length pageh_,
                                       const capypdf::DocumentProperties &docprop,
                                       HBFontCache &fc_,
                                       EphemeralStorage &storage_)
    : capygen{ofname.string().c_str(), docprop}, ctx{capygen.new_page_context()},
      outname{ofname}, pagew{pagew_.pt()}, pageh{pageh_.pt()}, fc{fc_}, storage{storage_} {}

PageHandle CapyDocumentWriter::add_page(Length w, Length h) {
    if(saved) {
        throw RenderError("Can not add pages to a document that has been saved.");
    }
    if(w.pt() != pagew || h.pt() != pageh) {
        throw RenderError("All pages of a report must have the same size.");
    }
    if(pages > 0) {
        capygen.add_page(ctx);
    }
    return pages++;
}

FontHandle CapyDocumentWriter::embed_font(const std::string &family) {
    LoadedFont font;
    font.info = fc.get_font(family);
    capypdf::FontProperties fprop;
    font.id = capygen.load_font(font.info.fname->string().c_str(), fprop);
    loaded_fonts.push_back(font);
    return FontHandle(loaded_fonts.size() - 1);
}

ImageHandle CapyDocumentWriter::embed_image(const EncodedImage &image) {
    // CapyPDF only loads images from files and picks the decoder by
    // extension, so the bytes are staged with the declared type.
    auto staged = storage.create("upload_", file_extension_of(image.format));
    staged.write(image.bytes);
    const auto size = read_image_size(image);
    ImageHandle handle;
    handle.w = size.w;
    handle.h = size.h;
    try {
        capypdf::RasterImage rimage = capygen.load_image(staged.path().string().c_str());
        capypdf::ImagePdfProperties iprops;
        loaded_images.push_back(capygen.add_image(rimage, iprops));
    } catch(const std::exception &e) {
        throw ImageDecodeError(std::string("Could not embed image: ") + e.what());
    }
    handle.id = int32_t(loaded_images.size() - 1);
    return handle;
}

void CapyDocumentWriter::check_page(PageHandle page) const {
    if(saved || page != pages - 1) {
        throw RenderError("Drawing is only possible on the most recently added page.");
    }
}

void CapyDocumentWriter::draw_text(PageHandle page,
                                   FontHandle font,
                                   Length x,
                                   Length y,
                                   Length size,
                                   const RgbColor &color,
                                   const std::string &text) {
    check_page(page);
    if(text.empty()) {
        return;
    }
    const auto &loaded = loaded_fonts.at(font);
    const double hbscale = size.pt() * HBFontCache::NUM_STEPS;

    hb_buffer_t *buf = hb_buffer_create();
    std::unique_ptr<hb_buffer_t, HBBufferCloser> bc(buf);
    hb_buffer_add_utf8(buf, text.data(), (int)text.size(), 0, -1);
    hb_buffer_guess_segment_properties(buf);
    hb_font_set_scale(loaded.info.f, hbscale, hbscale);
    hb_shape(loaded.info.f, buf, nullptr, 0);

    capypdf::TextSequence ts;
    hb_buffer_to_textsequence(buf, ts, loaded.info, hbscale, text);

    ctx.cmd_q();
    ctx.cmd_rg(color.r, color.g, color.b);
    capypdf::Text tobj = ctx.text_new();
    tobj.cmd_Tf(loaded.id, size.pt());
    tobj.cmd_Td(x.pt(), y.pt());
    tobj.cmd_TJ(ts);
    ctx.render_text_obj(tobj);
    ctx.cmd_Q();
}

void CapyDocumentWriter::draw_image(
    PageHandle page, const ImageHandle &image, Length x, Length y, Length w, Length h) {
    check_page(page);
    ctx.cmd_q();
    ctx.cmd_cm(1, 0, 0, 1, x.pt(), y.pt());
    ctx.cmd_cm(w.pt(), 0, 0, h.pt(), 0, 0);
    ctx.cmd_Do(loaded_images.at(image.id));
    ctx.cmd_Q();
}

std::string CapyDocumentWriter::save() {
    if(saved) {
        throw RenderError("Document has already been saved.");
    }
    saved = true;
    try {
        if(pages > 0) {
            capygen.add_page(ctx);
        }
        capygen.write();
    } catch(const std::exception &e) {
        throw RenderError(std::string("PDF serialization failed: ") + e.what());
    }
    try {
        return read_file(outname);
    } catch(const std::exception &e) {
        throw StorageError("Could not read back " + outname.string() + ": " + e.what());
    }
}
