#include "study_planner/text_extractor.h"
#include <mupdf/fitz.h>
#include <mupdf/pdf.h>
#include <stdexcept>

namespace study_planner {

class TextExtractor::Impl {
public:
    Impl() {
        ctx = fz_new_context(NULL, NULL, FZ_STORE_UNLIMITED);
        if (!ctx) {
            throw std::runtime_error("Failed to create MuPDF context");
        }
        fz_register_document_handlers(ctx);
    }

    ~Impl() {
        if (ctx) {
            fz_drop_context(ctx);
        }
    }

    ExtractedDocument extract_document(const std::string& pdf_path) {
        fz_document *doc = nullptr;
        fz_var(doc);

        ExtractedDocument result;
        bool failed = false;

        fz_try(ctx) {
            doc = fz_open_document(ctx, pdf_path.c_str());
            result = extract_open_document(doc);
        }
        fz_always(ctx) {
            if (doc) fz_drop_document(ctx, doc);
        }
        fz_catch(ctx) {
            failed = true;
        }

        if (failed) {
            throw std::runtime_error("MuPDF error opening " + pdf_path + ": " + fz_caught_message(ctx));
        }
        return result;
    }

    ExtractedDocument extract_document(const std::string& filename,
                                       const std::vector<unsigned char>& data) {
        fz_buffer *buffer = nullptr;
        fz_stream *stream = nullptr;
        fz_document *doc = nullptr;
        fz_var(buffer);
        fz_var(stream);
        fz_var(doc);

        ExtractedDocument result;
        bool failed = false;

        fz_try(ctx) {
            buffer = fz_new_buffer_from_copied_data(ctx, data.data(), data.size());
            stream = fz_open_buffer(ctx, buffer);
            doc = fz_open_document_with_stream(ctx, "application/pdf", stream);
            result = extract_open_document(doc);
        }
        fz_always(ctx) {
            if (doc) fz_drop_document(ctx, doc);
            if (stream) fz_drop_stream(ctx, stream);
            if (buffer) fz_drop_buffer(ctx, buffer);
        }
        fz_catch(ctx) {
            failed = true;
        }

        if (failed) {
            throw std::runtime_error("MuPDF error opening uploaded " + filename + ": " + fz_caught_message(ctx));
        }
        return result;
    }

private:
    // Runs inside the caller's fz_try
    ExtractedDocument extract_open_document(fz_document *doc) {
        ExtractedDocument result;
        result.page_count = fz_count_pages(ctx, doc);
        result.pages.reserve(result.page_count);

        for (int i = 0; i < result.page_count; ++i) {
            result.pages.push_back(extract_page(doc, i));
        }

        result.outline = load_outline(doc);
        return result;
    }

    // A page that fails to load degrades to empty text with an error note
    ExtractedPage extract_page(fz_document *doc, int page_number) {
        fz_page *page = nullptr;
        fz_stext_page *stext = nullptr;
        fz_var(page);
        fz_var(stext);

        ExtractedPage result{page_number, std::string(), std::string()};

        fz_try(ctx) {
            page = fz_load_page(ctx, doc, page_number);

            fz_stext_options opts = { 0 };
            opts.flags = FZ_STEXT_PRESERVE_LIGATURES | FZ_STEXT_PRESERVE_WHITESPACE;
            stext = fz_new_stext_page_from_page(ctx, page, &opts);

            result.text = stext_to_text(stext);
        }
        fz_always(ctx) {
            if (stext) fz_drop_stext_page(ctx, stext);
            if (page) fz_drop_page(ctx, page);
        }
        fz_catch(ctx) {
            result.text.clear();
            result.error = fz_caught_message(ctx);
        }

        return result;
    }

    std::string stext_to_text(fz_stext_page *stext) {
        std::string page_text;

        for (fz_stext_block *block = stext->first_block; block; block = block->next) {
            if (block->type != FZ_STEXT_BLOCK_TEXT) {
                continue;
            }
            for (fz_stext_line *line = block->u.t.first_line; line; line = line->next) {
                if (!page_text.empty()) page_text += "\n";

                for (fz_stext_char *ch = line->first_char; ch; ch = ch->next) {
                    char utf8[8] = {0};
                    int len = fz_runetochar(utf8, ch->c);
                    page_text.append(utf8, len);
                }
            }
        }

        return page_text;
    }

    std::vector<OutlineEntry> load_outline(fz_document *doc) {
        std::vector<OutlineEntry> entries;
        fz_outline *outline = nullptr;
        fz_var(outline);

        fz_try(ctx) {
            outline = fz_load_outline(ctx, doc);
            collect_outline(doc, outline, 1, entries);
        }
        fz_always(ctx) {
            if (outline) fz_drop_outline(ctx, outline);
        }
        fz_catch(ctx) {
            // Broken outlines are treated as absent
            entries.clear();
        }

        return entries;
    }

    void collect_outline(fz_document *doc, fz_outline *node, int level,
                         std::vector<OutlineEntry>& entries) {
        for (; node; node = node->next) {
            int page = 0;
            if (node->page.page >= 0) {
                page = fz_page_number_from_location(ctx, doc, node->page) + 1;
            }
            entries.push_back({level, node->title ? node->title : "", page});

            if (node->down) {
                collect_outline(doc, node->down, level + 1, entries);
            }
        }
    }

public:
    fz_context *ctx;
};

TextExtractor::TextExtractor() : pImpl(std::make_unique<Impl>()) {}
TextExtractor::~TextExtractor() = default;

ExtractedDocument TextExtractor::extract_document(const std::string& pdf_path) {
    return pImpl->extract_document(pdf_path);
}

ExtractedDocument TextExtractor::extract_document(const std::string& filename,
                                                  const std::vector<unsigned char>& data) {
    return pImpl->extract_document(filename, data);
}

} // namespace study_planner
