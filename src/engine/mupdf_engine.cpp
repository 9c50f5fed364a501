#include "engine/mupdf_engine.hpp"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <algorithm>
#include <cstring>
#include <new>

namespace {

using ds::Rect;

constexpr int kMaxSearchHits = 512;

[[noreturn]] void throw_caught(fz_context* ctx, const std::string& what) {
    throw ds::DocumentError(what + ": " + fz_caught_message(ctx));
}

Rect to_rect(const fz_rect& r) {
    return Rect{r.x0, r.y0, r.x1, r.y1};
}

fz_rect to_fz_rect(const Rect& r) {
    return fz_make_rect(static_cast<float>(r.x0), static_cast<float>(r.y0),
                        static_cast<float>(r.x1), static_cast<float>(r.y1));
}

/**
 * @brief Strip the six-letter subset tag ("ABCDEF+Times-Bold")
 */
std::string clean_font_name(const char* raw) {
    if (!raw) return "unknown";
    std::string name(raw);
    auto plus = name.find('+');
    if (plus == 6) {
        name = name.substr(plus + 1);
    }
    return name;
}

// A character raised above the line's first baseline by more than a tenth of
// its size is treated as superscript (horizontal lines only).
bool is_superscript(const fz_stext_line* line, const fz_stext_char* ch) {
    if (line->wmode == 0 && line->dir.x == 1 && line->dir.y == 0) {
        return ch->origin.y < line->first_char->origin.y - ch->size * 0.1f;
    }
    return false;
}

int span_flags(fz_context* ctx, const fz_stext_line* line, const fz_stext_char* ch) {
    int flags = 0;
    if (is_superscript(line, ch)) flags |= ds::kSpanSuperscript;
    if (fz_font_is_italic(ctx, ch->font)) flags |= ds::kSpanItalic;
    if (fz_font_is_serif(ctx, ch->font)) flags |= ds::kSpanSerifed;
    if (fz_font_is_monospaced(ctx, ch->font)) flags |= ds::kSpanMonospaced;
    if (fz_font_is_bold(ctx, ch->font)) flags |= ds::kSpanBold;
    return flags;
}

void append_rune(std::string& out, int rune) {
    char utf8[FZ_UTFMAX];
    int len = fz_runetochar(utf8, rune);
    out.append(utf8, static_cast<size_t>(len));
}

/**
 * @brief Convert one structured-text line into spans of uniform style
 */
ds::TextLine convert_line(fz_context* ctx, const fz_stext_line* line) {
    ds::TextLine out;
    out.bbox = to_rect(line->bbox);

    const fz_font* span_font = nullptr;
    float span_size = -1.0f;
    int span_style = -1;

    for (const fz_stext_char* ch = line->first_char; ch; ch = ch->next) {
        int flags = span_flags(ctx, line, ch);
        if (out.spans.empty() || ch->font != span_font ||
            ch->size != span_size || flags != span_style) {
            ds::TextSpan span;
            span.font_name = clean_font_name(fz_font_name(ctx, ch->font));
            span.font_size = ch->size;
            span.flags = flags;
            span.bbox = to_rect(fz_rect_from_quad(ch->quad));
            out.spans.push_back(std::move(span));
            span_font = ch->font;
            span_size = ch->size;
            span_style = flags;
        } else {
            fz_rect united = fz_union_rect(to_fz_rect(out.spans.back().bbox),
                                           fz_rect_from_quad(ch->quad));
            out.spans.back().bbox = to_rect(united);
        }
        append_rune(out.spans.back().text, ch->c);
    }

    return out;
}

std::vector<ds::LayoutBlock> convert_stext(fz_context* ctx, const fz_stext_page* stext) {
    std::vector<ds::LayoutBlock> blocks;

    for (const fz_stext_block* block = stext->first_block; block; block = block->next) {
        if (block->type == FZ_STEXT_BLOCK_IMAGE) {
            ds::LayoutBlock image;
            image.bbox = to_rect(block->bbox);
            image.is_text = false;
            blocks.push_back(std::move(image));
            continue;
        }
        if (block->type != FZ_STEXT_BLOCK_TEXT) {
            continue;
        }

        ds::LayoutBlock text;
        text.bbox = to_rect(block->bbox);
        for (const fz_stext_line* line = block->u.t.first_line; line; line = line->next) {
            text.lines.push_back(convert_line(ctx, line));
        }
        blocks.push_back(std::move(text));
    }

    return blocks;
}

// Device that records the placement of every drawn image.
struct ImageBoxDevice {
    fz_device super;
    std::vector<Rect>* boxes;
    int overflow;
};

// super is the first member of a standard-layout struct
ImageBoxDevice* as_image_box_device(fz_device* dev) {
    return static_cast<ImageBoxDevice*>(static_cast<void*>(dev));
}

void image_box_fill_image(fz_context* ctx, fz_device* dev, fz_image* image,
                          fz_matrix ctm, float alpha, fz_color_params params) {
    (void)ctx;
    (void)image;
    (void)alpha;
    (void)params;
    ImageBoxDevice* collector = as_image_box_device(dev);
    fz_rect r = fz_transform_rect(fz_unit_rect, ctm);
    try {
        collector->boxes->push_back(to_rect(r));
    } catch (const std::bad_alloc&) {
        collector->overflow = 1;
    }
}

/**
 * @brief Apply the write options used for every save
 */
pdf_write_options make_write_options(bool compact) {
    pdf_write_options opts = pdf_default_write_options;
    if (compact) {
        opts.do_garbage = 4;
        opts.do_compress = 1;
        opts.do_compress_images = 1;
        opts.do_compress_fonts = 1;
    }
    return opts;
}

std::vector<unsigned char> buffer_bytes(fz_context* ctx, fz_buffer* buf) {
    unsigned char* data = nullptr;
    size_t len = fz_buffer_storage(ctx, buf, &data);
    return std::vector<unsigned char>(data, data + len);
}

void collect_outline(fz_context* ctx, fz_document* doc, fz_outline* node,
                     int level, std::vector<ds::TocEntry>& out) {
    for (; node; node = node->next) {
        ds::TocEntry entry;
        entry.level = level;
        entry.title = node->title ? node->title : "";
        int page = -1;
        fz_var(page);
        fz_try(ctx) {
            page = fz_page_number_from_location(ctx, doc, node->page);
        }
        fz_catch(ctx) {
            // Dangling destination; the entry is kept without a page
            page = -1;
        }
        entry.page = page >= 0 ? page + 1 : -1;
        out.push_back(std::move(entry));
        if (node->down) {
            collect_outline(ctx, doc, node->down, level + 1, out);
        }
    }
}

}  // namespace

namespace ds {

// ============================================================================
// MuPdfDocument
// ============================================================================

MuPdfDocument::MuPdfDocument(fz_context* ctx, fz_document* doc, const std::string& path)
    : ctx_(ctx), doc_(doc), pdf_(pdf_specifics(ctx, doc)), path_(path) {}

MuPdfDocument::~MuPdfDocument() {
    fz_drop_document(ctx_, doc_);
    fz_drop_context(ctx_);
}

int MuPdfDocument::page_count() const {
    int count = 0;
    fz_try(ctx_) {
        count = fz_count_pages(ctx_, doc_);
    }
    fz_catch(ctx_) {
        throw_caught(ctx_, "Failed to count pages of " + path_);
    }
    return count;
}

void MuPdfDocument::check_page(int page) const {
    if (page < 0 || page >= page_count()) {
        throw DocumentError("Page " + std::to_string(page) + " out of range for " + path_);
    }
}

pdf_document* MuPdfDocument::require_pdf(const char* operation) const {
    if (!pdf_) {
        throw DocumentError(std::string(operation) + " requires a PDF document: " + path_);
    }
    return pdf_;
}

PageSize MuPdfDocument::page_dimensions(int page) {
    check_page(page);
    fz_page* fzpage = nullptr;
    fz_rect bounds = fz_empty_rect;
    fz_var(fzpage);

    fz_try(ctx_) {
        fzpage = fz_load_page(ctx_, doc_, page);
        bounds = fz_bound_page(ctx_, fzpage);
    }
    fz_always(ctx_) {
        fz_drop_page(ctx_, fzpage);
    }
    fz_catch(ctx_) {
        throw_caught(ctx_, "Failed to measure page " + std::to_string(page));
    }

    return PageSize{bounds.x1 - bounds.x0, bounds.y1 - bounds.y0};
}

std::vector<LayoutBlock> MuPdfDocument::extract_fragments(int page) {
    check_page(page);
    fz_page* fzpage = nullptr;
    fz_stext_page* stext = nullptr;
    fz_var(fzpage);
    fz_var(stext);

    fz_try(ctx_) {
        fzpage = fz_load_page(ctx_, doc_, page);
        fz_stext_options opts;
        std::memset(&opts, 0, sizeof(opts));
        opts.flags = FZ_STEXT_PRESERVE_WHITESPACE | FZ_STEXT_PRESERVE_IMAGES;
        stext = fz_new_stext_page_from_page(ctx_, fzpage, &opts);
    }
    fz_catch(ctx_) {
        fz_drop_stext_page(ctx_, stext);
        fz_drop_page(ctx_, fzpage);
        throw_caught(ctx_, "Failed to extract text from page " + std::to_string(page));
    }

    std::vector<LayoutBlock> blocks;
    try {
        blocks = convert_stext(ctx_, stext);
    } catch (...) {
        fz_drop_stext_page(ctx_, stext);
        fz_drop_page(ctx_, fzpage);
        throw;
    }
    fz_drop_stext_page(ctx_, stext);
    fz_drop_page(ctx_, fzpage);
    return blocks;
}

std::vector<Rect> MuPdfDocument::extract_image_boxes(int page) {
    check_page(page);
    std::vector<Rect> boxes;
    fz_page* fzpage = nullptr;
    ImageBoxDevice* dev = nullptr;
    int overflow = 0;
    fz_var(fzpage);
    fz_var(dev);

    fz_try(ctx_) {
        fzpage = fz_load_page(ctx_, doc_, page);
        dev = fz_new_derived_device(ctx_, ImageBoxDevice);
        dev->super.fill_image = image_box_fill_image;
        dev->boxes = &boxes;
        fz_run_page(ctx_, fzpage, &dev->super, fz_identity, nullptr);
        fz_close_device(ctx_, &dev->super);
        overflow = dev->overflow;
    }
    fz_always(ctx_) {
        if (dev) fz_drop_device(ctx_, &dev->super);
        fz_drop_page(ctx_, fzpage);
    }
    fz_catch(ctx_) {
        throw_caught(ctx_, "Failed to list images on page " + std::to_string(page));
    }
    if (overflow) {
        throw DocumentError("Out of memory listing images on page " + std::to_string(page));
    }

    return boxes;
}

std::vector<Rect> MuPdfDocument::search_text(int page, const std::string& needle) {
    check_page(page);
    std::vector<Rect> matches;
    if (needle.empty()) return matches;

    std::vector<fz_quad> quads(kMaxSearchHits);
    std::vector<int> marks(kMaxSearchHits, 0);
    int count = 0;
    fz_page* fzpage = nullptr;
    fz_var(fzpage);

    fz_try(ctx_) {
        fzpage = fz_load_page(ctx_, doc_, page);
        count = fz_search_page(ctx_, fzpage, needle.c_str(), marks.data(),
                               quads.data(), kMaxSearchHits);
    }
    fz_always(ctx_) {
        fz_drop_page(ctx_, fzpage);
    }
    fz_catch(ctx_) {
        throw_caught(ctx_, "Search failed on page " + std::to_string(page));
    }

    // Quads of one hit that wraps across lines are merged into one box.
    for (int i = 0; i < count; ++i) {
        fz_rect r = fz_rect_from_quad(quads[i]);
        if (i == 0 || marks[i]) {
            matches.push_back(to_rect(r));
        } else {
            matches.back() = to_rect(fz_union_rect(to_fz_rect(matches.back()), r));
        }
    }

    return matches;
}

void MuPdfDocument::mark_redaction(int page, const Rect& rect) {
    check_page(page);
    pdf_document* pdf = require_pdf("Redaction");
    pdf_page* pdfpage = nullptr;
    pdf_annot* annot = nullptr;
    fz_var(pdfpage);
    fz_var(annot);

    fz_try(ctx_) {
        pdfpage = pdf_load_page(ctx_, pdf, page);
        annot = pdf_create_annot(ctx_, pdfpage, PDF_ANNOT_REDACT);
        pdf_set_annot_rect(ctx_, annot, to_fz_rect(rect));
    }
    fz_always(ctx_) {
        pdf_drop_annot(ctx_, annot);
        pdf_drop_page(ctx_, pdfpage);
    }
    fz_catch(ctx_) {
        throw_caught(ctx_, "Failed to mark redaction on page " + std::to_string(page));
    }
}

void MuPdfDocument::apply_redactions(int page) {
    check_page(page);
    pdf_document* pdf = require_pdf("Redaction");
    pdf_page* pdfpage = nullptr;
    fz_var(pdfpage);

    pdf_redact_options opts;
    std::memset(&opts, 0, sizeof(opts));
    opts.black_boxes = 0;
    opts.image_method = PDF_REDACT_IMAGE_PIXELS;
    opts.line_art = PDF_REDACT_LINE_ART_REMOVE_IF_COVERED;

    fz_try(ctx_) {
        pdfpage = pdf_load_page(ctx_, pdf, page);
        pdf_redact_page(ctx_, pdf, pdfpage, &opts);
    }
    fz_always(ctx_) {
        pdf_drop_page(ctx_, pdfpage);
    }
    fz_catch(ctx_) {
        throw_caught(ctx_, "Failed to apply redactions on page " + std::to_string(page));
    }
}

void MuPdfDocument::delete_page(int page) {
    check_page(page);
    pdf_document* pdf = require_pdf("Page deletion");

    fz_try(ctx_) {
        pdf_delete_page(ctx_, pdf, page);
    }
    fz_catch(ctx_) {
        throw_caught(ctx_, "Failed to delete page " + std::to_string(page));
    }
}

std::vector<TocEntry> MuPdfDocument::get_toc() {
    std::vector<TocEntry> toc;
    fz_outline* outline = nullptr;
    fz_var(outline);

    fz_try(ctx_) {
        outline = fz_load_outline(ctx_, doc_);
    }
    fz_catch(ctx_) {
        throw_caught(ctx_, "Failed to read outline of " + path_);
    }

    try {
        collect_outline(ctx_, doc_, outline, 1, toc);
    } catch (...) {
        fz_drop_outline(ctx_, outline);
        throw;
    }
    fz_drop_outline(ctx_, outline);
    return toc;
}

void MuPdfDocument::set_toc(const std::vector<TocEntry>& toc) {
    pdf_document* pdf = require_pdf("Bookmark writing");
    const int n = static_cast<int>(toc.size());
    const int total_pages = page_count();

    // Resolve the tree shape up front: parent[i] == -1 means top level.
    std::vector<int> parent(toc.size(), -1);
    std::vector<int> descendants(toc.size(), 0);
    std::vector<int> stack;
    for (int i = 0; i < n; ++i) {
        int level = std::max(1, std::min(toc[i].level, static_cast<int>(stack.size()) + 1));
        stack.resize(static_cast<size_t>(level - 1));
        parent[i] = stack.empty() ? -1 : stack.back();
        stack.push_back(i);
    }
    for (int i = n - 1; i >= 0; --i) {
        if (parent[i] >= 0) descendants[parent[i]] += descendants[i] + 1;
    }
    std::vector<pdf_obj*> items(toc.size(), nullptr);

    pdf_obj* outlines = nullptr;
    fz_var(outlines);

    fz_try(ctx_) {
        pdf_obj* root = pdf_dict_get(ctx_, pdf_trailer(ctx_, pdf), PDF_NAME(Root));
        pdf_dict_del(ctx_, root, PDF_NAME(Outlines));

        if (n > 0) {
            outlines = pdf_add_new_dict(ctx_, pdf, 4);
            pdf_dict_put(ctx_, outlines, PDF_NAME(Type), PDF_NAME(Outlines));

            for (int i = 0; i < n; ++i) {
                items[i] = pdf_add_new_dict(ctx_, pdf, 8);
                pdf_dict_put_text_string(ctx_, items[i], PDF_NAME(Title), toc[i].title.c_str());
                int index = toc[i].page - 1;
                if (index >= 0 && index < total_pages) {
                    pdf_obj* dest = pdf_dict_put_array(ctx_, items[i], PDF_NAME(Dest), 2);
                    pdf_array_push(ctx_, dest, pdf_lookup_page_obj(ctx_, pdf, index));
                    pdf_array_push(ctx_, dest, PDF_NAME(Fit));
                }
            }

            int top_last = -1;
            std::vector<int> last_child(toc.size(), -1);
            for (int i = 0; i < n; ++i) {
                int p = parent[i];
                pdf_obj* parent_obj = p >= 0 ? items[p] : outlines;
                pdf_dict_put(ctx_, items[i], PDF_NAME(Parent), parent_obj);

                int prev = p >= 0 ? last_child[p] : top_last;
                if (prev >= 0) {
                    pdf_dict_put(ctx_, items[prev], PDF_NAME(Next), items[i]);
                    pdf_dict_put(ctx_, items[i], PDF_NAME(Prev), items[prev]);
                } else {
                    pdf_dict_put(ctx_, parent_obj, PDF_NAME(First), items[i]);
                }
                pdf_dict_put(ctx_, parent_obj, PDF_NAME(Last), items[i]);
                if (p >= 0) last_child[p] = i; else top_last = i;

                if (descendants[i] > 0) {
                    pdf_dict_put_int(ctx_, items[i], PDF_NAME(Count), descendants[i]);
                }
            }
            pdf_dict_put_int(ctx_, outlines, PDF_NAME(Count), n);
            pdf_dict_put(ctx_, root, PDF_NAME(Outlines), outlines);
        }
    }
    fz_always(ctx_) {
        for (pdf_obj* item : items) pdf_drop_obj(ctx_, item);
        pdf_drop_obj(ctx_, outlines);
    }
    fz_catch(ctx_) {
        throw_caught(ctx_, "Failed to write bookmarks to " + path_);
    }
}

std::vector<unsigned char> MuPdfDocument::rasterize(int page, double scale) {
    check_page(page);
    fz_pixmap* pix = nullptr;
    fz_buffer* png = nullptr;
    fz_var(pix);
    fz_var(png);

    float s = static_cast<float>(scale);
    fz_try(ctx_) {
        pix = fz_new_pixmap_from_page_number(ctx_, doc_, page, fz_scale(s, s),
                                             fz_device_rgb(ctx_), 0);
        png = fz_new_buffer_from_pixmap_as_png(ctx_, pix, fz_default_color_params);
    }
    fz_always(ctx_) {
        fz_drop_pixmap(ctx_, pix);
    }
    fz_catch(ctx_) {
        fz_drop_buffer(ctx_, png);
        throw_caught(ctx_, "Failed to render page " + std::to_string(page));
    }

    std::vector<unsigned char> bytes = buffer_bytes(ctx_, png);
    fz_drop_buffer(ctx_, png);
    return bytes;
}

void MuPdfDocument::save(const std::string& path, bool compact) {
    pdf_document* pdf = require_pdf("Saving");
    pdf_write_options opts = make_write_options(compact);

    fz_try(ctx_) {
        pdf_save_document(ctx_, pdf, path.c_str(), &opts);
    }
    fz_catch(ctx_) {
        throw_caught(ctx_, "Failed to save " + path);
    }
}

std::vector<unsigned char> MuPdfDocument::to_bytes(bool compact) {
    pdf_document* pdf = require_pdf("Serialization");
    pdf_write_options opts = make_write_options(compact);
    fz_buffer* buf = nullptr;
    fz_output* out = nullptr;
    fz_var(buf);
    fz_var(out);

    fz_try(ctx_) {
        buf = fz_new_buffer(ctx_, 64 * 1024);
        out = fz_new_output_with_buffer(ctx_, buf);
        pdf_write_document(ctx_, pdf, out, &opts);
        fz_close_output(ctx_, out);
    }
    fz_always(ctx_) {
        fz_drop_output(ctx_, out);
    }
    fz_catch(ctx_) {
        fz_drop_buffer(ctx_, buf);
        throw_caught(ctx_, "Failed to serialize " + path_);
    }

    std::vector<unsigned char> bytes = buffer_bytes(ctx_, buf);
    fz_drop_buffer(ctx_, buf);
    return bytes;
}

// ============================================================================
// MuPdfEngine
// ============================================================================

MuPdfEngine::MuPdfEngine() : ctx_(fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT)) {
    if (!ctx_) {
        throw DocumentError("Failed to create MuPDF context");
    }
}

MuPdfEngine::~MuPdfEngine() {
    fz_drop_context(ctx_);
}

std::string MuPdfEngine::library_version() {
    return FZ_VERSION;
}

std::unique_ptr<Document> MuPdfEngine::open(const std::string& path) {
    fz_context* ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!ctx) {
        throw DocumentError("Failed to create MuPDF context");
    }

    fz_document* doc = nullptr;
    bool locked = false;
    fz_var(doc);

    fz_try(ctx) {
        fz_register_document_handlers(ctx);
        doc = fz_open_document(ctx, path.c_str());
        locked = fz_needs_password(ctx, doc) != 0;
    }
    fz_catch(ctx) {
        std::string message = std::string("Failed to open ") + path + ": " + fz_caught_message(ctx);
        fz_drop_document(ctx, doc);
        fz_drop_context(ctx);
        throw DocumentError(message);
    }

    if (locked) {
        fz_drop_document(ctx, doc);
        fz_drop_context(ctx);
        throw DocumentError("Document is password protected: " + path);
    }

    try {
        return std::make_unique<MuPdfDocument>(ctx, doc, path);
    } catch (const std::bad_alloc&) {
        fz_drop_document(ctx, doc);
        fz_drop_context(ctx);
        throw;
    }
}

std::string MuPdfEngine::encode_base64(const std::vector<unsigned char>& data) {
    fz_buffer* buf = nullptr;
    fz_output* out = nullptr;
    fz_var(buf);
    fz_var(out);

    fz_try(ctx_) {
        buf = fz_new_buffer(ctx_, data.size() / 3 * 4 + 8);
        out = fz_new_output_with_buffer(ctx_, buf);
        fz_write_base64(ctx_, out, data.data(), data.size(), 0);
        fz_close_output(ctx_, out);
    }
    fz_always(ctx_) {
        fz_drop_output(ctx_, out);
    }
    fz_catch(ctx_) {
        fz_drop_buffer(ctx_, buf);
        throw_caught(ctx_, "Base64 encoding failed");
    }

    unsigned char* bytes = nullptr;
    size_t len = fz_buffer_storage(ctx_, buf, &bytes);
    std::string encoded(reinterpret_cast<const char*>(bytes), len);
    fz_drop_buffer(ctx_, buf);
    return encoded;
}

} // namespace ds
