#pragma once

#include "engine/document.hpp"
#include <string>
#include <vector>
#include <memory>

struct fz_context;
struct fz_document;
struct pdf_document;

namespace ds {

/**
 * @brief Document backed by MuPDF
 *
 * Each document owns its own fz_context, so documents never share MuPDF
 * state. Mutating operations require a PDF; other formats MuPDF can open
 * (XPS, EPUB, CBZ) support the read-only operations only.
 */
class MuPdfDocument : public Document {
public:
    MuPdfDocument(fz_context* ctx, fz_document* doc, const std::string& path);
    ~MuPdfDocument() override;

    MuPdfDocument(const MuPdfDocument&) = delete;
    MuPdfDocument& operator=(const MuPdfDocument&) = delete;

    int page_count() const override;
    PageSize page_dimensions(int page) override;
    std::vector<LayoutBlock> extract_fragments(int page) override;
    std::vector<Rect> extract_image_boxes(int page) override;
    std::vector<Rect> search_text(int page, const std::string& needle) override;
    void mark_redaction(int page, const Rect& rect) override;
    void apply_redactions(int page) override;
    void delete_page(int page) override;
    std::vector<TocEntry> get_toc() override;
    void set_toc(const std::vector<TocEntry>& toc) override;
    std::vector<unsigned char> rasterize(int page, double scale) override;
    void save(const std::string& path, bool compact = true) override;
    std::vector<unsigned char> to_bytes(bool compact = true) override;

    const std::string& get_path() const { return path_; }

private:
    fz_context* ctx_;
    fz_document* doc_;
    pdf_document* pdf_;
    std::string path_;

    void check_page(int page) const;
    pdf_document* require_pdf(const char* operation) const;
};

/**
 * @brief DocumentEngine implementation using MuPDF
 */
class MuPdfEngine : public DocumentEngine {
public:
    MuPdfEngine();
    ~MuPdfEngine() override;

    MuPdfEngine(const MuPdfEngine&) = delete;
    MuPdfEngine& operator=(const MuPdfEngine&) = delete;

    std::unique_ptr<Document> open(const std::string& path) override;
    std::string encode_base64(const std::vector<unsigned char>& data) override;
    std::string get_name() const override { return "mupdf"; }

    /**
     * @brief Version string of the linked MuPDF library
     */
    static std::string library_version();

private:
    fz_context* ctx_;
};

} // namespace ds
