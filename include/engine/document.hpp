#pragma once

#include <string>
#include <vector>
#include <memory>
#include <stdexcept>

namespace ds {

// ============================================================================
// Geometry
// ============================================================================

/**
 * @brief Axis-aligned rectangle in top-left-origin page units
 */
struct Rect {
    double x0 = 0.0;
    double y0 = 0.0;
    double x1 = 0.0;
    double y1 = 0.0;

    double width() const { return x1 - x0; }
    double height() const { return y1 - y0; }
    bool is_empty() const { return x1 <= x0 || y1 <= y0; }

    /**
     * @brief True if both rectangles share a region of non-zero area
     */
    bool intersects(const Rect& other) const {
        if (is_empty() || other.is_empty()) return false;
        return x0 < other.x1 && other.x0 < x1 &&
               y0 < other.y1 && other.y0 < y1;
    }

    static Rect from_xywh(double x, double y, double w, double h) {
        return Rect{x, y, x + w, y + h};
    }
};

struct PageSize {
    double width = 0.0;
    double height = 0.0;
};

// ============================================================================
// Raw Fragments
// ============================================================================

/**
 * @brief Span style bits reported by the engine
 */
enum SpanFlags : int {
    kSpanSuperscript = 1,
    kSpanItalic = 2,
    kSpanSerifed = 4,
    kSpanMonospaced = 8,
    kSpanBold = 16
};

/**
 * @brief Run of characters sharing one font, size and style
 */
struct TextSpan {
    std::string text;              ///< UTF-8 text
    std::string font_name;         ///< Font name without subset prefix
    double font_size = 0.0;        ///< Size in points
    int flags = 0;                 ///< SpanFlags bits
    Rect bbox;
};

struct TextLine {
    Rect bbox;
    std::vector<TextSpan> spans;
};

/**
 * @brief Layout block as grouped by the engine
 *
 * Image blocks have is_text == false and no lines.
 */
struct LayoutBlock {
    Rect bbox;
    bool is_text = true;
    std::vector<TextLine> lines;
};

/**
 * @brief Table-of-contents entry in the engine's native numbering
 */
struct TocEntry {
    int level = 1;                 ///< Hierarchy level (1-based)
    std::string title;
    int page = 1;                  ///< Page number (1-indexed)
};

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Raised when the engine cannot open or operate on a document
 */
class DocumentError : public std::runtime_error {
public:
    explicit DocumentError(const std::string& message)
        : std::runtime_error(message) {}
};

// ============================================================================
// Document Interface
// ============================================================================

/**
 * @brief An open paginated document
 *
 * Pages are addressed 0-indexed everywhere except TocEntry::page. The
 * document is closed when the object is destroyed.
 */
class Document {
public:
    virtual ~Document() = default;

    virtual int page_count() const = 0;

    /**
     * @brief Width and height of a page
     * @throws DocumentError if the page does not exist
     */
    virtual PageSize page_dimensions(int page) = 0;

    /**
     * @brief Text and image layout blocks of a page, in extraction order
     */
    virtual std::vector<LayoutBlock> extract_fragments(int page) = 0;

    /**
     * @brief Bounding boxes of every image drawn on a page
     */
    virtual std::vector<Rect> extract_image_boxes(int page) = 0;

    /**
     * @brief Boxes of every occurrence of a literal string on a page
     */
    virtual std::vector<Rect> search_text(int page, const std::string& needle) = 0;

    /**
     * @brief Mark a region for removal; nothing changes until apply_redactions
     */
    virtual void mark_redaction(int page, const Rect& rect) = 0;

    /**
     * @brief Remove text, line art and image pixels under every marked region
     */
    virtual void apply_redactions(int page) = 0;

    virtual void delete_page(int page) = 0;

    virtual std::vector<TocEntry> get_toc() = 0;

    /**
     * @brief Replace the whole table of contents
     */
    virtual void set_toc(const std::vector<TocEntry>& toc) = 0;

    /**
     * @brief Render a page to PNG bytes
     */
    virtual std::vector<unsigned char> rasterize(int page, double scale) = 0;

    virtual void save(const std::string& path, bool compact = true) = 0;
    virtual std::vector<unsigned char> to_bytes(bool compact = true) = 0;
};

/**
 * @brief Factory for documents
 *
 * Implementations wrap a concrete rendering library.
 */
class DocumentEngine {
public:
    virtual ~DocumentEngine() = default;

    /**
     * @brief Open a document
     * @throws DocumentError if the file cannot be opened
     */
    virtual std::unique_ptr<Document> open(const std::string& path) = 0;

    /**
     * @brief Base64-encode bytes for transport
     */
    virtual std::string encode_base64(const std::vector<unsigned char>& data) = 0;

    virtual std::string get_name() const = 0;
};

} // namespace ds
