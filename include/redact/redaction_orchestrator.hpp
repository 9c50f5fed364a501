#pragma once

#include "engine/document.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace ds {

// ============================================================================
// Request Types
// ============================================================================

/**
 * @brief A rectangle to remove, in top-left-origin page units
 */
struct RedactionRegion {
    int page = 0;                  ///< 0-indexed
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    std::string text;              ///< Literal text expected inside, optional
    bool is_image = false;

    Rect to_rect() const { return Rect::from_xywh(x, y, width, height); }

    /**
     * @brief True if the region should be located by text search first
     */
    bool uses_text_search() const { return !text.empty() && !is_image; }

    static RedactionRegion from_json(const nlohmann::json& j);
};

/**
 * @brief Bookmark to write, with a 0-indexed page
 */
struct Bookmark {
    std::string title = "Untitled";
    int page = 0;
    int level = 1;

    nlohmann::json to_json() const {
        return {{"title", title}, {"page", page}, {"level", level}};
    }

    static Bookmark from_json(const nlohmann::json& j);
};

struct RedactionRequest {
    std::vector<RedactionRegion> regions;
    std::vector<int> deleted_pages;          ///< 0-indexed, any order
    std::vector<Bookmark> bookmarks;         ///< Empty keeps the existing outline

    /**
     * @brief Parse {"regions": [...], "deletedPages": [...], "bookmarks": [...]}
     */
    static RedactionRequest from_json(const nlohmann::json& j);

    static RedactionRequest load_from_json(const std::string& path);
};

/**
 * @brief What a redaction run actually did
 */
struct RedactionReport {
    int pages_redacted = 0;
    int regions_text_matched = 0;            ///< Redacted at the search hit
    int regions_coordinate_fallback = 0;     ///< Text given but no overlapping hit
    int regions_coordinate = 0;              ///< Image or no text
    int regions_skipped = 0;                 ///< Page missing or being deleted
    std::vector<int> pages_deleted;          ///< Original indices, in deletion order
    int pages_skipped = 0;                   ///< Deletion indices out of range
    int bookmarks_written = 0;
    int final_page_count = 0;

    nlohmann::json to_json() const;
};

// ============================================================================
// Redaction Orchestrator
// ============================================================================

/**
 * @brief Applies region redactions, page deletions and bookmarks
 *
 * Regions are grouped by page and applied in one batch per page. Pages are
 * deleted from the highest index down so pending indices stay valid.
 * Indices past the current page count are skipped, never an error.
 */
class RedactionOrchestrator {
public:
    RedactionOrchestrator() = default;

    /**
     * @brief Redact, delete pages and rewrite bookmarks on an open document
     */
    RedactionReport apply(Document& doc, const RedactionRequest& request) const;

    /**
     * @brief Open input, apply the request and save a compacted copy
     */
    RedactionReport redact_file(DocumentEngine& engine,
                                const std::string& input_path,
                                const std::string& output_path,
                                const RedactionRequest& request,
                                bool compact = true) const;

    /**
     * @brief Coordinate-only redaction returning the compacted document bytes
     */
    std::vector<unsigned char> export_pdf(DocumentEngine& engine,
                                          const std::string& path,
                                          const std::vector<RedactionRegion>& regions,
                                          bool compact = true) const;

    static std::map<int, std::vector<RedactionRegion>> group_by_page(
        const std::vector<RedactionRegion>& regions);

    /**
     * @brief Unique page indices, highest first
     */
    static std::vector<int> deletion_order(const std::vector<int>& pages);

    /**
     * @brief Bookmarks converted to the engine's 1-indexed numbering
     */
    static std::vector<TocEntry> to_native_toc(const std::vector<Bookmark>& bookmarks);

    /**
     * @brief Engine outline converted back to 0-indexed bookmarks
     */
    static std::vector<Bookmark> from_native_toc(const std::vector<TocEntry>& toc);

    /**
     * @brief Read the existing outline of a document, flattened
     */
    std::vector<Bookmark> extract_outline(DocumentEngine& engine, const std::string& path) const;

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    bool verbose_ = false;

    void redact_page(Document& doc, int page, const std::vector<RedactionRegion>& regions,
                     RedactionReport& report) const;
};

} // namespace ds
