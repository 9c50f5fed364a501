#include "redact/redaction_orchestrator.hpp"
#include <algorithm>
#include <fstream>
#include <functional>
#include <iostream>
#include <set>
#include <stdexcept>

namespace ds {

// ============================================================================
// Request Types
// ============================================================================

RedactionRegion RedactionRegion::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Redaction region must be an object");
    }
    RedactionRegion r;
    r.page = j.at("page").get<int>();
    r.x = j.at("x").get<double>();
    r.y = j.at("y").get<double>();
    r.width = j.at("width").get<double>();
    r.height = j.at("height").get<double>();
    if (j.contains("text") && j["text"].is_string()) {
        r.text = j["text"].get<std::string>();
    }
    if (j.contains("isImage")) {
        r.is_image = j["isImage"].get<bool>();
    } else if (j.contains("is_image")) {
        r.is_image = j["is_image"].get<bool>();
    }
    return r;
}

Bookmark Bookmark::from_json(const nlohmann::json& j) {
    Bookmark b;
    b.title = j.value("title", "Untitled");
    b.page = j.value("page", 0);
    b.level = j.value("level", 1);
    return b;
}

RedactionRequest RedactionRequest::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Redaction request must be an object");
    }
    RedactionRequest req;

    if (j.contains("regions")) {
        for (const auto& region : j["regions"]) {
            req.regions.push_back(RedactionRegion::from_json(region));
        }
    }

    const char* deleted_key = j.contains("deletedPages") ? "deletedPages" : "deleted_pages";
    if (j.contains(deleted_key)) {
        req.deleted_pages = j[deleted_key].get<std::vector<int>>();
    }

    if (j.contains("bookmarks")) {
        for (const auto& bm : j["bookmarks"]) {
            req.bookmarks.push_back(Bookmark::from_json(bm));
        }
    }

    return req;
}

RedactionRequest RedactionRequest::load_from_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open regions file: " + path);
    }
    nlohmann::json j;
    file >> j;
    return from_json(j);
}

nlohmann::json RedactionReport::to_json() const {
    nlohmann::json j;
    j["pages_redacted"] = pages_redacted;
    j["regions_text_matched"] = regions_text_matched;
    j["regions_coordinate_fallback"] = regions_coordinate_fallback;
    j["regions_coordinate"] = regions_coordinate;
    j["regions_skipped"] = regions_skipped;
    j["pages_deleted"] = pages_deleted;
    j["pages_skipped"] = pages_skipped;
    j["bookmarks_written"] = bookmarks_written;
    j["final_page_count"] = final_page_count;
    return j;
}

// ============================================================================
// RedactionOrchestrator
// ============================================================================

std::map<int, std::vector<RedactionRegion>> RedactionOrchestrator::group_by_page(
    const std::vector<RedactionRegion>& regions) {
    std::map<int, std::vector<RedactionRegion>> by_page;
    for (const auto& region : regions) {
        by_page[region.page].push_back(region);
    }
    return by_page;
}

std::vector<int> RedactionOrchestrator::deletion_order(const std::vector<int>& pages) {
    std::set<int, std::greater<int>> unique(pages.begin(), pages.end());
    return std::vector<int>(unique.begin(), unique.end());
}

std::vector<TocEntry> RedactionOrchestrator::to_native_toc(const std::vector<Bookmark>& bookmarks) {
    std::vector<TocEntry> toc;
    toc.reserve(bookmarks.size());
    for (const auto& bm : bookmarks) {
        toc.push_back(TocEntry{bm.level, bm.title, bm.page + 1});
    }
    return toc;
}

std::vector<Bookmark> RedactionOrchestrator::from_native_toc(const std::vector<TocEntry>& toc) {
    std::vector<Bookmark> bookmarks;
    bookmarks.reserve(toc.size());
    for (const auto& entry : toc) {
        Bookmark bm;
        bm.title = entry.title;
        bm.page = std::max(0, entry.page - 1);
        bm.level = std::max(1, entry.level);
        bookmarks.push_back(bm);
    }
    return bookmarks;
}

std::vector<Bookmark> RedactionOrchestrator::extract_outline(DocumentEngine& engine,
                                                             const std::string& path) const {
    std::unique_ptr<Document> doc = engine.open(path);
    return from_native_toc(doc->get_toc());
}

void RedactionOrchestrator::redact_page(Document& doc, int page,
                                        const std::vector<RedactionRegion>& regions,
                                        RedactionReport& report) const {
    for (const auto& region : regions) {
        Rect requested = region.to_rect();

        if (!region.uses_text_search()) {
            doc.mark_redaction(page, requested);
            report.regions_coordinate++;
            continue;
        }

        // Prefer the exact search hit; the requested rectangle may have
        // drifted since analysis.
        bool matched = false;
        for (const auto& hit : doc.search_text(page, region.text)) {
            if (hit.intersects(requested)) {
                doc.mark_redaction(page, hit);
                matched = true;
                break;
            }
        }

        if (matched) {
            report.regions_text_matched++;
        } else {
            doc.mark_redaction(page, requested);
            report.regions_coordinate_fallback++;
        }
    }

    doc.apply_redactions(page);
    report.pages_redacted++;
}

RedactionReport RedactionOrchestrator::apply(Document& doc, const RedactionRequest& request) const {
    RedactionReport report;
    const std::set<int> deleted(request.deleted_pages.begin(), request.deleted_pages.end());

    const int total_pages = doc.page_count();
    for (const auto& [page, regions] : group_by_page(request.regions)) {
        if (page < 0 || page >= total_pages || deleted.count(page)) {
            report.regions_skipped += static_cast<int>(regions.size());
            continue;
        }
        redact_page(doc, page, regions, report);
    }

    for (int page : deletion_order(request.deleted_pages)) {
        if (page < 0 || page >= doc.page_count()) {
            report.pages_skipped++;
            continue;
        }
        doc.delete_page(page);
        report.pages_deleted.push_back(page);
    }

    if (!request.bookmarks.empty()) {
        doc.set_toc(to_native_toc(request.bookmarks));
        report.bookmarks_written = static_cast<int>(request.bookmarks.size());
    }

    report.final_page_count = doc.page_count();

    if (verbose_) {
        std::cerr << "Redacted " << report.pages_redacted << " pages ("
                  << report.regions_text_matched << " text matches, "
                  << report.regions_coordinate_fallback << " fallbacks, "
                  << report.regions_coordinate << " coordinate regions), deleted "
                  << report.pages_deleted.size() << " pages" << std::endl;
        if (report.bookmarks_written > 0) {
            std::cerr << "Added " << report.bookmarks_written << " bookmarks" << std::endl;
        }
    }

    return report;
}

RedactionReport RedactionOrchestrator::redact_file(DocumentEngine& engine,
                                                   const std::string& input_path,
                                                   const std::string& output_path,
                                                   const RedactionRequest& request,
                                                   bool compact) const {
    std::unique_ptr<Document> doc = engine.open(input_path);
    RedactionReport report = apply(*doc, request);
    doc->save(output_path, compact);

    if (verbose_) {
        std::cerr << "Redacted PDF saved to " << output_path << std::endl;
    }
    return report;
}

std::vector<unsigned char> RedactionOrchestrator::export_pdf(
    DocumentEngine& engine,
    const std::string& path,
    const std::vector<RedactionRegion>& regions,
    bool compact) const {
    std::unique_ptr<Document> doc = engine.open(path);
    const int total_pages = doc->page_count();

    for (const auto& [page, page_regions] : group_by_page(regions)) {
        if (page < 0 || page >= total_pages) {
            continue;
        }
        for (const auto& region : page_regions) {
            doc->mark_redaction(page, region.to_rect());
        }
        doc->apply_redactions(page);
    }

    return doc->to_bytes(compact);
}

} // namespace ds
