#include <gtest/gtest.h>
#include "redact/redaction_orchestrator.hpp"
#include "fake_document.hpp"

using namespace ds;
using namespace ds::testing_support;

class RedactionOrchestratorTest : public ::testing::Test {
protected:
    RedactionOrchestrator orchestrator;
    FakeDocument doc = FakeDocument::with_pages(10);

    static RedactionRegion region(int page, double x, double y, double w, double h,
                                  const std::string& text = "", bool is_image = false) {
        RedactionRegion r;
        r.page = page;
        r.x = x;
        r.y = y;
        r.width = w;
        r.height = h;
        r.text = text;
        r.is_image = is_image;
        return r;
    }

    static void expect_rect(const Rect& actual, const Rect& expected) {
        EXPECT_DOUBLE_EQ(actual.x0, expected.x0);
        EXPECT_DOUBLE_EQ(actual.y0, expected.y0);
        EXPECT_DOUBLE_EQ(actual.x1, expected.x1);
        EXPECT_DOUBLE_EQ(actual.y1, expected.y1);
    }
};

// ==========================================
// Page Deletion
// ==========================================

TEST_F(RedactionOrchestratorTest, DeletesPagesWithoutShiftingIndices) {
    RedactionRequest request;
    request.deleted_pages = {3, 5, 7};

    RedactionReport report = orchestrator.apply(doc, request);

    EXPECT_EQ(doc.page_count(), 7);
    EXPECT_EQ(doc.labels(), (std::vector<int>{0, 1, 2, 4, 6, 8, 9}));
    EXPECT_EQ(report.pages_deleted, (std::vector<int>{7, 5, 3}));
    EXPECT_EQ(report.final_page_count, 7);
}

TEST_F(RedactionOrchestratorTest, DeletionOrderIgnoresInputOrder) {
    RedactionRequest request;
    request.deleted_pages = {7, 3, 5, 3};
    orchestrator.apply(doc, request);
    EXPECT_EQ(doc.labels(), (std::vector<int>{0, 1, 2, 4, 6, 8, 9}));
}

TEST_F(RedactionOrchestratorTest, OutOfRangeDeletionsSkipped) {
    RedactionRequest request;
    request.deleted_pages = {12, 9, -1};
    RedactionReport report = orchestrator.apply(doc, request);

    EXPECT_EQ(doc.page_count(), 9);
    EXPECT_EQ(report.pages_skipped, 2);
    EXPECT_EQ(report.pages_deleted, (std::vector<int>{9}));
}

TEST_F(RedactionOrchestratorTest, DeletionOrderHelper) {
    EXPECT_EQ(RedactionOrchestrator::deletion_order({3, 7, 5, 3}), (std::vector<int>{7, 5, 3}));
    EXPECT_TRUE(RedactionOrchestrator::deletion_order({}).empty());
}

// ==========================================
// Region Redaction
// ==========================================

TEST_F(RedactionOrchestratorTest, TextMissFallsBackToRequestedRect) {
    RedactionRequest request;
    request.regions = {region(2, 100, 100, 200, 20, "CONFIDENTIAL")};

    RedactionReport report = orchestrator.apply(doc, request);

    ASSERT_EQ(doc.applied.size(), 1u);
    EXPECT_EQ(doc.applied[0].label, 2);
    expect_rect(doc.applied[0].rect, Rect{100, 100, 300, 120});
    EXPECT_EQ(report.regions_coordinate_fallback, 1);
    EXPECT_EQ(report.regions_text_matched, 0);
}

TEST_F(RedactionOrchestratorTest, TextHitMustOverlapRequestedRect) {
    doc.pages[2].hits["CONFIDENTIAL"] = {
        Rect{400, 600, 480, 612},      // same word elsewhere on the page
        Rect{104, 101, 190, 115},
    };
    RedactionRequest request;
    request.regions = {region(2, 100, 100, 200, 20, "CONFIDENTIAL")};

    RedactionReport report = orchestrator.apply(doc, request);

    ASSERT_EQ(doc.applied.size(), 1u);
    expect_rect(doc.applied[0].rect, Rect{104, 101, 190, 115});
    EXPECT_EQ(report.regions_text_matched, 1);
}

TEST_F(RedactionOrchestratorTest, NonOverlappingHitFallsBack) {
    doc.pages[2].hits["CONFIDENTIAL"] = {Rect{400, 600, 480, 612}};
    RedactionRequest request;
    request.regions = {region(2, 100, 100, 200, 20, "CONFIDENTIAL")};

    orchestrator.apply(doc, request);

    ASSERT_EQ(doc.applied.size(), 1u);
    expect_rect(doc.applied[0].rect, Rect{100, 100, 300, 120});
}

TEST_F(RedactionOrchestratorTest, ImageRegionsUseCoordinates) {
    doc.pages[1].hits["[Image 100x50]"] = {Rect{50, 50, 150, 100}};
    RedactionRequest request;
    request.regions = {region(1, 10, 10, 100, 50, "[Image 100x50]", true), region(1, 0, 0, 5, 5)};

    RedactionReport report = orchestrator.apply(doc, request);

    ASSERT_EQ(doc.applied.size(), 2u);
    expect_rect(doc.applied[0].rect, Rect{10, 10, 110, 60});
    EXPECT_EQ(report.regions_coordinate, 2);
}

TEST_F(RedactionOrchestratorTest, AppliesOncePerPage) {
    RedactionRequest request;
    request.regions = {region(4, 0, 0, 10, 10), region(4, 20, 20, 10, 10), region(6, 0, 0, 10, 10)};

    RedactionReport report = orchestrator.apply(doc, request);

    EXPECT_EQ(doc.pages[4].apply_calls, 1);
    EXPECT_EQ(doc.pages[6].apply_calls, 1);
    EXPECT_EQ(doc.pages[5].apply_calls, 0);
    EXPECT_EQ(report.pages_redacted, 2);
}

TEST_F(RedactionOrchestratorTest, RegionsOnMissingOrDeletedPagesSkipped) {
    RedactionRequest request;
    request.regions = {region(15, 0, 0, 10, 10), region(3, 0, 0, 10, 10), region(-2, 0, 0, 1, 1)};
    request.deleted_pages = {3};

    RedactionReport report = orchestrator.apply(doc, request);

    EXPECT_TRUE(doc.applied.empty());
    EXPECT_EQ(report.regions_skipped, 3);
    EXPECT_EQ(report.pages_redacted, 0);
}

TEST_F(RedactionOrchestratorTest, RedactionUsesOriginalNumbering) {
    RedactionRequest request;
    request.regions = {region(8, 0, 0, 10, 10)};
    request.deleted_pages = {3};

    orchestrator.apply(doc, request);

    ASSERT_EQ(doc.applied.size(), 1u);
    EXPECT_EQ(doc.applied[0].label, 8);
}

// ==========================================
// Bookmarks
// ==========================================

TEST_F(RedactionOrchestratorTest, BookmarksConvertedToNativeNumbering) {
    doc.toc = {{1, "Old entry", 1}};
    RedactionRequest request;
    request.bookmarks = {Bookmark{"Intro", 0, 1}, Bookmark{"Chapter Two", 5, 2}};

    RedactionReport report = orchestrator.apply(doc, request);

    ASSERT_EQ(doc.toc.size(), 2u);
    EXPECT_EQ(doc.toc[0].page, 1);
    EXPECT_EQ(doc.toc[1].title, "Chapter Two");
    EXPECT_EQ(doc.toc[1].page, 6);
    EXPECT_EQ(doc.toc[1].level, 2);
    EXPECT_EQ(report.bookmarks_written, 2);
}

TEST_F(RedactionOrchestratorTest, NoBookmarksKeepsExistingOutline) {
    doc.toc = {{1, "Existing", 3}};
    orchestrator.apply(doc, RedactionRequest());
    ASSERT_EQ(doc.toc.size(), 1u);
    EXPECT_EQ(doc.toc[0].title, "Existing");
}

TEST_F(RedactionOrchestratorTest, OutlineReadBackZeroIndexed) {
    FakeEngine engine;
    FakeDocument book = FakeDocument::with_pages(3);
    book.toc = {{1, "Part One", 1}, {2, "Opening", 3}};
    engine.files["book.pdf"] = book;

    auto bookmarks = orchestrator.extract_outline(engine, "book.pdf");
    ASSERT_EQ(bookmarks.size(), 2u);
    EXPECT_EQ(bookmarks[0].page, 0);
    EXPECT_EQ(bookmarks[1].page, 2);
    EXPECT_EQ(bookmarks[1].level, 2);
}

// ==========================================
// Files
// ==========================================

TEST_F(RedactionOrchestratorTest, RedactFileSavesCompactedCopy) {
    FakeEngine engine;
    engine.files["in.pdf"] = FakeDocument::with_pages(4);

    RedactionRequest request;
    request.regions = {region(0, 0, 0, 10, 10)};
    request.deleted_pages = {1};

    RedactionReport report = orchestrator.redact_file(engine, "in.pdf", "out.pdf", request);

    ASSERT_EQ(engine.saved.count("out.pdf"), 1u);
    const FakeDocument& out = engine.saved["out.pdf"];
    EXPECT_EQ(out.page_count(), 3);
    EXPECT_TRUE(out.last_save_compact);
    EXPECT_EQ(out.applied.size(), 1u);
    EXPECT_EQ(report.final_page_count, 3);
    EXPECT_EQ(engine.files["in.pdf"].page_count(), 4);
}

TEST_F(RedactionOrchestratorTest, RedactFileMissingInputThrows) {
    FakeEngine engine;
    EXPECT_THROW(orchestrator.redact_file(engine, "nope.pdf", "out.pdf", RedactionRequest()),
                 DocumentError);
    EXPECT_TRUE(engine.saved.empty());
}

TEST_F(RedactionOrchestratorTest, ExportPdfIgnoresText) {
    FakeEngine engine;
    FakeDocument src = FakeDocument::with_pages(2);
    src.pages[0].hits["secret"] = {Rect{0, 0, 5, 5}};
    engine.files["doc.pdf"] = src;

    auto bytes = orchestrator.export_pdf(engine, "doc.pdf",
                                         {region(0, 1, 1, 2, 2, "secret"), region(9, 0, 0, 1, 1)});
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()), "pdf:2:1");
}

// ==========================================
// Request Parsing
// ==========================================

TEST_F(RedactionOrchestratorTest, RequestFromJson) {
    auto j = nlohmann::json::parse(R"({
        "regions": [
            {"page": 1, "x": 10, "y": 20, "width": 30, "height": 40, "text": "Name", "isImage": false},
            {"page": 2, "x": 0, "y": 0, "width": 5, "height": 5, "is_image": true}
        ],
        "deletedPages": [4, 2],
        "bookmarks": [{"title": "Start", "page": 0}, {"page": 3, "level": 2}]
    })");

    RedactionRequest request = RedactionRequest::from_json(j);
    ASSERT_EQ(request.regions.size(), 2u);
    EXPECT_EQ(request.regions[0].text, "Name");
    EXPECT_TRUE(request.regions[0].uses_text_search());
    EXPECT_TRUE(request.regions[1].is_image);
    EXPECT_FALSE(request.regions[1].uses_text_search());
    EXPECT_EQ(request.deleted_pages, (std::vector<int>{4, 2}));
    ASSERT_EQ(request.bookmarks.size(), 2u);
    EXPECT_EQ(request.bookmarks[1].title, "Untitled");
    EXPECT_EQ(request.bookmarks[0].level, 1);
}

TEST_F(RedactionOrchestratorTest, RegionMissingGeometryRejected) {
    auto j = nlohmann::json::parse(R"({"regions": [{"page": 1, "x": 10}]})");
    EXPECT_THROW(RedactionRequest::from_json(j), nlohmann::json::exception);
}

TEST_F(RedactionOrchestratorTest, ReportJson) {
    RedactionReport report;
    report.pages_deleted = {5, 2};
    report.bookmarks_written = 1;
    auto j = report.to_json();
    EXPECT_EQ(j["pages_deleted"], nlohmann::json::array({5, 2}));
    EXPECT_EQ(j["bookmarks_written"], 1);
}
