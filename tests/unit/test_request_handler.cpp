#include <gtest/gtest.h>
#include "service/request_handler.hpp"
#include "fake_document.hpp"
#include <sstream>
#include <stdexcept>

using namespace ds;
using namespace ds::testing_support;

using json = nlohmann::json;

class RequestHandlerTest : public ::testing::Test {
protected:
    FakeEngine engine;
    std::unique_ptr<RequestHandler> handler;

    void SetUp() override {
        FakeDocument book = FakeDocument::with_pages(3);
        for (int p = 0; p < 3; ++p) {
            book.pages[p].layout = {
                make_text_block(Rect{72, 100, 400, 116}, "Chapter " + std::to_string(p + 1),
                                12.0, "Times-Bold", kSpanBold),
                make_text_block(Rect{72, 150, 540, 300}, std::string(250, 'w'), 10.0,
                                "Times-Roman", 0, 6),
            };
        }
        book.toc = {{1, "Chapter 1", 1}, {1, "Chapter 2", 2}};
        engine.files["book.pdf"] = book;

        handler = std::make_unique<RequestHandler>(engine);
    }

    json call(const std::string& method, json args = json::array()) {
        return handler->handle({{"method", method}, {"args", args}});
    }
};

// ==========================================
// Dispatch
// ==========================================

TEST_F(RequestHandlerTest, UnknownMethod) {
    json response = call("frobnicate");
    EXPECT_EQ(response["error"], "Unknown method: frobnicate");
}

TEST_F(RequestHandlerTest, MalformedRequests) {
    EXPECT_TRUE(handler->handle(json::array()).contains("error"));
    EXPECT_TRUE(handler->handle({{"method", "analyze"}, {"args", "book.pdf"}}).contains("error"));
    EXPECT_TRUE(call("analyze").contains("error"));
}

TEST_F(RequestHandlerTest, InvalidJsonLine) {
    json response = handler->handle_line("{not json");
    ASSERT_TRUE(response.contains("error"));
    EXPECT_EQ(response["error"].get<std::string>().rfind("Invalid JSON", 0), 0u);
}

TEST_F(RequestHandlerTest, ListsMethods) {
    auto methods = handler->get_methods();
    EXPECT_EQ(methods.size(), 8u);
}

TEST_F(RequestHandlerTest, InvalidConfigRejected) {
    ServiceConfig config;
    config.default_render_scale = -1.0;
    EXPECT_THROW({ RequestHandler rejected(engine, config); }, std::invalid_argument);
}

// ==========================================
// Analysis Methods
// ==========================================

TEST_F(RequestHandlerTest, AnalyzeReturnsDocumentStructure) {
    json response = call("analyze", {"book.pdf"});
    ASSERT_FALSE(response.contains("error")) << response.dump();
    EXPECT_EQ(response["pdf_name"], "book.pdf");
    EXPECT_EQ(response["page_count"], 3);
    EXPECT_EQ(response["blocks"].size(), 6u);
    EXPECT_EQ(response["categories"].size(), 2u);
    EXPECT_EQ(response["page_dimensions"].size(), 3u);
}

TEST_F(RequestHandlerTest, AnalyzeHonorsMaxPages) {
    json response = call("analyze", {"book.pdf", 1});
    EXPECT_EQ(response["page_count"], 1);

    json all = call("analyze", {"book.pdf", nullptr});
    EXPECT_EQ(all["page_count"], 3);
}

TEST_F(RequestHandlerTest, NamedParams) {
    json response = handler->handle({{"method", "analyze"},
                                     {"params", {{"path", "book.pdf"}, {"max_pages", 2}}}});
    EXPECT_EQ(response["page_count"], 2);
}

TEST_F(RequestHandlerTest, ExportAndSimilarAfterAnalyze) {
    json analysis = call("analyze", {"book.pdf"});

    std::string heading_id;
    for (const auto& [id, cat] : analysis["categories"].items()) {
        if (cat["type"] == "heading") heading_id = id;
    }
    ASSERT_FALSE(heading_id.empty());

    json exported = call("export", {json::array({heading_id})});
    EXPECT_EQ(exported["text"], "Chapter 1\n\nChapter 2\n\nChapter 3");
    EXPECT_EQ(exported["char_count"], 31);

    std::string first_block = analysis["blocks"][0]["id"];
    json similar = call("find_similar", {first_block});
    EXPECT_EQ(similar["count"], 3);

    json unknown = call("find_similar", {"does-not-exist"});
    EXPECT_EQ(unknown["count"], 0);
    EXPECT_TRUE(unknown["similar_ids"].empty());
}

TEST_F(RequestHandlerTest, FailedAnalyzeClearsSession) {
    json analysis = call("analyze", {"book.pdf"});
    std::string block_id = analysis["blocks"][0]["id"];

    json failed = call("analyze", {"missing.pdf"});
    EXPECT_EQ(failed["error"], "Cannot open document: missing.pdf");

    EXPECT_FALSE(handler->get_session().has_analysis());
    EXPECT_EQ(call("find_similar", {block_id})["count"], 0);
    EXPECT_TRUE(call("render_page", {0})["error"].is_string());
}

TEST_F(RequestHandlerTest, DetectChaptersNeedsAnalysis) {
    EXPECT_EQ(call("detect_chapters")["error"], "No document analyzed");

    call("analyze", {"book.pdf"});
    json response = call("detect_chapters");
    ASSERT_TRUE(response.contains("chapters"));
    ASSERT_EQ(response["chapters"].size(), 3u);
    EXPECT_EQ(response["chapters"][2]["title"], "Chapter 3");
    EXPECT_EQ(response["chapters"][2]["page"], 2);
}

// ==========================================
// Rendering
// ==========================================

TEST_F(RequestHandlerTest, RenderWithoutDocumentFails) {
    EXPECT_EQ(call("render_page", {0})["error"], "No PDF loaded");
}

TEST_F(RequestHandlerTest, RenderUsesLastAnalyzedDocument) {
    call("analyze", {"book.pdf"});
    json response = call("render_page", {1});
    EXPECT_EQ(response["image"], "b64:png:1:20");
}

TEST_F(RequestHandlerTest, RenderExplicitPathAndScale) {
    json response = call("render_page", {2, 1.5, "book.pdf"});
    EXPECT_EQ(response["image"], "b64:png:2:15");
}

TEST_F(RequestHandlerTest, RenderDefaultScaleFromConfig) {
    ServiceConfig config;
    config.default_render_scale = 3.0;
    RequestHandler configured(engine, config);
    json response = configured.handle({{"method", "render_page"}, {"args", {0, nullptr, "book.pdf"}}});
    EXPECT_EQ(response["image"], "b64:png:0:30");
}

TEST_F(RequestHandlerTest, RenderPageOutOfRange) {
    EXPECT_TRUE(call("render_page", {9, 2.0, "book.pdf"}).contains("error"));
}

// ==========================================
// Document Output
// ==========================================

TEST_F(RequestHandlerTest, ExportPdfReturnsBase64) {
    json regions = json::array({{{"page", 0}, {"x", 0}, {"y", 0}, {"width", 10}, {"height", 10}}});
    json response = call("export_pdf", {"book.pdf", regions});
    EXPECT_EQ(response["pdf_base64"], "b64:pdf:3:1");
}

TEST_F(RequestHandlerTest, RedactWritesOutput) {
    json request = {
        {"regions", json::array({{{"page", 0}, {"x", 72}, {"y", 100}, {"width", 300},
                                  {"height", 16}, {"text", "Chapter 1"}}})},
        {"deletedPages", {1}},
        {"bookmarks", json::array({{{"title", "Start"}, {"page", 0}}})},
    };
    json response = call("redact", {"book.pdf", "clean.pdf", request});

    ASSERT_EQ(response["success"], true) << response.dump();
    EXPECT_EQ(response["report"]["pages_deleted"], json::array({1}));
    EXPECT_EQ(response["report"]["regions_coordinate_fallback"], 1);
    ASSERT_EQ(engine.saved.count("clean.pdf"), 1u);
    EXPECT_EQ(engine.saved["clean.pdf"].page_count(), 2);
    EXPECT_EQ(engine.saved["clean.pdf"].toc.size(), 1u);
}

TEST_F(RequestHandlerTest, OutlineIsZeroIndexed) {
    json response = call("outline", {"book.pdf"});
    ASSERT_EQ(response["bookmarks"].size(), 2u);
    EXPECT_EQ(response["bookmarks"][1]["title"], "Chapter 2");
    EXPECT_EQ(response["bookmarks"][1]["page"], 1);
}

// ==========================================
// Serve Loop
// ==========================================

TEST_F(RequestHandlerTest, ServeAnswersEachLine) {
    std::istringstream in(
        "{\"method\": \"analyze\", \"args\": [\"book.pdf\"]}\n"
        "\n"
        "{\"method\": \"nope\"}\n"
        "garbage\n");
    std::ostringstream out;

    int failures = handler->serve(in, out);
    EXPECT_EQ(failures, 2);

    std::istringstream lines(out.str());
    std::string line;
    std::vector<json> responses;
    while (std::getline(lines, line)) {
        responses.push_back(json::parse(line));
    }
    ASSERT_EQ(responses.size(), 3u);
    EXPECT_EQ(responses[0]["page_count"], 3);
    EXPECT_EQ(responses[1]["error"], "Unknown method: nope");
    EXPECT_TRUE(responses[2].contains("error"));
}
