#include <gtest/gtest.h>
#include "analysis/block_extractor.hpp"
#include "fake_document.hpp"
#include "util/hash.hpp"

using namespace ds;
using namespace ds::testing_support;

class BlockExtractorTest : public ::testing::Test {
protected:
    BlockExtractor extractor;
    PageSize letter{612.0, 792.0};
};

// ==========================================
// Text Blocks
// ==========================================

TEST_F(BlockExtractorTest, MergesSpansWithSingleSpaces) {
    LayoutBlock layout;
    layout.bbox = Rect{72, 200, 540, 240};
    TextLine first;
    first.spans = {make_span("Hello", 10.0), make_span("   ", 10.0), make_span("world", 10.0)};
    TextLine second;
    second.spans = {make_span("again", 10.0)};
    layout.lines = {first, second};

    auto blocks = extractor.build_page_blocks(0, letter, {}, {layout});
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].text, "Hello world again");
    EXPECT_EQ(blocks[0].char_count, 17);
    EXPECT_EQ(blocks[0].line_count, 2);
    EXPECT_DOUBLE_EQ(blocks[0].x, 72.0);
    EXPECT_DOUBLE_EQ(blocks[0].y, 200.0);
    EXPECT_DOUBLE_EQ(blocks[0].width, 468.0);
    EXPECT_DOUBLE_EQ(blocks[0].height, 40.0);
    EXPECT_FALSE(blocks[0].is_image);
}

TEST_F(BlockExtractorTest, DominantFontWeightedByCharacters) {
    LayoutBlock layout;
    layout.bbox = Rect{72, 300, 540, 320};
    TextLine line;
    line.spans = {
        make_span("Short", 14.0, "Helvetica-Bold", kSpanBold),
        make_span("a much longer run of regular text", 10.04, "Times-Roman"),
    };
    layout.lines = {line};

    auto blocks = extractor.build_page_blocks(0, letter, {}, {layout});
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_DOUBLE_EQ(blocks[0].font_size, 10.0);
    EXPECT_EQ(blocks[0].font_name, "Times-Roman");
    EXPECT_FALSE(blocks[0].is_bold);
}

TEST_F(BlockExtractorTest, EmphasisNeedsMajorityOfCharacters) {
    LayoutBlock layout;
    layout.bbox = Rect{72, 300, 300, 320};
    TextLine line;
    line.spans = {
        make_span("Mostly bold words", 11.0, "Garamond", kSpanBold),
        make_span("tail", 11.0, "Garamond"),
    };
    layout.lines = {line};

    auto blocks = extractor.build_page_blocks(0, letter, {}, {layout});
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_TRUE(blocks[0].is_bold);
    EXPECT_FALSE(blocks[0].is_italic);
}

TEST_F(BlockExtractorTest, FontNameImpliesStyle) {
    auto bold = make_text_block(Rect{72, 300, 300, 320}, "Named bold", 11.0, "Arial-BoldMT");
    auto italic = make_text_block(Rect{72, 340, 300, 360}, "Named oblique", 11.0,
                                  "Helvetica-Oblique");
    auto blocks = extractor.build_page_blocks(0, letter, {}, {bold, italic});
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_TRUE(blocks[0].is_bold);
    EXPECT_TRUE(blocks[1].is_italic);
}

TEST_F(BlockExtractorTest, SuperscriptFlag) {
    auto mark = make_text_block(Rect{300, 300, 305, 306}, "12", 6.0, "Times-Roman",
                                kSpanSuperscript);
    auto blocks = extractor.build_page_blocks(0, letter, {}, {mark});
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_TRUE(blocks[0].is_superscript);
}

TEST_F(BlockExtractorTest, BlankBlocksAreDiscarded) {
    auto blank = make_text_block(Rect{72, 300, 300, 320}, "  \t ", 10.0);
    auto blocks = extractor.build_page_blocks(0, letter, {}, {blank});
    EXPECT_TRUE(blocks.empty());
}

TEST_F(BlockExtractorTest, NoBreakSpaceSpansAreSkipped) {
    const std::string nbsp = "\xC2\xA0";
    LayoutBlock layout;
    layout.bbox = Rect{72, 200, 540, 220};
    TextLine line;
    line.spans = {make_span("Left", 10.0), make_span(nbsp, 10.0),
                  make_span(nbsp + nbsp, 10.0), make_span("right", 10.0)};
    layout.lines = {line};

    auto blank = make_text_block(Rect{72, 300, 300, 320}, nbsp + " " + nbsp, 10.0);
    auto ideographic = make_text_block(Rect{72, 340, 300, 360}, "\xE3\x80\x80", 10.0);

    auto blocks = extractor.build_page_blocks(0, letter, {}, {layout, blank, ideographic});
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].text, "Left right");
    EXPECT_EQ(blocks[0].char_count, 10);
}

TEST_F(BlockExtractorTest, RegionAssignedFromPosition) {
    auto header = make_text_block(Rect{72, 20, 300, 32}, "Running Head", 9.0);
    auto body = make_text_block(Rect{72, 300, 540, 400}, "Body text", 10.0);
    auto footer = make_text_block(Rect{300, 760, 310, 770}, "7", 9.0);

    auto blocks = extractor.build_page_blocks(0, letter, {}, {header, body, footer});
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0].region, Region::HEADER);
    EXPECT_EQ(blocks[1].region, Region::BODY);
    EXPECT_EQ(blocks[2].region, Region::FOOTER);
}

TEST_F(BlockExtractorTest, TextIdDependsOnPageIndexAndText) {
    auto layout = make_text_block(Rect{72, 300, 540, 320}, "Same text", 10.0);

    auto first = extractor.build_page_blocks(0, letter, {}, {layout});
    auto again = extractor.build_page_blocks(0, letter, {}, {layout});
    auto other_page = extractor.build_page_blocks(1, letter, {}, {layout});

    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].id, again[0].id);
    EXPECT_NE(first[0].id, other_page[0].id);
    EXPECT_EQ(first[0].id.size(), 12u);
    EXPECT_EQ(first[0].id, short_hash("0:0:Same text", 12));
}

// ==========================================
// Images
// ==========================================

TEST_F(BlockExtractorTest, ImageBlockShape) {
    auto blocks = extractor.build_page_blocks(2, letter, {Rect{50, 100, 150, 150.7}}, {});
    ASSERT_EQ(blocks.size(), 1u);
    const Block& img = blocks[0];
    EXPECT_TRUE(img.is_image);
    EXPECT_EQ(img.text, "[Image 100x50]");
    EXPECT_EQ(img.font_name, "image");
    EXPECT_DOUBLE_EQ(img.font_size, 0.0);
    EXPECT_EQ(img.char_count, 0);
    EXPECT_EQ(img.line_count, 0);
    EXPECT_EQ(img.region, Region::BODY);
    EXPECT_EQ(img.page, 2);
    EXPECT_EQ(img.id, short_hash("2:img:50,100,150,151", 12));
}

TEST_F(BlockExtractorTest, ImagesSharingCornerGetDistinctIds) {
    auto blocks = extractor.build_page_blocks(0, letter,
                                              {Rect{50, 100, 250, 300}, Rect{50, 100, 150, 160}},
                                              {});
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_NE(blocks[0].id, blocks[1].id);
}

TEST_F(BlockExtractorTest, SmallImagesIgnored) {
    auto blocks = extractor.build_page_blocks(0, letter,
                                              {Rect{0, 0, 19, 300}, Rect{0, 0, 300, 10}}, {});
    EXPECT_TRUE(blocks.empty());

    BlockExtractor lenient(5.0);
    EXPECT_EQ(lenient.build_page_blocks(0, letter, {Rect{0, 0, 300, 10}}, {}).size(), 1u);
}

TEST_F(BlockExtractorTest, SameImageFromBothSourcesOnce) {
    Rect box{50, 100, 250, 300};
    Rect nearly{50.2, 99.8, 250.3, 300.1};
    auto blocks = extractor.build_page_blocks(0, letter, {box, box},
                                              {make_image_layout(nearly)});
    ASSERT_EQ(blocks.size(), 1u);
}

TEST_F(BlockExtractorTest, ImagesPrecedeTextBlocks) {
    auto text = make_text_block(Rect{72, 50, 540, 70}, "Caption above", 10.0);
    auto blocks = extractor.build_page_blocks(0, letter, {Rect{72, 400, 300, 600}},
                                              {text, make_image_layout(Rect{72, 620, 300, 700})});
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_TRUE(blocks[0].is_image);
    EXPECT_FALSE(blocks[1].is_image);
    EXPECT_TRUE(blocks[2].is_image);
    EXPECT_EQ(blocks[2].id, short_hash("0:img:1:72,620", 12));
}

TEST_F(BlockExtractorTest, TextBlockWithoutLinesBecomesImage) {
    LayoutBlock empty;
    empty.bbox = Rect{100, 100, 200, 200};
    empty.is_text = true;
    auto blocks = extractor.build_page_blocks(0, letter, {}, {empty});
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_TRUE(blocks[0].is_image);
}

// ==========================================
// Document Access
// ==========================================

TEST_F(BlockExtractorTest, ImageListingFailureKeepsText) {
    FakeDocument doc = FakeDocument::with_pages(1);
    doc.pages[0].fail_image_listing = true;
    doc.pages[0].images = {Rect{50, 100, 250, 300}};
    doc.pages[0].layout = {make_text_block(Rect{72, 300, 540, 320}, "Still here", 10.0)};

    auto blocks = extractor.extract_page(doc, 0, doc.pages[0].size);
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].text, "Still here");
}
