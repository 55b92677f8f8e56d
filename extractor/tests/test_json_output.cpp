/**
 * @file test_json_output.cpp
 * @brief Unit tests for the JSON result line written to stdout
 */

#include <gtest/gtest.h>
#include <json_output.hpp>

#include <sstream>

using namespace pagedecode;

// ============================================================================
// Escaping
// ============================================================================

TEST(JsonEscapeTest, PlainTextUnchanged) {
    EXPECT_EQ(json_escape("comic/01.png"), "comic/01.png");
    EXPECT_EQ(json_escape(""), "");
}

TEST(JsonEscapeTest, QuotesAndBackslashes) {
    EXPECT_EQ(json_escape("a\"b\\c"), "a\\\"b\\\\c");
}

TEST(JsonEscapeTest, NamedControlCharacters) {
    EXPECT_EQ(json_escape("\b\f\n\r\t"), "\\b\\f\\n\\r\\t");
}

TEST(JsonEscapeTest, OtherControlCharactersAsUnicodeEscapes) {
    EXPECT_EQ(json_escape(std::string("\x00", 1)), "\\u0000");
    EXPECT_EQ(json_escape("\x1f"), "\\u001f");
    EXPECT_EQ(json_escape("a\x01z"), "a\\u0001z");
}

TEST(JsonEscapeTest, NonAsciiBytesPassThrough) {
    EXPECT_EQ(json_escape("\xc3\xa9t\xc3\xa9"), "\xc3\xa9t\xc3\xa9");
    EXPECT_EQ(json_escape("\x7f"), "\x7f");
}

// ============================================================================
// Result lines
// ============================================================================

TEST(JsonOutputTest, SuccessListsPagesInOrder) {
    std::ostringstream out;
    write_success_json(out, "book.cbz", {"out/1.png", "out/2.png"});

    EXPECT_EQ(out.str(),
              "{\"success\":true,\"file\":\"book.cbz\",\"page_count\":2,"
              "\"pages\":[\"out/1.png\",\"out/2.png\"]}\n");
}

TEST(JsonOutputTest, SuccessWithNoPages) {
    std::ostringstream out;
    write_success_json(out, "empty.zip", {});

    EXPECT_EQ(out.str(),
              "{\"success\":true,\"file\":\"empty.zip\",\"page_count\":0,\"pages\":[]}\n");
}

TEST(JsonOutputTest, FailureCarriesKindAndEscapedMessage) {
    std::ostringstream out;
    write_failure_json(out, "my \"book\".pdf", "document_open_failed", "line1\nline2");

    EXPECT_EQ(out.str(),
              "{\"success\":false,\"file\":\"my \\\"book\\\".pdf\","
              "\"error_kind\":\"document_open_failed\",\"error\":\"line1\\nline2\"}\n");
}
