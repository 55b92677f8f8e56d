/**
 * @file test_image_formats.cpp
 * @brief Unit tests for extension helpers
 */

#include <gtest/gtest.h>
#include <image_formats.hpp>

using namespace pagedecode;

TEST(PathExtensionTest, LastSegmentOnly) {
    EXPECT_EQ(path_extension("dir.v2/page1.png"), "png");
    EXPECT_EQ(path_extension("dir.v2/page1"), "");
    EXPECT_EQ(path_extension("archive.tar.gz"), "gz");
    EXPECT_EQ(path_extension(".hidden"), "");
    EXPECT_EQ(path_extension("trailing."), "");
}

TEST(HasImageExtTest, BasicFormats) {
    EXPECT_TRUE(has_image_ext("a/page.png", false));
    EXPECT_TRUE(has_image_ext("PAGE.JPG", false));
    EXPECT_TRUE(has_image_ext("p.jpeg", false));
    EXPECT_TRUE(has_image_ext("p.webp", false));
    EXPECT_FALSE(has_image_ext("notes.txt", false));
    EXPECT_FALSE(has_image_ext("ComicInfo.xml", false));
    EXPECT_FALSE(has_image_ext("png", false));
}

TEST(HasImageExtTest, ExtendedFormatsNeedFlag) {
    EXPECT_FALSE(has_image_ext("scan.tiff", false));
    EXPECT_TRUE(has_image_ext("scan.tiff", true));
    EXPECT_TRUE(has_image_ext("scan.AVIF", true));
    EXPECT_TRUE(has_image_ext("page.png", true));
    EXPECT_FALSE(has_image_ext("notes.txt", true));
}

TEST(SupportedForDecodingTest, ContainerFormats) {
    EXPECT_TRUE(is_supported_for_decoding("zip"));
    EXPECT_TRUE(is_supported_for_decoding("CBZ"));
    EXPECT_TRUE(is_supported_for_decoding("pdf"));
    EXPECT_FALSE(is_supported_for_decoding("cbr"));
    EXPECT_FALSE(is_supported_for_decoding(""));
}

TEST(Utf8Test, AcceptsValidSequences) {
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_TRUE(is_valid_utf8("png"));
    EXPECT_TRUE(is_valid_utf8("\xc3\xa9"));
    EXPECT_TRUE(is_valid_utf8("\xe6\x97\xa5"));
    EXPECT_TRUE(is_valid_utf8("\xf0\x9f\x93\x96"));
}

TEST(Utf8Test, RejectsInvalidSequences) {
    EXPECT_FALSE(is_valid_utf8("\xff"));
    EXPECT_FALSE(is_valid_utf8("\xc3"));
    EXPECT_FALSE(is_valid_utf8("p\xe6\x97"));
    EXPECT_FALSE(is_valid_utf8("\xc0\xaf"));
    EXPECT_FALSE(is_valid_utf8("\xed\xa0\x80"));
}
