/**
 * @file test_dispatcher.cpp
 * @brief Tests for format selection and request validation
 */

#include <gtest/gtest.h>
#include <dispatcher.hpp>
#include <extraction_error.hpp>

#include "test_support.hpp"

#include <functional>

using namespace pagedecode;

namespace {

ErrorKind kind_of(const std::function<void()> &fn) {
    try {
        fn();
    } catch (const ExtractionError &e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected ExtractionError";
    return ErrorKind::UnsupportedFormat;
}

} // namespace

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        output_dir = scratch.path() / "out";
        fs::create_directories(output_dir);
    }

    TempDir scratch;
    fs::path output_dir;
    RecordingObserver observer;
    DecodeConfig config;
};

TEST_F(DispatcherTest, UnsupportedExtensionCarriesExtension) {
    fs::path input = scratch.path() / "comic.txt";
    write_file(input, "not a comic");

    try {
        decode_file(input, output_dir, config, observer);
        FAIL() << "expected ExtractionError";
    } catch (const ExtractionError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedFormat);
        EXPECT_EQ(e.subject(), "txt");
    }
    EXPECT_TRUE(list_dir(output_dir).empty());
}

TEST_F(DispatcherTest, MissingExtensionIsUnsupportedWithEmptyMarker) {
    fs::path input = scratch.path() / "comic";
    write_file(input, "no extension");

    try {
        decode_file(input, output_dir, config, observer);
        FAIL() << "expected ExtractionError";
    } catch (const ExtractionError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedFormat);
        EXPECT_EQ(e.subject(), "");
    }
}

TEST_F(DispatcherTest, NonUtf8ExtensionIsAnEncodingError) {
    fs::path input = scratch.path() / "comic.\xff\xfe";
    write_file(input, "bad name");

    EXPECT_EQ(kind_of([&] { decode_file(input, output_dir, config, observer); }),
              ErrorKind::InvalidExtensionEncoding);
}

TEST_F(DispatcherTest, CbzDispatchesToArchiveExtractor) {
    fs::path input = scratch.path() / "Comic.CBZ";
    write_zip(input, {
        {"b.png", "B"},
        {"a.png", "A"},
        {"c10.png", "C10"},
        {"c2.png", "C2"},
        {"info.txt", "skip me"},
    });

    auto pages = decode_file(input, output_dir, config, observer);

    EXPECT_EQ(file_names(pages),
              (std::vector<std::string>{"1.png", "2.png", "3.png", "4.png"}));
    EXPECT_EQ(read_file(pages[3]), "C10");
    EXPECT_GE(observer.count(LogLevel::Info), 1u);
}

TEST_F(DispatcherTest, ZipHonoursSimpleSortingAndAllFiles) {
    fs::path input = scratch.path() / "comic.zip";
    write_zip(input, {
        {"c2.png", "C2"},
        {"c10.png", "C10"},
        {"info.txt", "text"},
    });

    config.simple_sorting = true;
    config.extract_images_only = false;
    auto pages = decode_file(input, output_dir, config, observer);

    EXPECT_EQ(file_names(pages), (std::vector<std::string>{"1.png", "2.png", "3.txt"}));
    EXPECT_EQ(read_file(pages[0]), "C10");
}

TEST_F(DispatcherTest, PdfThatCannotBeOpenedFails) {
    fs::path input = scratch.path() / "broken.pdf";
    write_file(input, "garbage that is not a PDF");

    EXPECT_EQ(kind_of([&] { decode_file(input, output_dir, config, observer); }),
              ErrorKind::DocumentOpenFailed);
}

TEST_F(DispatcherTest, FailureLogsNoSuccess) {
    fs::path input = scratch.path() / "comic.rar";
    write_file(input, "rar");

    EXPECT_EQ(kind_of([&] { decode_file(input, output_dir, config, observer); }),
              ErrorKind::UnsupportedFormat);
    EXPECT_EQ(observer.count(LogLevel::Info), 0u);
}

// ============================================================================
// Request validation
// ============================================================================

TEST_F(DispatcherTest, InputNotFound) {
    DecodeRequest request;
    request.input = scratch.path() / "missing.cbz";
    request.output = output_dir;

    EXPECT_EQ(kind_of([&] { decode(request, observer); }), ErrorKind::InputNotFound);
}

TEST_F(DispatcherTest, InputIsDirectory) {
    DecodeRequest request;
    request.input = scratch.path() / "folder.cbz";
    fs::create_directories(request.input);
    request.output = output_dir;

    EXPECT_EQ(kind_of([&] { decode(request, observer); }), ErrorKind::InputIsDirectory);
}

TEST_F(DispatcherTest, OutputDirectoryMustExistUnlessCreated) {
    fs::path input = scratch.path() / "comic.cbz";
    write_zip(input, {{"p1.png", "one"}});

    DecodeRequest request;
    request.input = input;
    request.output = scratch.path() / "new-out";

    EXPECT_EQ(kind_of([&] { decode(request, observer); }), ErrorKind::OutputDirectoryNotFound);

    request.create_output_dir = true;
    auto pages = decode(request, observer);
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_TRUE(fs::exists(scratch.path() / "new-out" / "1.png"));
}

TEST_F(DispatcherTest, OutputPathThatIsAFileIsRejected) {
    fs::path input = scratch.path() / "comic.cbz";
    write_zip(input, {{"p1.png", "one"}});
    fs::path not_a_dir = scratch.path() / "out.txt";
    write_file(not_a_dir, "file");

    DecodeRequest request;
    request.input = input;
    request.output = not_a_dir;

    EXPECT_EQ(kind_of([&] { decode(request, observer); }), ErrorKind::OutputDirectoryIsAFile);
}

TEST_F(DispatcherTest, DefaultOutputIsInputWithoutExtension) {
    fs::path input = scratch.path() / "volume1.cbz";
    write_zip(input, {{"p2.png", "two"}, {"p1.png", "one"}});

    DecodeRequest request;
    request.input = input;

    auto pages = decode(request, observer);

    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(pages[0], scratch.path() / "volume1" / "1.png");
    EXPECT_EQ(read_file(pages[0]), "one");
}
