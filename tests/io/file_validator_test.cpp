// =============================================================================
// srtchunk - File Validator Tests
// =============================================================================
// Unit tests for pre-parse file checks against both an in-memory filesystem
// and real temporary files.
// =============================================================================

#include "srtc/io/file_validator.h"

#include <gtest/gtest.h>

#include <string>

#include "test_utils.h"

namespace srtc::io::test {

using srtc::test::FakeFileSystem;
using srtc::test::TempFileGuard;
using srtc::test::makeSrt;

namespace {

/// @brief Run validate() and return the ValidationError message.
std::string rejectionMessage(const FileValidator& validator, const std::filesystem::path& path) {
    try {
        (void)validator.validate(path);
    } catch (const ValidationError& e) {
        return e.message();
    }
    ADD_FAILURE() << "expected ValidationError for " << path;
    return {};
}

}  // namespace

// =============================================================================
// Extension Tests
// =============================================================================

TEST(HasExtensionTest, CaseInsensitiveSuffix) {
    EXPECT_TRUE(hasExtension("movie.srt", ".srt"));
    EXPECT_TRUE(hasExtension("MOVIE.SRT", ".srt"));
    EXPECT_TRUE(hasExtension("dir/Movie.Srt", ".srt"));
    EXPECT_TRUE(hasExtension(".srt", ".srt"));
    EXPECT_FALSE(hasExtension("notes.txt", ".srt"));
    EXPECT_FALSE(hasExtension("movie.srt.bak", ".srt"));
    EXPECT_FALSE(hasExtension("srt", ".srt"));
    EXPECT_FALSE(hasExtension("movie.srt", ""));
}

// =============================================================================
// FileValidator Tests (in-memory)
// =============================================================================

TEST(FileValidatorTest, AcceptsRegularSubtitleFile) {
    FakeFileSystem fs;
    fs.addFile("movie.srt", makeSrt(3));
    FileValidator validator(fs);

    EXPECT_EQ(validator.validate("movie.srt"), makeSrt(3).size());
    EXPECT_EQ(fs.readCalls(), 0);
}

TEST(FileValidatorTest, RejectsWrongExtensionWithoutTouchingFilesystem) {
    FakeFileSystem fs;
    fs.addFile("notes.txt", "1\n00:00:01,000 --> 00:00:02,000\nHi\n");
    FileValidator validator(fs);

    EXPECT_EQ(rejectionMessage(validator, "notes.txt"),
              "Invalid file type. Only .srt files are accepted.");
    EXPECT_EQ(rejectionMessage(validator, ""),
              "Invalid file type. Only .srt files are accepted.");
    EXPECT_EQ(fs.statusCalls(), 0);
}

TEST(FileValidatorTest, RejectsMissingFile) {
    FakeFileSystem fs;
    FileValidator validator(fs);

    try {
        (void)validator.validate("missing.srt");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.message().rfind("Could not access file: ", 0), 0u);
        ASSERT_TRUE(e.systemError().has_value());
        EXPECT_EQ(*e.systemError(), std::make_error_code(std::errc::no_such_file_or_directory));
        EXPECT_EQ(e.exitCode(), 2);
    }
}

TEST(FileValidatorTest, RejectsDirectory) {
    FakeFileSystem fs;
    fs.addDirectory("folder.srt");
    FileValidator validator(fs);

    EXPECT_EQ(rejectionMessage(validator, "folder.srt"),
              "Could not access file: not a regular file");
}

TEST(FileValidatorTest, RejectsOversizedFileWithSingleStat) {
    FakeFileSystem fs;
    fs.addSizedFile("big.srt", 3 * 1024 * 1024);
    FileValidator validator(fs);

    EXPECT_EQ(rejectionMessage(validator, "big.srt"), "File size exceeds the limit of 2MB.");
    EXPECT_EQ(fs.statusCalls(), 1);
    EXPECT_EQ(fs.readCalls(), 0);
}

TEST(FileValidatorTest, SizeLimitIsInclusive) {
    FakeFileSystem fs;
    fs.addSizedFile("edge.srt", kMaxFileSizeBytes);
    fs.addSizedFile("over.srt", kMaxFileSizeBytes + 1);
    FileValidator validator(fs);

    EXPECT_EQ(validator.validate("edge.srt"), kMaxFileSizeBytes);
    EXPECT_THROW((void)validator.validate("over.srt"), ValidationError);
}

TEST(FileValidatorTest, RejectsEmptyFile) {
    FakeFileSystem fs;
    fs.addFile("empty.srt", "");
    FileValidator validator(fs);

    EXPECT_EQ(rejectionMessage(validator, "empty.srt"), "File is empty.");
}

TEST(FileValidatorTest, CustomOptions) {
    FakeFileSystem fs;
    fs.addSizedFile("talk.vtt", 2048);
    ValidatorOptions options;
    options.extension = ".vtt";
    options.maxFileSize = 1024 * 1024;
    FileValidator validator(fs, options);

    EXPECT_EQ(validator.validate("talk.vtt"), 2048u);
    EXPECT_EQ(validator.options().extension, ".vtt");
}

TEST(FileValidatorTest, CheckReturnsResult) {
    FakeFileSystem fs;
    fs.addFile("ok.srt", "x");
    FileValidator validator(fs);

    auto ok = validator.check("ok.srt");
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, 1u);

    auto bad = validator.check("bad.txt");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code(), ErrorCode::kValidationError);
}

// =============================================================================
// FileValidator Tests (local filesystem)
// =============================================================================

TEST(FileValidatorLocalTest, AcceptsRealFile) {
    TempFileGuard file("movie.srt", makeSrt(2));

    EXPECT_EQ(validateSubtitleFile(file.path()), makeSrt(2).size());
}

TEST(FileValidatorLocalTest, AcceptsUppercaseExtension) {
    TempFileGuard file("MOVIE.SRT", makeSrt(1));

    EXPECT_NO_THROW((void)validateSubtitleFile(file.path()));
}

TEST(FileValidatorLocalTest, RejectsRealEmptyFile) {
    TempFileGuard file("empty.srt", "");

    EXPECT_EQ(rejectionMessage(FileValidator{}, file.path()), "File is empty.");
}

TEST(FileValidatorLocalTest, RejectsNonexistentPath) {
    TempFileGuard file("present.srt", "x");
    auto missing = file.path().parent_path() / "absent.srt";

    EXPECT_EQ(rejectionMessage(FileValidator{}, missing).rfind("Could not access file: ", 0), 0u);
}

TEST(FileValidatorLocalTest, RejectsRealDirectory) {
    TempFileGuard file("present.srt", "x");
    auto dir = file.path().parent_path() / "nested.srt";
    std::filesystem::create_directory(dir);

    EXPECT_EQ(rejectionMessage(FileValidator{}, dir), "Could not access file: not a regular file");
}

}  // namespace srtc::io::test
