// =============================================================================
// srtchunk - Error Handling Tests
// =============================================================================
// Unit tests for error codes, exception formatting and the Result helpers.
// =============================================================================

#include "srtc/common/error.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace srtc {
namespace {

// =============================================================================
// ErrorCode Tests
// =============================================================================

TEST(ErrorCodeTest, ExitCodesMatchCliContract) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kUsageError), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kValidationError), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kParsingError), 3);
}

TEST(ErrorCodeTest, CategoryNames) {
    EXPECT_EQ(errorCodeToString(ErrorCode::kValidationError), "validation error");
    EXPECT_EQ(errorCodeToString(ErrorCode::kParsingError), "parsing error");
    EXPECT_TRUE(isSuccess(ErrorCode::kSuccess));
    EXPECT_TRUE(isError(ErrorCode::kGrammarError));
}

// =============================================================================
// Exception Tests
// =============================================================================

TEST(ExceptionTest, ValidationErrorCarriesMessageAndExitCode) {
    ValidationError err("File is empty.", ErrorContext{"empty.srt"});

    EXPECT_EQ(err.code(), ErrorCode::kValidationError);
    EXPECT_EQ(err.exitCode(), 2);
    EXPECT_EQ(err.message(), "File is empty.");
    ASSERT_TRUE(err.hasContext());
    EXPECT_EQ(err.context()->filePath, "empty.srt");

    std::string what = err.what();
    EXPECT_NE(what.find("[validation error] File is empty."), std::string::npos);
    EXPECT_NE(what.find("file: empty.srt"), std::string::npos);
}

TEST(ExceptionTest, ParsingErrorKeepsCauseAndLine) {
    ErrorContext ctx{"movie.srt"};
    ctx.withLine(7);
    ParsingError err("Failed to parse SRT file 'movie.srt'", "bad timing", ctx);

    EXPECT_EQ(err.exitCode(), 3);
    EXPECT_EQ(err.cause(), "bad timing");
    ASSERT_TRUE(err.context()->lineNumber.has_value());
    EXPECT_EQ(*err.context()->lineNumber, 7u);
    EXPECT_NE(std::string(err.what()).find("line: 7"), std::string::npos);
}

TEST(ExceptionTest, GrammarErrorLineNumber) {
    GrammarError withLine("invalid timing line", 12);
    GrammarError withoutLine("invalid timing line");

    EXPECT_EQ(withLine.lineNumber(), 12u);
    EXPECT_FALSE(withoutLine.lineNumber().has_value());
    EXPECT_EQ(withLine.code(), ErrorCode::kGrammarError);
}

TEST(ExceptionTest, IOErrorIncludesSystemMessage) {
    auto ec = std::make_error_code(std::errc::permission_denied);
    IOError err("Failed to open file: a.srt", ec);

    ASSERT_TRUE(err.systemError().has_value());
    EXPECT_EQ(*err.systemError(), ec);
    EXPECT_NE(err.message().find(ec.message()), std::string::npos);

    IOError missing(ErrorCode::kFileNotFound, "File not found: a.srt");
    EXPECT_EQ(missing.code(), ErrorCode::kFileNotFound);
}

TEST(ExceptionTest, ValidationErrorSystemError) {
    auto ec = std::make_error_code(std::errc::no_such_file_or_directory);
    ValidationError err("Could not access file", ec, ErrorContext{"x.srt"});

    ASSERT_TRUE(err.systemError().has_value());
    EXPECT_EQ(*err.systemError(), ec);
}

// =============================================================================
// Result Tests
// =============================================================================

TEST(ResultTest, SuccessAndError) {
    auto ok = makeSuccess(42);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, 42);

    auto bad = makeError<int>(ErrorCode::kValidationError, "nope");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code(), ErrorCode::kValidationError);
    EXPECT_EQ(bad.error().message(), "nope");
    EXPECT_EQ(bad.error().exitCode(), 2);
}

TEST(ResultTest, UnwrapOrThrowRethrowsMatchingType) {
    EXPECT_EQ(unwrapOrThrow(makeSuccess(std::string("ok"))), "ok");
    EXPECT_THROW((void)unwrapOrThrow(makeError<int>(ErrorCode::kValidationError, "v")),
                 ValidationError);
    EXPECT_THROW((void)unwrapOrThrow(makeError<int>(ErrorCode::kParsingError, "p")), ParsingError);
    EXPECT_THROW(unwrapOrThrow(makeVoidError(ErrorCode::kUsageError, "u")), UsageError);
    EXPECT_NO_THROW(unwrapOrThrow(makeVoidSuccess()));
}

TEST(ResultTest, TryExecuteConvertsExceptions) {
    auto ok = tryExecute([] { return 5; });
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, 5);

    auto validation = tryExecute([]() -> int { throw ValidationError("bad input"); });
    ASSERT_FALSE(validation.has_value());
    EXPECT_EQ(validation.error().code(), ErrorCode::kValidationError);
    EXPECT_EQ(validation.error().message(), "bad input");

    auto other = tryExecute([]() -> int { throw std::runtime_error("boom"); });
    ASSERT_FALSE(other.has_value());
    EXPECT_EQ(other.error().code(), ErrorCode::kParsingError);

    auto voidResult = tryExecute([] {});
    EXPECT_TRUE(voidResult.has_value());
}

}  // namespace
}  // namespace srtc
