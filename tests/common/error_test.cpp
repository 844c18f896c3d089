// =============================================================================
// gzchunk - Error Handling Tests
// =============================================================================

#include "gzc/common/error.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <system_error>

namespace gzc {
namespace {

// =============================================================================
// ErrorCode Tests
// =============================================================================

TEST(ErrorCodeTest, ExitCodesAreStable) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kUsageError), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kIOError), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kFormatError), 3);
    EXPECT_EQ(toExitCode(ErrorCode::kCodecError), 4);
    EXPECT_EQ(toExitCode(ErrorCode::kInvalidArgument), 5);
    EXPECT_EQ(toExitCode(ErrorCode::kFileNotFound), 6);
    EXPECT_EQ(toExitCode(ErrorCode::kInvalidState), 7);
}

TEST(ErrorCodeTest, ToString) {
    EXPECT_EQ(errorCodeToString(ErrorCode::kCodecError), "codec error");
    EXPECT_EQ(errorCodeToString(ErrorCode::kFileNotFound), "file not found");
    EXPECT_TRUE(isSuccess(ErrorCode::kSuccess));
    EXPECT_TRUE(isError(ErrorCode::kIOError));
}

// =============================================================================
// Exception Tests
// =============================================================================

TEST(ExceptionTest, WhatIncludesCodeAndMessage) {
    CodecError ex("bad frame");
    EXPECT_EQ(ex.code(), ErrorCode::kCodecError);
    EXPECT_EQ(ex.message(), "bad frame");
    EXPECT_EQ(std::string(ex.what()), "[codec error] bad frame");
    EXPECT_FALSE(ex.hasContext());
}

TEST(ExceptionTest, ContextIsFormatted) {
    IOError ex("write failed", ErrorContext{"out.gz"}.withSequence(3).withOffset(16));
    ASSERT_TRUE(ex.hasContext());
    std::string what = ex.what();
    EXPECT_NE(what.find("file: out.gz"), std::string::npos);
    EXPECT_NE(what.find("chunk: 3"), std::string::npos);
    EXPECT_NE(what.find("offset: 0x10"), std::string::npos);
}

TEST(ExceptionTest, IOErrorWithSystemError) {
    IOError ex("open failed", std::make_error_code(std::errc::permission_denied));
    ASSERT_TRUE(ex.systemError().has_value());
    EXPECT_EQ(*ex.systemError(), std::make_error_code(std::errc::permission_denied));
    EXPECT_NE(ex.message().find("open failed"), std::string::npos);
}

TEST(ExceptionTest, SubclassCodes) {
    EXPECT_EQ(UsageError("x").code(), ErrorCode::kUsageError);
    EXPECT_EQ(FormatError("x").code(), ErrorCode::kFormatError);
    EXPECT_EQ(ArgumentError("x").code(), ErrorCode::kInvalidArgument);
    EXPECT_EQ(FileNotFoundError("x").code(), ErrorCode::kFileNotFound);
    EXPECT_EQ(FileNotFoundError("x").exitCode(), 6);
}

// =============================================================================
// Result Tests
// =============================================================================

TEST(ResultTest, ErrorFromExceptionKeepsContextWithoutPrefix) {
    CodecError ex("truncated", ErrorContext{"a.gz"});
    Error error(ex);
    EXPECT_EQ(error.code(), ErrorCode::kCodecError);
    EXPECT_EQ(error.message().rfind("truncated (file: a.gz", 0), 0u);
    EXPECT_EQ(error.message().find("[codec error]"), std::string::npos);
}

TEST(ResultTest, ThrowExceptionMatchesCode) {
    Error error(ErrorCode::kFormatError, "wrong extension");
    EXPECT_THROW(error.throwException(), FormatError);

    Error state(ErrorCode::kInvalidState, "not open");
    EXPECT_THROW(state.throwException(), GZCException);
}

TEST(ResultTest, UnwrapOrThrow) {
    Result<int> ok = 5;
    EXPECT_EQ(unwrapOrThrow(ok), 5);

    Result<int> bad = makeError<int>(ErrorCode::kIOError, "disk full");
    EXPECT_THROW((void)unwrapOrThrow(bad), IOError);

    EXPECT_NO_THROW(unwrapOrThrow(makeVoidSuccess()));
    EXPECT_THROW(unwrapOrThrow(makeVoidError(ErrorCode::kCodecError, "x")), CodecError);
}

TEST(ResultTest, TryExecuteConvertsExceptions) {
    auto value = tryExecute([] { return 42; });
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 42);

    auto codec = tryExecute([]() -> int { throw CodecError("broken"); });
    ASSERT_FALSE(codec.has_value());
    EXPECT_EQ(codec.error().code(), ErrorCode::kCodecError);
    EXPECT_EQ(codec.error().message(), "broken");

    auto foreign = tryExecute([] { throw std::runtime_error("boom"); });
    ASSERT_FALSE(foreign.has_value());
    EXPECT_EQ(foreign.error().code(), ErrorCode::kIOError);
}

}  // namespace
}  // namespace gzc
