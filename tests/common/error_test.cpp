// =============================================================================
// ziso - Error Handling Tests
// =============================================================================
// Unit tests for exit code mapping, exception formatting and the Result
// helpers used at the command boundary.
// =============================================================================

#include "ziso/common/error.h"

#include <gtest/gtest.h>

#include <string>

namespace ziso {
namespace {

// =============================================================================
// Exit Codes
// =============================================================================

TEST(ErrorCodeTest, FamiliesMapToDocumentedExitCodes) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kUsageError), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kIOError), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kFormatError), 3);
    EXPECT_EQ(toExitCode(ErrorCode::kChecksumError), 4);
    EXPECT_EQ(toExitCode(ErrorCode::kIndexError), 5);
    EXPECT_EQ(toExitCode(ErrorCode::kCorruptedData), 6);
}

TEST(ErrorCodeTest, DetailedCodesCollapseIntoFamilies) {
    EXPECT_EQ(toExitCode(ErrorCode::kInvalidArgument), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kFileNotFound), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kFileExists), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kFileOpenFailed), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kSeekFailed), 2);
}

// =============================================================================
// Exceptions
// =============================================================================

TEST(ZisoExceptionTest, WhatIncludesCategoryAndContext) {
    FormatError error(FormatErrorKind::kBadMagic, "not a ZSO image",
                      ErrorContext("disc.zso").withOffset(0));

    const std::string what = error.what();
    EXPECT_NE(what.find("[format error]"), std::string::npos);
    EXPECT_NE(what.find("not a ZSO image"), std::string::npos);
    EXPECT_NE(what.find("disc.zso"), std::string::npos);
    EXPECT_EQ(error.kind(), FormatErrorKind::kBadMagic);
    EXPECT_EQ(error.exitCode(), 3);
}

TEST(ZisoExceptionTest, DomainErrorsCarryTheirKind) {
    IndexError index(IndexErrorKind::kOffsetTooLarge, "too large");
    EXPECT_EQ(index.kind(), IndexErrorKind::kOffsetTooLarge);
    EXPECT_EQ(index.code(), ErrorCode::kIndexError);

    TransformError transform(TransformErrorKind::kCorruptStream, "bad stream");
    EXPECT_EQ(transform.kind(), TransformErrorKind::kCorruptStream);
    EXPECT_EQ(transform.code(), ErrorCode::kCorruptedData);
}

TEST(ZisoExceptionTest, ChecksumErrorReportsBothDigests) {
    ChecksumError error(0x1111, 0x2222, ErrorContext("out.zso"));

    EXPECT_EQ(error.expected(), 0x1111U);
    EXPECT_EQ(error.actual(), 0x2222U);
    EXPECT_NE(std::string(error.what()).find("0000000000002222"), std::string::npos);
}

// =============================================================================
// Result Helpers
// =============================================================================

TEST(ResultTest, TryExecuteReturnsValue) {
    auto result = tryExecute([]() { return 42; });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
}

TEST(ResultTest, TryExecuteCapturesException) {
    auto result = tryExecute([]() -> int {
        throw IndexError(IndexErrorKind::kOutOfRange, "block 7 out of range");
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kIndexError);
    EXPECT_NE(result.error().message().find("block 7"), std::string::npos);
}

TEST(ResultTest, TryExecuteHandlesVoid) {
    bool called = false;
    auto result = tryExecute([&]() { called = true; });

    EXPECT_TRUE(result.has_value());
    EXPECT_TRUE(called);
}

}  // namespace
}  // namespace ziso
