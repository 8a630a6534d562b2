#include "termbar/common/error_codes.hpp"
#include <gtest/gtest.h>

using namespace termbar::common;

TEST(ErrorCodesTest, RegistryNamesCodes) {
    EXPECT_STREQ(ErrorCodeHelper::toString(ErrorCode::INVALID_COLOUR), "INVALID_COLOUR");
    EXPECT_STREQ(ErrorCodeHelper::getMessage(ErrorCode::IO_WRITE_FAILED),
                 "Failed to write to output stream");
    EXPECT_STREQ(ErrorCodeHelper::toString(static_cast<ErrorCode>(999)), "UNKNOWN");
}

TEST(ErrorCodesTest, MessageIncludesCodeAndContext) {
    TermbarError error(ErrorCode::INVALID_COLOUR, "Unrecognised colour",
                       ErrorContext{"Terminal", {{"colour", "mauve"}}});
    EXPECT_EQ(error.code(), ErrorCode::INVALID_COLOUR);
    EXPECT_STREQ(error.what(), "INVALID_COLOUR: Unrecognised colour ([Terminal] colour=mauve)");
    EXPECT_EQ(error.context().component, "Terminal");
}

TEST(ErrorCodesTest, DefaultMessageUsedWhenEmpty) {
    TermbarError error(ErrorCode::INPUT_READ_FAILED);
    EXPECT_STREQ(error.what(), "INPUT_READ_FAILED: Failed to read from input stream");
}

TEST(ErrorCodesTest, CatchableAsRuntimeError) {
    EXPECT_THROW(throw TermbarError(ErrorCode::INVALID_ARGUMENT, "bad"), std::runtime_error);
}
