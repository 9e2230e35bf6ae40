/**
 * @file ErrorTest.cpp
 * @brief Unit tests for the fdreopen error category
 */

#include <gtest/gtest.h>

#include <fdreopen/util/Error.hpp>

#include <cerrno>
#include <ios>
#include <string>

using namespace FdReopen;

TEST(ErrorTest, CategoryName) {
    std::error_code ec = Errc::UnexpectedEof;
    EXPECT_STREQ(ec.category().name(), "fdreopen");
    EXPECT_EQ(&ec.category(), &errorCategory());
}

TEST(ErrorTest, EveryCodeHasAMessage) {
    for (Errc e : {Errc::UnexpectedEof, Errc::WriteZero, Errc::InvalidSignal,
                   Errc::TooManyBindings, Errc::NotOpen}) {
        std::error_code ec = make_error_code(e);
        EXPECT_TRUE(ec);
        EXPECT_FALSE(ec.message().empty());
        EXPECT_NE(ec.message(), "unknown fdreopen error");
    }
}

TEST(ErrorTest, DistinctFromGenericCodes) {
    std::error_code ours = Errc::UnexpectedEof;
    std::error_code generic(static_cast<int>(Errc::UnexpectedEof), std::generic_category());
    EXPECT_NE(ours, generic);
    EXPECT_EQ(ours, Errc::UnexpectedEof);
}

TEST(ErrorTest, ReopenErrorKeepsErrnoCondition) {
    std::error_code ec = makeReopenError(std::make_error_code(std::errc::permission_denied));
    EXPECT_TRUE(isReopenError(ec));
    EXPECT_STREQ(ec.category().name(), "fdreopen.reopen");
    EXPECT_EQ(ec, std::errc::permission_denied);
    EXPECT_NE(ec, std::make_error_code(std::errc::permission_denied));
    EXPECT_EQ(ec.message().find("reopen failed"), 0u);
}

TEST(ErrorTest, ReopenErrorFromSystemCategory) {
    std::error_code ec = makeReopenError(std::error_code(ENOENT, std::system_category()));
    EXPECT_TRUE(isReopenError(ec));
    EXPECT_EQ(ec, std::errc::no_such_file_or_directory);
}

TEST(ErrorTest, ReopenErrorFromLibraryCode) {
    std::error_code ec = makeReopenError(Errc::NotOpen);
    EXPECT_TRUE(isReopenError(ec));
    EXPECT_EQ(ec.default_error_condition(),
              std::error_condition(static_cast<int>(Errc::NotOpen), errorCategory()));
    EXPECT_NE(ec.message().find("not open"), std::string::npos);
}

TEST(ErrorTest, ReopenErrorFromForeignCategoryIsIoError) {
    std::error_code ec = makeReopenError(std::make_error_code(std::io_errc::stream));
    EXPECT_TRUE(isReopenError(ec));
    EXPECT_EQ(ec, std::errc::io_error);
}

TEST(ErrorTest, ReopenErrorIsNotRetagged) {
    std::error_code once = makeReopenError(std::make_error_code(std::errc::io_error));
    EXPECT_EQ(makeReopenError(once), once);
    EXPECT_FALSE(makeReopenError(std::error_code()));
    EXPECT_FALSE(isReopenError(std::make_error_code(std::errc::io_error)));
}
