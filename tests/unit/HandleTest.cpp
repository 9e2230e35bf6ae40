/**
 * @file HandleTest.cpp
 * @brief Unit tests for Handle, the reopen trigger
 */

#include <gtest/gtest.h>

#include <fdreopen/Handle.hpp>
#include <fdreopen/Reopen.hpp>
#include <fdreopen/stream/MemoryStream.hpp>

#include "support/TestStreams.hpp"

using namespace FdReopen;
using FdReopenTest::History;
using FdReopenTest::memoryFactory;

TEST(HandleTest, StubStartsClear) {
    Handle h = Handle::stub();
    EXPECT_FALSE(h.pending());
}

TEST(HandleTest, ReopenSetsFlag) {
    Handle h = Handle::stub();
    h.reopen();
    EXPECT_TRUE(h.pending());
    h.reopen();
    EXPECT_TRUE(h.pending());
}

TEST(HandleTest, CopiesShareTheFlag) {
    Handle a = Handle::stub();
    Handle b = a;
    EXPECT_TRUE(a.sameTarget(b));

    b.reopen();
    EXPECT_TRUE(a.pending());
}

TEST(HandleTest, StubsAreIndependent) {
    Handle a = Handle::stub();
    Handle b = Handle::stub();
    EXPECT_FALSE(a.sameTarget(b));

    a.reopen();
    EXPECT_FALSE(b.pending());
}

TEST(HandleTest, MovedFromHandleStaysUsable) {
    Handle a = Handle::stub();
    Handle b = std::move(a);
    a.reopen();
    EXPECT_TRUE(b.pending());
}

TEST(HandleTest, HandlesOfOneReopenControlIt) {
    auto history = std::make_shared<History>();
    std::error_code ec;
    auto stream = Reopen<MemoryStream>::create(memoryFactory(history), ec);
    ASSERT_TRUE(stream);

    Handle first = stream->handle();
    Handle second = stream->handle();
    EXPECT_TRUE(first.sameTarget(second));
    EXPECT_FALSE(first.pending());

    second.reopen();
    EXPECT_TRUE(first.pending());
    EXPECT_EQ(history->size(), 1u); // requesting alone opens nothing
}

TEST(HandleTest, OutlivesItsReopen) {
    auto history = std::make_shared<History>();
    Handle h = Handle::stub();
    {
        std::error_code ec;
        auto stream = Reopen<MemoryStream>::create(memoryFactory(history), ec);
        ASSERT_TRUE(stream);
        h = stream->handle();
    }

    h.reopen();
    h.reopen();
    EXPECT_TRUE(h.pending());
    EXPECT_EQ(history->size(), 1u);
}
