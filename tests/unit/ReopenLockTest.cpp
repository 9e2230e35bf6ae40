/**
 * @file ReopenLockTest.cpp
 * @brief Unit tests for deferring reopens with Reopen::lock()
 */

#include <gtest/gtest.h>

#include <fdreopen/Reopen.hpp>
#include <fdreopen/ReopenLock.hpp>
#include <fdreopen/stream/MemoryStream.hpp>

#include "support/TestStreams.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>

using namespace FdReopen;
using FdReopenTest::History;
using FdReopenTest::memoryFactory;

namespace {

/// @brief Writes one byte per call and releases @p guard on its first write
class ReleasingStream : public ByteStream {
  public:
    ReleasingStream(std::shared_ptr<std::string> buffer, ReopenLock* guard)
        : inner_(std::move(buffer)), guard_(guard) {}

    size_t read(char* buf, size_t len, std::error_code& ec) override {
        return inner_.read(buf, len, ec);
    }

    size_t write(const char* buf, size_t len, std::error_code& ec) override {
        if (guard_ && guard_->locked())
            guard_->unlock();
        return inner_.write(buf, std::min<size_t>(len, 1), ec);
    }

  private:
    MemoryStream inner_;
    ReopenLock* guard_;
};

} // namespace

class ReopenLockTest : public ::testing::Test {
  protected:
    void SetUp() override {
        history_ = std::make_shared<History>();
        std::error_code ec;
        stream_ = Reopen<MemoryStream>::create(memoryFactory(history_), ec);
        ASSERT_TRUE(stream_);
        handle_ = std::make_unique<Handle>(stream_->handle());
    }

    std::shared_ptr<History> history_;
    std::unique_ptr<Reopen<MemoryStream>> stream_;
    std::unique_ptr<Handle> handle_;
};

TEST_F(ReopenLockTest, DefaultGuardHoldsNothing) {
    ReopenLock lock;
    EXPECT_FALSE(lock.locked());
}

TEST_F(ReopenLockTest, RequestWhileLockedIsDeferred) {
    std::error_code ec;
    {
        ReopenLock lock = stream_->lock();
        EXPECT_TRUE(lock.locked());
        ASSERT_TRUE(stream_->writeString("Hello ", ec));

        handle_->reopen();
        ASSERT_TRUE(stream_->writeString("world", ec));
        ASSERT_TRUE(stream_->flush(ec));
        EXPECT_EQ(history_->size(), 1u);
        EXPECT_TRUE(handle_->pending());
    }

    // Releasing alone does not reopen.
    EXPECT_EQ(history_->size(), 1u);

    ASSERT_TRUE(stream_->writeString("Another message", ec));
    ASSERT_EQ(history_->size(), 2u);
    EXPECT_EQ(history_->at(0), "Hello world");
    EXPECT_EQ(history_->at(1), "Another message");
    EXPECT_FALSE(handle_->pending());
}

TEST_F(ReopenLockTest, NestedGuardsStack) {
    std::error_code ec;
    ReopenLock outer = stream_->lock();
    handle_->reopen();
    {
        ReopenLock inner = stream_->lock();
        ASSERT_TRUE(stream_->writeString("a", ec));
    }
    // Outer guard still held.
    ASSERT_TRUE(stream_->writeString("b", ec));
    EXPECT_EQ(history_->size(), 1u);

    outer.unlock();
    EXPECT_FALSE(outer.locked());
    ASSERT_TRUE(stream_->writeString("c", ec));
    ASSERT_EQ(history_->size(), 2u);
    EXPECT_EQ(history_->at(0), "ab");
    EXPECT_EQ(history_->at(1), "c");
}

TEST_F(ReopenLockTest, UnlockIsIdempotent) {
    std::error_code ec;
    ReopenLock a = stream_->lock();
    ReopenLock b = stream_->lock();
    a.unlock();
    a.unlock();
    handle_->reopen();
    ASSERT_TRUE(stream_->writeString("x", ec));
    EXPECT_EQ(history_->size(), 1u); // b still suppresses

    b.unlock();
    ASSERT_TRUE(stream_->writeString("y", ec));
    EXPECT_EQ(history_->size(), 2u);
}

TEST_F(ReopenLockTest, MovedGuardReleasesOnce) {
    std::error_code ec;
    ReopenLock moved;
    {
        ReopenLock original = stream_->lock();
        moved = std::move(original);
        EXPECT_FALSE(original.locked());
        EXPECT_TRUE(moved.locked());
    }
    handle_->reopen();
    ASSERT_TRUE(stream_->writeString("still first", ec));
    EXPECT_EQ(history_->size(), 1u);

    ReopenLock again(std::move(moved));
    again.unlock();
    ASSERT_TRUE(stream_->writeString("second", ec));
    EXPECT_EQ(history_->size(), 2u);
}

TEST_F(ReopenLockTest, ReleasedWhenScopeUnwinds) {
    handle_->reopen();
    try {
        ReopenLock lock = stream_->lock();
        throw std::runtime_error("leaving scope");
    } catch (const std::runtime_error&) {
    }

    std::error_code ec;
    ASSERT_TRUE(stream_->writeString("z", ec));
    EXPECT_EQ(history_->size(), 2u);
}

TEST_F(ReopenLockTest, LockedReadsStayOnOneStream) {
    std::error_code ec;
    auto reader = Reopen<MemoryStream>::create(
        [](std::error_code& fec) {
            fec.clear();
            return std::make_unique<MemoryStream>(std::string("hello"));
        },
        ec);
    ASSERT_TRUE(reader);
    Handle h = reader->handle();

    char c;
    {
        ReopenLock lock = reader->lock();
        h.reopen();
        ASSERT_EQ(reader->read(&c, 1, ec), 1u);
        EXPECT_EQ(c, 'h');
        h.reopen();
        ASSERT_EQ(reader->read(&c, 1, ec), 1u);
        EXPECT_EQ(c, 'e');
    }
    // Reopened now: starts from the beginning again.
    ASSERT_EQ(reader->read(&c, 1, ec), 1u);
    EXPECT_EQ(c, 'h');
    EXPECT_EQ(reader->status().attempts, 1u);
}

// The last guard goes away while writeAll() is running: the call keeps its stream and the
// pending request is served by the next call.
TEST_F(ReopenLockTest, GuardReleasedDuringBulkWrite) {
    // guard is declared after writer so it is destroyed first on every exit path.
    std::unique_ptr<Reopen<ReleasingStream>> writer;
    ReopenLock guard;
    std::error_code ec;
    writer = Reopen<ReleasingStream>::create(
        [this, &guard](std::error_code& fec) {
            fec.clear();
            return std::make_unique<ReleasingStream>(history_->push(), &guard);
        },
        ec);
    ASSERT_TRUE(writer);
    Handle h = writer->handle();
    size_t before = history_->size();

    guard = writer->lock();
    h.reopen();
    ASSERT_TRUE(writer->writeString("abcdef", ec)) << ec.message();
    EXPECT_FALSE(guard.locked());
    EXPECT_TRUE(h.pending());
    ASSERT_EQ(history_->size(), before);
    EXPECT_EQ(history_->at(before - 1), "abcdef");

    ASSERT_TRUE(writer->writeString("g", ec));
    ASSERT_EQ(history_->size(), before + 1);
    EXPECT_EQ(history_->at(before), "g");
    EXPECT_FALSE(h.pending());
}
