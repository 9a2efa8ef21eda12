#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include "CharIndex.h"
#include "Database.h"
#include "ProgressSync.h"
#include "ServiceError.h"

namespace fs = std::filesystem;

// ============================================================================
// reconcileHeartbeat(): no storage involved
// ============================================================================

namespace {

constexpr long long kT0 = 1700000000000LL;

ProgressRecord row(long long position, long long readingTime, long long lastReadAt, const std::string& device) {
    ProgressRecord r;
    r.position     = position;
    r.readingTime  = readingTime;
    r.lastReadAt   = lastReadAt;
    r.lastDeviceId = device;
    return r;
}

} // namespace

TEST(ReconcileHeartbeatTest, FirstHeartbeatCreatesRow) {
    const auto d = reconcileHeartbeat(std::nullopt, "phone", 250, kT0, 30);
    EXPECT_TRUE(d.synced);
    EXPECT_EQ(d.credited, 0);
    EXPECT_EQ(d.next.position, 250);
    EXPECT_EQ(d.next.readingTime, 0);
    EXPECT_EQ(d.next.lastReadAt, kT0);
    EXPECT_EQ(d.next.lastDeviceId, "phone");
}

TEST(ReconcileHeartbeatTest, SameDeviceCreditsElapsed) {
    const auto d = reconcileHeartbeat(row(100, 40, kT0, "phone"), "phone", 200, kT0 + 10000, 30);
    EXPECT_TRUE(d.synced);
    EXPECT_EQ(d.credited, 10);
    EXPECT_EQ(d.next.position, 200);
    EXPECT_EQ(d.next.readingTime, 50);
    EXPECT_EQ(d.next.lastReadAt, kT0 + 10000);
}

TEST(ReconcileHeartbeatTest, ElapsedIsClampedToInterval) {
    const auto late = reconcileHeartbeat(row(100, 0, kT0, "phone"), "phone", 100, kT0 + 600000, 30);
    EXPECT_EQ(late.credited, 30);

    const auto backwards = reconcileHeartbeat(row(100, 5, kT0, "phone"), "phone", 100, kT0 - 5000, 30);
    EXPECT_EQ(backwards.credited, 0);
    EXPECT_EQ(backwards.next.readingTime, 5);
}

TEST(ReconcileHeartbeatTest, SubSecondElapsedCreditsNothing) {
    const auto d = reconcileHeartbeat(row(100, 7, kT0, "phone"), "phone", 110, kT0 + 999, 30);
    EXPECT_EQ(d.credited, 0);
    EXPECT_EQ(d.next.position, 110);
}

TEST(ReconcileHeartbeatTest, DeviceSwitchWithStalePositionReanchors) {
    const auto d = reconcileHeartbeat(row(500, 60, kT0, "phone"), "tablet", 300, kT0 + 10000, 30);
    EXPECT_FALSE(d.synced);
    EXPECT_EQ(d.credited, 0);
    EXPECT_EQ(d.next.position, 500);
    EXPECT_EQ(d.next.readingTime, 60);
    EXPECT_EQ(d.next.lastDeviceId, "tablet");
    EXPECT_EQ(d.next.lastReadAt, kT0 + 10000);
}

TEST(ReconcileHeartbeatTest, DeviceSwitchAtSamePositionIsSynced) {
    const auto d = reconcileHeartbeat(row(500, 60, kT0, "phone"), "tablet", 500, kT0 + 10000, 30);
    EXPECT_TRUE(d.synced);
    EXPECT_EQ(d.credited, 0);
    EXPECT_EQ(d.next.position, 500);
    EXPECT_EQ(d.next.lastDeviceId, "tablet");
}

// ============================================================================
// ProgressSync through SQLite
// ============================================================================

class ProgressSyncTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "txtreader_progress_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        Database::get().open((test_dir_ / "test.db").string());

        userId_ = Database::get().insertUser("reader", "x", kT0);

        BookRecord book;
        book.userId    = userId_;
        book.title     = "Thousand";
        book.location  = "0123abcd.txt";
        book.createdAt = kT0;
        book.sha256    = std::string(64, '0');
        book.charIndex = CharIndex::build(std::string(1000, 'a'));
        std::vector<ChapterRecord> chapters;
        Database::get().insertBook(book, {}, chapters);
        bookId_ = book.id;

        now_ = kT0;
    }

    void TearDown() override {
        Database::get().close();
        fs::remove_all(test_dir_);
    }

    ProgressSync sync(long long maxInterval = 30) {
        return ProgressSync(Database::get(), maxInterval, [this] { return now_; });
    }

    fs::path test_dir_;
    long long userId_ = 0;
    long long bookId_ = 0;
    long long now_ = 0;
};

TEST_F(ProgressSyncTest, ReadingDoesNotCreateProgress) {
    EXPECT_FALSE(Database::get().getProgress(userId_, bookId_).has_value());
}

TEST_F(ProgressSyncTest, SameDeviceAccumulatesTime) {
    auto s = sync();

    auto r = s.heartbeat(userId_, bookId_, "phone", 100);
    EXPECT_TRUE(r.synced);
    EXPECT_EQ(r.position, 100);
    EXPECT_EQ(r.readingTime, 0);

    now_ += 10000;
    r = s.heartbeat(userId_, bookId_, "phone", 200);
    EXPECT_TRUE(r.synced);
    EXPECT_EQ(r.position, 200);
    EXPECT_EQ(r.readingTime, 10);

    const auto stored = Database::get().getProgress(userId_, bookId_);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->position, 200);
    EXPECT_EQ(stored->readingTime, 10);
    EXPECT_EQ(stored->lastReadAt, now_);
    EXPECT_EQ(stored->lastDeviceId, "phone");

    EXPECT_EQ(Database::get().getUserInfo(userId_)->totalReadingTime, 10);
}

TEST_F(ProgressSyncTest, DeviceSwitchKeepsAuthoritativePosition) {
    auto s = sync();
    s.heartbeat(userId_, bookId_, "phone", 500);

    now_ += 10000;
    auto r = s.heartbeat(userId_, bookId_, "tablet", 300);
    EXPECT_FALSE(r.synced);
    EXPECT_EQ(r.position, 500);
    EXPECT_EQ(r.readingTime, 0);

    // tablet re-anchored and carries on: now it is the same device
    now_ += 5000;
    r = s.heartbeat(userId_, bookId_, "tablet", 520);
    EXPECT_TRUE(r.synced);
    EXPECT_EQ(r.position, 520);
    EXPECT_EQ(r.readingTime, 5);

    EXPECT_EQ(Database::get().getUserInfo(userId_)->totalReadingTime, 5);
}

TEST_F(ProgressSyncTest, IdleGapCreditsAtMostOneInterval) {
    auto s = sync(30);
    s.heartbeat(userId_, bookId_, "phone", 0);

    now_ += 3600 * 1000;
    const auto r = s.heartbeat(userId_, bookId_, "phone", 10);
    EXPECT_EQ(r.readingTime, 30);
}

TEST_F(ProgressSyncTest, PositionAtEndOfBookIsAccepted) {
    const auto r = sync().heartbeat(userId_, bookId_, "phone", 1000);
    EXPECT_TRUE(r.synced);
    EXPECT_EQ(r.position, 1000);
}

TEST_F(ProgressSyncTest, OutOfRangePositionWritesNothing) {
    auto s = sync();
    try {
        s.heartbeat(userId_, bookId_, "phone", 1001);
        FAIL() << "position past end accepted";
    } catch (const ServiceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidRange);
    }
    EXPECT_THROW(s.heartbeat(userId_, bookId_, "phone", -1), ServiceError);
    EXPECT_FALSE(Database::get().getProgress(userId_, bookId_).has_value());
}

TEST_F(ProgressSyncTest, UnknownBookIsNotFound) {
    try {
        sync().heartbeat(userId_, bookId_ + 100, "phone", 0);
        FAIL() << "unknown book accepted";
    } catch (const ServiceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
}

TEST_F(ProgressSyncTest, ProgressIsPerUser) {
    const long long other = Database::get().insertUser("other", "x", kT0);
    auto s = sync();
    s.heartbeat(userId_, bookId_, "phone", 100);
    s.heartbeat(other, bookId_, "laptop", 700);

    EXPECT_EQ(Database::get().getProgress(userId_, bookId_)->position, 100);
    EXPECT_EQ(Database::get().getProgress(other, bookId_)->position, 700);
}

TEST_F(ProgressSyncTest, ConcurrentHeartbeatsCreditOnce) {
    auto s = sync();
    s.heartbeat(userId_, bookId_, "phone", 100);

    // every thread reports the same beat, 10s after the first
    now_ += 10000;
    constexpr int kThreads = 8;
    std::vector<std::thread> threads;
    for (int k = 0; k < kThreads; ++k) {
        threads.emplace_back([this, k] {
            ProgressSync mine(Database::get(), 30, [this] { return now_; });
            mine.heartbeat(userId_, bookId_, "phone", 200 + k);
        });
    }
    for (auto& t : threads) t.join();

    const auto stored = Database::get().getProgress(userId_, bookId_);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->readingTime, 10);
    EXPECT_GE(stored->position, 200);
    EXPECT_LT(stored->position, 200 + kThreads);
    EXPECT_EQ(Database::get().getUserInfo(userId_)->totalReadingTime, 10);
}
