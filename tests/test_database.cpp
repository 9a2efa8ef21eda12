#include <gtest/gtest.h>

#include <filesystem>
#include <set>
#include <string>

#include "CharIndex.h"
#include "Database.h"

namespace fs = std::filesystem;

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "txtreader_db_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        Database::get().open((test_dir_ / "test.db").string());

        alice_ = Database::get().insertUser("alice", "x", 1);
        bob_   = Database::get().insertUser("bob", "x", 1);
    }

    void TearDown() override {
        Database::get().close();
        fs::remove_all(test_dir_);
    }

    long long addBook(long long owner, const std::string& title, bool isPublic) {
        BookRecord book;
        book.userId    = owner;
        book.title     = title;
        book.location  = title + ".txt";
        book.isPublic  = isPublic;
        book.createdAt = 1;
        book.sha256    = std::string(64, 'f');
        book.charIndex = CharIndex::build("abc");
        std::vector<ChapterRecord> chapters;
        Database::get().insertBook(book, {}, chapters);
        return book.id;
    }

    fs::path test_dir_;
    long long alice_ = 0;
    long long bob_ = 0;
};

// ============================================================================
// users
// ============================================================================

TEST_F(DatabaseTest, UserInfoCountsOwnedBooks) {
    addBook(alice_, "one", false);
    addBook(alice_, "two", true);
    addBook(bob_, "three", true);

    const auto info = Database::get().getUserInfo(alice_);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->id, alice_);
    EXPECT_EQ(info->username, "alice");
    EXPECT_EQ(info->totalReadingTime, 0);
    EXPECT_EQ(info->bookCount, 2);
}

TEST_F(DatabaseTest, UserInfoReflectsCreditedTime) {
    const long long bookId = addBook(alice_, "one", false);
    const auto credit = [](const BookRecord&, const std::optional<ProgressRecord>&) {
        ProgressDecision d;
        d.next.position     = 1;
        d.next.readingTime  = 25;
        d.next.lastReadAt   = 1000;
        d.next.lastDeviceId = "phone";
        d.credited          = 25;
        return d;
    };
    Database::get().applyProgress(alice_, bookId, credit);

    EXPECT_EQ(Database::get().getUserInfo(alice_)->totalReadingTime, 25);
    EXPECT_EQ(Database::get().getUserInfo(bob_)->totalReadingTime, 0);
}

TEST_F(DatabaseTest, UserInfoForUnknownUser) {
    EXPECT_FALSE(Database::get().getUserInfo(bob_ + 100).has_value());
}

// ============================================================================
// random public books
// ============================================================================

TEST_F(DatabaseTest, RandomPublicBooksOnlyReturnsPublic) {
    addBook(alice_, "private", false);
    const long long pub1 = addBook(alice_, "public1", true);
    const long long pub2 = addBook(bob_, "public2", true);

    Json::Value rows(Json::arrayValue);
    Database::get().randomPublicBooks(10, rows);
    ASSERT_EQ(rows.size(), 2u);

    std::set<long long> ids;
    for (const auto& r : rows) {
        ids.insert(r["book_id"].asInt64());
        EXPECT_TRUE(r.isMember("owner_username"));
    }
    EXPECT_EQ(ids, (std::set<long long>{pub1, pub2}));
}

TEST_F(DatabaseTest, RandomPublicBooksHonoursCount) {
    for (int k = 0; k < 5; ++k)
        addBook(alice_, "public" + std::to_string(k), true);

    Json::Value rows(Json::arrayValue);
    Database::get().randomPublicBooks(3, rows);
    EXPECT_EQ(rows.size(), 3u);

    Json::Value one(Json::arrayValue);
    Database::get().randomPublicBooks(1, one);
    ASSERT_EQ(one.size(), 1u);
    EXPECT_EQ(one[0]["owner_username"].asString(), "alice");
}

TEST_F(DatabaseTest, RandomPublicBooksWithNoneShared) {
    addBook(alice_, "private", false);
    Json::Value rows(Json::arrayValue);
    Database::get().randomPublicBooks(5, rows);
    EXPECT_EQ(rows.size(), 0u);
}
