#ifndef TXTREADER_DATABASE_H
#define TXTREADER_DATABASE_H

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sqlite3.h>
#include <json/value.h>

#include "Models.h"

//
// Database: the SQLite storage collaborator.  All SQL lives here.
//   One connection is shared by every drogon thread, so each public call holds
//   mu_ for its whole duration; multi-statement writes also run inside a
//   BEGIN IMMEDIATE transaction, which serializes them against other processes.
//
class Database {
    public:
        // decides the new progress row given the book and the current row (if any)
        using ProgressFn = std::function<ProgressDecision(const BookRecord& book,
                                                          const std::optional<ProgressRecord>& current)>;

        static Database& get();     // singleton instance
        sqlite3* handle() { return db_; }

        void open(const std::string& path);
        void close(void);
        bool isOpen() const { return db_ != nullptr; }

        // users (identity collaborator)
        //   RETURNS: password hash, empty if no such user
        std::string getUserPwdHash(const std::string& username, long long& userIdOut);
        long long insertUser(const std::string& username, const std::string& pwdHash, long long nowMs);
        std::optional<UserInfo> getUserInfo(long long userId);   // nullopt if no such user

        // books + chapters
        //   book.id is filled in; chaptersOut receives the stored chapter rows
        void insertBook(BookRecord& book, const std::vector<ChapterMarker>& chapters,
                        std::vector<ChapterRecord>& chaptersOut);
        std::optional<BookRecord> getBook(long long bookId);
        std::vector<ChapterRecord> listChapters(long long bookId);     // ordered by position

        // metadata edit; unset fields are left alone.  RETURNS: false if no such book
        bool updateBookMeta(long long bookId,
                            const std::optional<std::string>& title,
                            const std::optional<std::string>& author,
                            const std::optional<bool>& isPublic);

        // deletes the book row (chapters and progress cascade).
        //   RETURNS: storage handle of the deleted book, empty if no such book
        std::string deleteBook(long long bookId);

        // paging lists: append rows, RETURN total row count
        long long listUserBooks(long long userId, int page, int limit, Json::Value& rowsOut);
        long long listPublicBooks(int page, int limit, Json::Value& rowsOut);
        void randomPublicBooks(int count, Json::Value& rowsOut);

        // reading_progress
        std::optional<ProgressRecord> getProgress(long long userId, long long bookId);

        // atomic read-modify-write of one (user, book) progress row:
        //   loads book + row, asks decide() for the new row, writes it and credits
        //   users.total_reading_time, all in one transaction.
        //   throws ServiceError(NotFound) for an unknown book; anything decide()
        //   throws rolls the transaction back and propagates.
        ProgressDecision applyProgress(long long userId, long long bookId, const ProgressFn& decide);

    private:
        sqlite3* db_ = nullptr;
        std::mutex mu_;

        // restrict construction/destruction/copy/equality
        Database() = default;
        ~Database() = default;
        Database(const Database&) = delete;
        Database& operator=(const Database&) = delete;

        void initSchema(void);  // build the db schema, if it doesn't exist
        void requireOpen(void) const;

        // unlocked helpers: caller holds mu_
        std::optional<BookRecord> fetchBook(long long bookId);
        std::optional<ProgressRecord> fetchProgress(long long userId, long long bookId);
};

#endif // TXTREADER_DATABASE_H
