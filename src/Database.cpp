#include <syslog.h>
#include <stdexcept>
#include <utility>

#include "Database.h"
#include "ServiceError.h"
#include "utils.h"

Database& Database::get() {
    static Database instance;   // created once, destroyed at program exit
    return instance;
}

void Database::open(const std::string& path) {
    std::lock_guard<std::mutex> lk(mu_);

    if (db_) {
        return; // db already open
    }

    // open the database
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("sqlite open failed: " + msg);
    }

    // another process holding the write lock makes us wait, not fail
    sqlite3_busy_timeout(db_, 5000);

    //
    // setup schema (if it doesn't already exist)
    //
    try {
        initSchema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

void Database::close(void) {
    std::lock_guard<std::mutex> lk(mu_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void Database::requireOpen(void) const {
    if (!db_)
        throw std::runtime_error("database not open");
}

//****************************************************************
// database design for txtreaderd
//
// users:            accounts (provisioned out-of-band) and their total reading time
// books:            uploaded plain-text books and where their text lives
// chapters:         headings detected at upload, ordered by position
// reading_progress: one row per (user, book), driven by heartbeats
//
// All positions are character (code point) offsets into the book text.
// All timestamps are UTC epoch milliseconds.
//****************************************************************
static void execOrThrow(sqlite3* db, const char* sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string msg = errmsg ? errmsg : sqlite3_errmsg(db);
        if (errmsg) sqlite3_free(errmsg);  // free exactly once
        throw std::runtime_error(msg);
    }
}

static void prepOrThrow(sqlite3* db, const char* sql, sqlite3_stmt** out, const char* where) {
    if (sqlite3_prepare_v2(db, sql, -1, out, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("prepare failed (") + where + "): " + sqlite3_errmsg(db));
}

// step a write statement to completion, finalize it either way
static void stepDoneOrThrow(sqlite3* db, sqlite3_stmt* stmt, const char* where) {
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        syslog(SYSLOG_ERR, "%s rc=%d %s", where, rc, sqlite3_errmsg(db));
        throw std::runtime_error(std::string("sqlite step failed (") + where + "): " + sqlite3_errmsg(db));
    }
}

static std::string columnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* p = sqlite3_column_text(stmt, col);
    return p ? std::string(reinterpret_cast<const char*>(p)) : std::string();
}

// rollback is safe to call even if no tx is open; SQLite will no-op
static void rollbackQuietly(sqlite3* db) {
    sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
}

void Database::initSchema(void) {
    execOrThrow(db_, "PRAGMA foreign_keys = ON;");
    execOrThrow(db_, "PRAGMA journal_mode = WAL;");     // readers don't block the heartbeat writer

    try {
        execOrThrow(db_, "BEGIN IMMEDIATE;");

        //
        //****************************************************************
        //  users:  accounts and their aggregate reading time
        //
        //  CREATE TABLE IF NOT EXISTS users (
        //    id                 INTEGER PRIMARY KEY,
        //    username           TEXT NOT NULL UNIQUE,
        //    pwd_hash           TEXT NOT NULL,         // crypto_pwhash_str() output
        //    created_at         INTEGER NOT NULL,
        //    total_reading_time INTEGER NOT NULL DEFAULT 0 )   // seconds, all books
        //
        //****************************************************************
        execOrThrow(db_, R"SQL(
            CREATE TABLE IF NOT EXISTS users (
              id                 INTEGER PRIMARY KEY,
              username           TEXT NOT NULL UNIQUE,
              pwd_hash           TEXT NOT NULL,
              created_at         INTEGER NOT NULL,
              total_reading_time INTEGER NOT NULL DEFAULT 0 CHECK (total_reading_time >= 0)
            );
        )SQL");

        //
        //****************************************************************
        //  books:  one row per uploaded book
        //
        // CREATE TABLE IF NOT EXISTS books (
        //    id          INTEGER PRIMARY KEY,
        //    user_id     INTEGER NOT NULL,             // owner
        //    title       TEXT NOT NULL,
        //    author      TEXT,
        //    location    TEXT NOT NULL UNIQUE,         // storage handle under librarydir
        //    is_public   INTEGER NOT NULL DEFAULT 0,
        //    created_at  INTEGER NOT NULL,
        //    sha256      TEXT NOT NULL,                // checksum of the stored text
        //    char_length INTEGER NOT NULL,             // code points in the stored text
        //    char_index  BLOB NOT NULL,                // CharIndex::serialize()
        //
        //    FOREIGN KEY (user_id) REFERENCES users(id) ON DELETE CASCADE );
        //
        //****************************************************************
        execOrThrow(db_, R"SQL(
            CREATE TABLE IF NOT EXISTS books (
              id          INTEGER PRIMARY KEY,
              user_id     INTEGER NOT NULL,
              title       TEXT NOT NULL,
              author      TEXT,
              location    TEXT NOT NULL UNIQUE,
              is_public   INTEGER NOT NULL DEFAULT 0,
              created_at  INTEGER NOT NULL,
              sha256      TEXT NOT NULL CHECK (length(sha256) = 64),
              char_length INTEGER NOT NULL CHECK (char_length >= 0),
              char_index  BLOB NOT NULL,
              FOREIGN KEY (user_id) REFERENCES users(id) ON DELETE CASCADE
            );
            CREATE INDEX IF NOT EXISTS idx_books_user ON books (user_id, created_at);
            CREATE INDEX IF NOT EXISTS idx_books_public ON books (is_public, created_at);
        )SQL");

        //
        //****************************************************************
        //  chapters: detected headings, written once at upload
        //
        // CREATE TABLE IF NOT EXISTS chapters (
        //    id       INTEGER PRIMARY KEY,
        //    book_id  INTEGER NOT NULL,
        //    title    TEXT NOT NULL,                   // trimmed heading line
        //    position INTEGER NOT NULL,                // start of the heading line
        //    ordinal  INTEGER NOT NULL,                // 0.. in position order
        //
        //    UNIQUE (book_id, ordinal),
        //    FOREIGN KEY (book_id) REFERENCES books(id) ON DELETE CASCADE );
        //
        //****************************************************************
        execOrThrow(db_, R"SQL(
            CREATE TABLE IF NOT EXISTS chapters (
              id       INTEGER PRIMARY KEY,
              book_id  INTEGER NOT NULL,
              title    TEXT NOT NULL,
              position INTEGER NOT NULL CHECK (position >= 0),
              ordinal  INTEGER NOT NULL,
              UNIQUE (book_id, ordinal),
              FOREIGN KEY (book_id) REFERENCES books(id) ON DELETE CASCADE
            );
            CREATE INDEX IF NOT EXISTS idx_chapters_book_position ON chapters (book_id, position);
        )SQL");

        //
        //****************************************************************
        //  reading_progress: authoritative position/time per (user, book)
        //
        // CREATE TABLE IF NOT EXISTS reading_progress (
        //    id             INTEGER PRIMARY KEY,
        //    user_id        INTEGER NOT NULL,
        //    book_id        INTEGER NOT NULL,
        //    position       INTEGER NOT NULL DEFAULT 0,    // characters
        //    reading_time   INTEGER NOT NULL DEFAULT 0,    // seconds, never decreases
        //    last_read_at   INTEGER,                       // last heartbeat
        //    last_device_id TEXT,                          // device of the last heartbeat
        //
        //    UNIQUE (user_id, book_id),
        //    FOREIGN KEY (user_id) REFERENCES users(id) ON DELETE CASCADE,
        //    FOREIGN KEY (book_id) REFERENCES books(id) ON DELETE CASCADE );
        //
        //****************************************************************
        execOrThrow(db_, R"SQL(
            CREATE TABLE IF NOT EXISTS reading_progress (
              id             INTEGER PRIMARY KEY,
              user_id        INTEGER NOT NULL,
              book_id        INTEGER NOT NULL,
              position       INTEGER NOT NULL DEFAULT 0 CHECK (position >= 0),
              reading_time   INTEGER NOT NULL DEFAULT 0 CHECK (reading_time >= 0),
              last_read_at   INTEGER,
              last_device_id TEXT,
              UNIQUE (user_id, book_id),
              FOREIGN KEY (user_id) REFERENCES users(id) ON DELETE CASCADE,
              FOREIGN KEY (book_id) REFERENCES books(id) ON DELETE CASCADE
            );
        )SQL");

        execOrThrow(db_, "COMMIT;");
    } catch (...) {
        rollbackQuietly(db_);
        throw;
    }
}

/////////////////////////////////////////////////////////////
// users
//
std::string Database::getUserPwdHash(const std::string& username, long long& userIdOut) {
    std::lock_guard<std::mutex> lk(mu_);
    requireOpen();

    static const char* SQL = "SELECT id, pwd_hash FROM users WHERE username = ?1 LIMIT 1";
    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "getUserPwdHash");
    sqlite3_bind_text(stmt, 1, username.c_str(), -1, SQLITE_TRANSIENT);

    std::string hash;
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        userIdOut = sqlite3_column_int64(stmt, 0);
        hash = columnText(stmt, 1);
    } else if (rc != SQLITE_DONE) {
        syslog(SYSLOG_ERR, "getUserPwdHash() rc=%d %s", rc, sqlite3_errmsg(db_));
        sqlite3_finalize(stmt);
        throw std::runtime_error(std::string("sqlite step failed (getUserPwdHash): ") + sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return hash;    // empty means user not found
}

long long Database::insertUser(const std::string& username, const std::string& pwdHash, long long nowMs) {
    std::lock_guard<std::mutex> lk(mu_);
    requireOpen();

    static const char* SQL = "INSERT INTO users (username, pwd_hash, created_at) VALUES (?1, ?2, ?3)";
    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "insertUser");
    sqlite3_bind_text (stmt, 1, username.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text (stmt, 2, pwdHash.c_str(),  -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(nowMs));
    stepDoneOrThrow(db_, stmt, "insertUser");

    return sqlite3_last_insert_rowid(db_);
}

// GET /api/auth/user_info
//   RETURNS: nullopt if no such user
std::optional<UserInfo> Database::getUserInfo(long long userId) {
    std::lock_guard<std::mutex> lk(mu_);
    requireOpen();

    static const char* SQL =
        "SELECT u.id, u.username, u.total_reading_time, "
        "       (SELECT COUNT(*) FROM books b WHERE b.user_id = u.id) "
        "FROM users u WHERE u.id = ?1 LIMIT 1";
    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "getUserInfo");
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(userId));

    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        syslog(SYSLOG_ERR, "getUserInfo() rc=%d %s", rc, sqlite3_errmsg(db_));
        sqlite3_finalize(stmt);
        throw std::runtime_error(std::string("sqlite step failed (getUserInfo): ") + sqlite3_errmsg(db_));
    }

    UserInfo info;
    info.id               = sqlite3_column_int64(stmt, 0);
    info.username         = columnText(stmt, 1);
    info.totalReadingTime = sqlite3_column_int64(stmt, 2);
    info.bookCount        = sqlite3_column_int64(stmt, 3);
    sqlite3_finalize(stmt);
    return info;
}

/////////////////////////////////////////////////////////////
// POST /api/books/upload
//   book row + every chapter row, or nothing
//
void Database::insertBook(BookRecord& book, const std::vector<ChapterMarker>& chapters,
                          std::vector<ChapterRecord>& chaptersOut) {
    std::lock_guard<std::mutex> lk(mu_);
    requireOpen();

    static const char* BOOK_SQL =
        "INSERT INTO books (user_id, title, author, location, is_public, created_at, sha256, char_length, char_index) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)";
    static const char* CHAPTER_SQL =
        "INSERT INTO chapters (book_id, title, position, ordinal) VALUES (?1, ?2, ?3, ?4)";

    std::vector<ChapterRecord> stored;
    stored.reserve(chapters.size());

    try {
        execOrThrow(db_, "BEGIN IMMEDIATE;");

        const std::string blob = book.charIndex.serialize();

        sqlite3_stmt* stmt = nullptr;
        prepOrThrow(db_, BOOK_SQL, &stmt, "insertBook");
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(book.userId));
        sqlite3_bind_text (stmt, 2, book.title.c_str(), -1, SQLITE_TRANSIENT);
        if (book.author)
            sqlite3_bind_text(stmt, 3, book.author->c_str(), -1, SQLITE_TRANSIENT);
        else
            sqlite3_bind_null(stmt, 3);
        sqlite3_bind_text (stmt, 4, book.location.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int  (stmt, 5, book.isPublic ? 1 : 0);
        sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(book.createdAt));
        sqlite3_bind_text (stmt, 7, book.sha256.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 8, static_cast<sqlite3_int64>(book.charLength()));
        sqlite3_bind_blob (stmt, 9, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
        stepDoneOrThrow(db_, stmt, "insertBook");

        const long long bookId = sqlite3_last_insert_rowid(db_);

        int ordinal = 0;
        for (const auto& ch : chapters) {
            prepOrThrow(db_, CHAPTER_SQL, &stmt, "insertChapter");
            sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(bookId));
            sqlite3_bind_text (stmt, 2, ch.title.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(ch.position));
            sqlite3_bind_int  (stmt, 4, ordinal);
            stepDoneOrThrow(db_, stmt, "insertChapter");

            stored.push_back(ChapterRecord{sqlite3_last_insert_rowid(db_), bookId, ch.title, ch.position, ordinal});
            ++ordinal;
        }

        execOrThrow(db_, "COMMIT;");
        book.id = bookId;
    } catch (...) {
        rollbackQuietly(db_);
        throw;
    }

    chaptersOut = std::move(stored);
}

std::optional<BookRecord> Database::fetchBook(long long bookId) {
    static const char* SQL =
        "SELECT id, user_id, title, author, location, is_public, created_at, sha256, char_index "
        "FROM books WHERE id = ?1 LIMIT 1";

    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "getBook");
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(bookId));

    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        syslog(SYSLOG_ERR, "getBook() rc=%d %s", rc, sqlite3_errmsg(db_));
        sqlite3_finalize(stmt);
        throw std::runtime_error(std::string("sqlite step failed (getBook): ") + sqlite3_errmsg(db_));
    }

    BookRecord b;
    b.id        = sqlite3_column_int64(stmt, 0);
    b.userId    = sqlite3_column_int64(stmt, 1);
    b.title     = columnText(stmt, 2);
    if (sqlite3_column_type(stmt, 3) != SQLITE_NULL)
        b.author = columnText(stmt, 3);
    b.location  = columnText(stmt, 4);
    b.isPublic  = sqlite3_column_int(stmt, 5) != 0;
    b.createdAt = sqlite3_column_int64(stmt, 6);
    b.sha256    = columnText(stmt, 7);

    const void* blob = sqlite3_column_blob(stmt, 8);
    const int blobSize = sqlite3_column_bytes(stmt, 8);
    try {
        b.charIndex = CharIndex::deserialize(blob, static_cast<size_t>(blobSize));
    } catch (...) {
        sqlite3_finalize(stmt);
        throw;
    }

    sqlite3_finalize(stmt);
    return b;
}

std::optional<BookRecord> Database::getBook(long long bookId) {
    std::lock_guard<std::mutex> lk(mu_);
    requireOpen();
    return fetchBook(bookId);
}

std::vector<ChapterRecord> Database::listChapters(long long bookId) {
    std::lock_guard<std::mutex> lk(mu_);
    requireOpen();

    static const char* SQL =
        "SELECT id, book_id, title, position, ordinal FROM chapters "
        "WHERE book_id = ?1 ORDER BY position ASC, ordinal ASC";

    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "listChapters");
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(bookId));

    std::vector<ChapterRecord> out;
    for (;;) {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW) {
            syslog(SYSLOG_ERR, "listChapters() rc=%d %s", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            throw std::runtime_error(std::string("sqlite step failed (listChapters): ") + sqlite3_errmsg(db_));
        }
        out.push_back(ChapterRecord{
            sqlite3_column_int64(stmt, 0),
            sqlite3_column_int64(stmt, 1),
            columnText(stmt, 2),
            sqlite3_column_int64(stmt, 3),
            sqlite3_column_int(stmt, 4)
        });
    }
    sqlite3_finalize(stmt);
    return out;
}

/////////////////////////////////////////////////////////////
// PUT /api/books/{id}
//
bool Database::updateBookMeta(long long bookId,
                              const std::optional<std::string>& title,
                              const std::optional<std::string>& author,
                              const std::optional<bool>& isPublic) {
    std::lock_guard<std::mutex> lk(mu_);
    requireOpen();

    // COALESCE keeps the stored value for every field we weren't given
    static const char* SQL =
        "UPDATE books SET "
        "  title     = COALESCE(?1, title), "
        "  author    = CASE WHEN ?2 THEN ?3 ELSE author END, "
        "  is_public = COALESCE(?4, is_public) "
        "WHERE id = ?5";

    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "updateBookMeta");
    if (title) sqlite3_bind_text(stmt, 1, title->c_str(), -1, SQLITE_TRANSIENT);
    else       sqlite3_bind_null(stmt, 1);
    sqlite3_bind_int(stmt, 2, author ? 1 : 0);
    if (author) sqlite3_bind_text(stmt, 3, author->c_str(), -1, SQLITE_TRANSIENT);
    else        sqlite3_bind_null(stmt, 3);
    if (isPublic) sqlite3_bind_int(stmt, 4, *isPublic ? 1 : 0);
    else          sqlite3_bind_null(stmt, 4);
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(bookId));
    stepDoneOrThrow(db_, stmt, "updateBookMeta");

    return sqlite3_changes(db_) > 0;
}

/////////////////////////////////////////////////////////////
// DELETE /api/books/{id}
//   chapters and reading_progress go with it (ON DELETE CASCADE)
//
std::string Database::deleteBook(long long bookId) {
    std::lock_guard<std::mutex> lk(mu_);
    requireOpen();

    std::string location;
    try {
        execOrThrow(db_, "BEGIN IMMEDIATE;");

        sqlite3_stmt* stmt = nullptr;
        prepOrThrow(db_, "SELECT location FROM books WHERE id = ?1", &stmt, "deleteBook");
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(bookId));
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            location = columnText(stmt, 0);
        } else if (rc != SQLITE_DONE) {
            sqlite3_finalize(stmt);
            throw std::runtime_error(std::string("sqlite step failed (deleteBook): ") + sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);

        if (!location.empty()) {
            prepOrThrow(db_, "DELETE FROM books WHERE id = ?1", &stmt, "deleteBook");
            sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(bookId));
            stepDoneOrThrow(db_, stmt, "deleteBook");
        }

        execOrThrow(db_, "COMMIT;");
    } catch (...) {
        rollbackQuietly(db_);
        throw;
    }
    return location;
}

/////////////////////////////////////////////////////////////
// GET /api/books, GET /api/books/public
//
static long long countRows(sqlite3* db, const char* sql, long long bindId, bool bind) {
    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db, sql, &stmt, "countRows");
    if (bind) sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(bindId));

    long long n = 0;
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        n = sqlite3_column_int64(stmt, 0);
    } else {
        sqlite3_finalize(stmt);
        throw std::runtime_error(std::string("sqlite step failed (countRows): ") + sqlite3_errmsg(db));
    }
    sqlite3_finalize(stmt);
    return n;
}

long long Database::listUserBooks(long long userId, int page, int limit, Json::Value& rowsOut) {
    std::lock_guard<std::mutex> lk(mu_);
    requireOpen();

    const long long total = countRows(db_, "SELECT COUNT(*) FROM books WHERE user_id = ?1", userId, true);

    // most recently read first, never-read books last (newest upload first)
    static const char* SQL =
        "SELECT b.id, b.title, b.author, b.is_public, b.created_at, "
        "       rp.position, rp.reading_time, rp.last_read_at "
        "FROM books b "
        "LEFT JOIN reading_progress rp ON rp.book_id = b.id AND rp.user_id = ?1 "
        "WHERE b.user_id = ?1 "
        "ORDER BY (rp.last_read_at IS NULL) ASC, rp.last_read_at DESC, b.created_at DESC, b.id DESC "
        "LIMIT ?2 OFFSET ?3";

    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "listUserBooks");
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(userId));
    sqlite3_bind_int  (stmt, 2, limit);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(page - 1) * limit);

    for (;;) {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW) {
            syslog(SYSLOG_ERR, "listUserBooks() rc=%d %s", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            throw std::runtime_error(std::string("sqlite step failed (listUserBooks): ") + sqlite3_errmsg(db_));
        }

        Json::Value row(Json::objectValue);
        row["book_id"]      = static_cast<Json::Int64>(sqlite3_column_int64(stmt, 0));
        row["title"]        = columnText(stmt, 1);
        if (sqlite3_column_type(stmt, 2) != SQLITE_NULL)
            row["author"]   = columnText(stmt, 2);
        row["is_public"]    = sqlite3_column_int(stmt, 3) != 0;
        row["created_at"]   = static_cast<Json::Int64>(sqlite3_column_int64(stmt, 4));
        row["position"]     = static_cast<Json::Int64>(sqlite3_column_int64(stmt, 5));   // NULL reads as 0
        row["reading_time"] = static_cast<Json::Int64>(sqlite3_column_int64(stmt, 6));
        if (sqlite3_column_type(stmt, 7) != SQLITE_NULL)
            row["last_read_at"] = static_cast<Json::Int64>(sqlite3_column_int64(stmt, 7));
        rowsOut.append(row);
    }
    sqlite3_finalize(stmt);
    return total;
}

long long Database::listPublicBooks(int page, int limit, Json::Value& rowsOut) {
    std::lock_guard<std::mutex> lk(mu_);
    requireOpen();

    const long long total = countRows(db_, "SELECT COUNT(*) FROM books WHERE is_public = 1", 0, false);

    static const char* SQL =
        "SELECT b.id, b.title, b.author, b.created_at, u.username "
        "FROM books b JOIN users u ON u.id = b.user_id "
        "WHERE b.is_public = 1 "
        "ORDER BY b.created_at DESC, b.id DESC "
        "LIMIT ?1 OFFSET ?2";

    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "listPublicBooks");
    sqlite3_bind_int  (stmt, 1, limit);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(page - 1) * limit);

    for (;;) {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW) {
            syslog(SYSLOG_ERR, "listPublicBooks() rc=%d %s", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            throw std::runtime_error(std::string("sqlite step failed (listPublicBooks): ") + sqlite3_errmsg(db_));
        }

        Json::Value row(Json::objectValue);
        row["book_id"]        = static_cast<Json::Int64>(sqlite3_column_int64(stmt, 0));
        row["title"]          = columnText(stmt, 1);
        if (sqlite3_column_type(stmt, 2) != SQLITE_NULL)
            row["author"]     = columnText(stmt, 2);
        row["created_at"]     = static_cast<Json::Int64>(sqlite3_column_int64(stmt, 3));
        row["owner_username"] = columnText(stmt, 4);
        rowsOut.append(row);
    }
    sqlite3_finalize(stmt);
    return total;
}

// GET /api/books/random_public
//   up to `count` public books in random order
void Database::randomPublicBooks(int count, Json::Value& rowsOut) {
    std::lock_guard<std::mutex> lk(mu_);
    requireOpen();

    static const char* SQL =
        "SELECT b.id, b.title, b.author, b.created_at, u.username "
        "FROM books b JOIN users u ON u.id = b.user_id "
        "WHERE b.is_public = 1 "
        "ORDER BY random() "
        "LIMIT ?1";

    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "randomPublicBooks");
    sqlite3_bind_int(stmt, 1, count);

    for (;;) {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW) {
            syslog(SYSLOG_ERR, "randomPublicBooks() rc=%d %s", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            throw std::runtime_error(std::string("sqlite step failed (randomPublicBooks): ") + sqlite3_errmsg(db_));
        }

        Json::Value row(Json::objectValue);
        row["book_id"]        = static_cast<Json::Int64>(sqlite3_column_int64(stmt, 0));
        row["title"]          = columnText(stmt, 1);
        if (sqlite3_column_type(stmt, 2) != SQLITE_NULL)
            row["author"]     = columnText(stmt, 2);
        row["created_at"]     = static_cast<Json::Int64>(sqlite3_column_int64(stmt, 3));
        row["owner_username"] = columnText(stmt, 4);
        rowsOut.append(row);
    }
    sqlite3_finalize(stmt);
}

/////////////////////////////////////////////////////////////
// reading_progress
//
std::optional<ProgressRecord> Database::fetchProgress(long long userId, long long bookId) {
    static const char* SQL =
        "SELECT position, reading_time, last_read_at, last_device_id "
        "FROM reading_progress WHERE user_id = ?1 AND book_id = ?2 LIMIT 1";

    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "getProgress");
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(userId));
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(bookId));

    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        syslog(SYSLOG_ERR, "getProgress() rc=%d %s", rc, sqlite3_errmsg(db_));
        sqlite3_finalize(stmt);
        throw std::runtime_error(std::string("sqlite step failed (getProgress): ") + sqlite3_errmsg(db_));
    }

    ProgressRecord p;
    p.position     = sqlite3_column_int64(stmt, 0);
    p.readingTime  = sqlite3_column_int64(stmt, 1);
    p.lastReadAt   = sqlite3_column_int64(stmt, 2);     // NULL reads as 0
    p.lastDeviceId = columnText(stmt, 3);
    sqlite3_finalize(stmt);
    return p;
}

std::optional<ProgressRecord> Database::getProgress(long long userId, long long bookId) {
    std::lock_guard<std::mutex> lk(mu_);
    requireOpen();
    return fetchProgress(userId, bookId);
}

ProgressDecision Database::applyProgress(long long userId, long long bookId, const ProgressFn& decide) {
    std::lock_guard<std::mutex> lk(mu_);
    requireOpen();

    static const char* UPSERT_SQL =
        "INSERT INTO reading_progress (user_id, book_id, position, reading_time, last_read_at, last_device_id) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6) "
        "ON CONFLICT (user_id, book_id) DO UPDATE SET "
        "  position       = excluded.position, "
        "  reading_time   = excluded.reading_time, "
        "  last_read_at   = excluded.last_read_at, "
        "  last_device_id = excluded.last_device_id";
    static const char* CREDIT_SQL =
        "UPDATE users SET total_reading_time = total_reading_time + ?1 WHERE id = ?2";

    ProgressDecision decision;
    try {
        // IMMEDIATE takes the write lock up front: no other heartbeat can read
        // the row between our SELECT and our UPDATE
        execOrThrow(db_, "BEGIN IMMEDIATE;");

        auto book = fetchBook(bookId);
        if (!book)
            throw ServiceError(ErrorKind::NotFound, "book " + std::to_string(bookId) + " not found");

        const auto current = fetchProgress(userId, bookId);
        decision = decide(*book, current);

        const ProgressRecord& next = decision.next;
        sqlite3_stmt* stmt = nullptr;
        prepOrThrow(db_, UPSERT_SQL, &stmt, "applyProgress");
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(userId));
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(bookId));
        sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(next.position));
        sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(next.readingTime));
        sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(next.lastReadAt));
        sqlite3_bind_text (stmt, 6, next.lastDeviceId.c_str(), -1, SQLITE_TRANSIENT);
        stepDoneOrThrow(db_, stmt, "applyProgress");

        if (decision.credited > 0) {
            prepOrThrow(db_, CREDIT_SQL, &stmt, "creditUser");
            sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(decision.credited));
            sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(userId));
            stepDoneOrThrow(db_, stmt, "creditUser");
        }

        execOrThrow(db_, "COMMIT;");
    } catch (...) {
        rollbackQuietly(db_);
        throw;
    }
    return decision;
}
