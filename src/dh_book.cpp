//*************************************************************
// drogon handler for "GET|PUT|DELETE /api/books/{id}" requests
//*************************************************************
#include <syslog.h>

#include <drogon/drogon.h>

#include "Database.h"
#include "SessionManager.h"
#include "dh_book.h"
#include "dhutils.h"
#include "utils.h"

using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;

// metadata, chapters and the caller's progress (read-only: never creates a progress row)
static void bookDetail(const Callback& cb, long long bookId, long long userId) {
    const BookRecord book = loadReadableBook(bookId, userId);
    Database& db = Database::get();

    Json::Value chapters(Json::arrayValue);
    for (const auto& c : db.listChapters(bookId)) {
        Json::Value row;
        row["chapter_id"] = static_cast<Json::Int64>(c.id);
        row["title"]      = c.title;
        row["position"]   = static_cast<Json::Int64>(c.position);
        chapters.append(row);
    }

    const auto progress = db.getProgress(userId, bookId);

    Json::Value j;
    j["book_id"]      = static_cast<Json::Int64>(book.id);
    j["title"]        = book.title;
    if (book.author)
        j["author"]   = *book.author;
    j["is_public"]    = book.isPublic;
    j["created_at"]   = static_cast<Json::Int64>(book.createdAt);
    j["char_length"]  = static_cast<Json::Int64>(book.charLength());
    j["sha256"]       = book.sha256;
    j["position"]     = static_cast<Json::Int64>(progress ? progress->position : 0);
    j["reading_time"] = static_cast<Json::Int64>(progress ? progress->readingTime : 0);
    if (progress && progress->lastReadAt > 0)
        j["last_read_at"] = static_cast<Json::Int64>(progress->lastReadAt);
    j["chapters"]     = chapters;
    sendOk(cb, j);
}

static void requireOwner(long long bookId, long long userId) {
    auto book = Database::get().getBook(bookId);
    if (!book)
        throw ServiceError(ErrorKind::NotFound, "book " + std::to_string(bookId) + " not found");
    if (book->userId != userId)
        throw ServiceError(ErrorKind::Forbidden, "only the owner may change book " + std::to_string(bookId));
}

// title/author/is_public; anything absent stays as it is
static void bookUpdate(const HttpRequestPtr& req, const Callback& cb, long long bookId, long long userId) {
    auto bodyPtr = req->getJsonObject();      // Drogon parses for us
    if (!bodyPtr || !bodyPtr->isObject())
        throw ServiceError(ErrorKind::BadRequest, "parsing failed");
    const auto& body = *bodyPtr;

    std::optional<std::string> title, author;
    std::optional<bool> isPublic;

    if (body.isMember("title")) {
        if (!body["title"].isString() || trimAscii(body["title"].asString()).empty())
            throw ServiceError(ErrorKind::BadRequest, "invalid title");
        title = trimAscii(body["title"].asString());
    }
    if (body.isMember("author")) {
        if (!body["author"].isString())
            throw ServiceError(ErrorKind::BadRequest, "invalid author");
        author = trimAscii(body["author"].asString());
    }
    if (body.isMember("is_public")) {
        bool v = false;
        if (!parseBoolFlexible(body["is_public"], v))
            throw ServiceError(ErrorKind::BadRequest, "invalid is_public");
        isPublic = v;
    }

    requireOwner(bookId, userId);

    if (!title && !author && !isPublic)
        return sendOk(cb);      // nothing to change

    if (!Database::get().updateBookMeta(bookId, title, author, isPublic))
        throw ServiceError(ErrorKind::NotFound, "book " + std::to_string(bookId) + " not found");
    sendOk(cb);
}

static void bookDelete(const Callback& cb, TextStore& store, long long bookId, long long userId) {
    requireOwner(bookId, userId);

    // row first (chapters + progress cascade), then the text it pointed at
    const std::string location = Database::get().deleteBook(bookId);
    if (location.empty())
        throw ServiceError(ErrorKind::NotFound, "book " + std::to_string(bookId) + " not found");
    store.remove(location);

    syslog(SYSLOG_INFO, "user [%lld] deleted book [%lld]", userId, bookId);
    sendOk(cb);
}

int registerBookHandler(TextStore& store) {
    drogon::app().registerHandler("/api/books/{1}",
        [&store](const HttpRequestPtr& req,
                 std::function<void (const HttpResponsePtr &)> &&cb,
                 const std::string& id) {

            // check whether token is valid
            const long long userId = SessionManager::instance().userIdIfValid(req);
            if (userId == 0)
                return sendUnauthorised(cb);

            try {
                const long long bookId = requireInt64(id, "book id");
                switch (req->method()) {
                    case drogon::Get:    return bookDetail(cb, bookId, userId);
                    case drogon::Put:    return bookUpdate(req, cb, bookId, userId);
                    case drogon::Delete: return bookDelete(cb, store, bookId, userId);
                    default:
                        return sendError(cb, drogon::k405MethodNotAllowed, "method_not_allowed", 405);
                }
            } catch (const ServiceError& e) {
                return sendServiceError(cb, e);
            } catch (const std::exception& e) {
                return sendServerError(cb, "book", e);
            }
        },
        {drogon::Get, drogon::Put, drogon::Delete}
    );

    return 0;
}
