//****************************************************
// drogon handlers for "GET /api/books",
//                     "GET /api/books/public" and
//                     "GET /api/books/random_public" requests
//****************************************************
#include <algorithm>

#include <drogon/drogon.h>

#include "Database.h"
#include "SessionManager.h"
#include "dh_books.h"
#include "dhutils.h"

using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;

int registerBookListHandlers(void) {
    // the caller's own books, with their reading progress
    drogon::app().registerHandler("/api/books",
        [](const HttpRequestPtr& req, std::function<void (const HttpResponsePtr &)> &&cb) {
            const long long userId = SessionManager::instance().userIdIfValid(req);
            if (userId == 0)
                return sendUnauthorised(cb);

            try {
                int page = 1, limit = 10;
                parsePaging(req, page, limit);

                Json::Value rows(Json::arrayValue);
                const long long total = Database::get().listUserBooks(userId, page, limit, rows);

                Json::Value j;
                j["total"] = static_cast<Json::Int64>(total);
                j["books"] = rows;
                return sendOk(cb, j);
            } catch (const ServiceError& e) {
                return sendServiceError(cb, e);
            } catch (const std::exception& e) {
                return sendServerError(cb, "list books", e);
            }
        },
        {drogon::Get}
    );

    // everyone's public books
    drogon::app().registerHandler("/api/books/public",
        [](const HttpRequestPtr& req, std::function<void (const HttpResponsePtr &)> &&cb) {
            if (SessionManager::instance().userIdIfValid(req) == 0)
                return sendUnauthorised(cb);

            try {
                int page = 1, limit = 10;
                parsePaging(req, page, limit);

                Json::Value rows(Json::arrayValue);
                const long long total = Database::get().listPublicBooks(page, limit, rows);

                Json::Value j;
                j["total"] = static_cast<Json::Int64>(total);
                j["books"] = rows;
                return sendOk(cb, j);
            } catch (const ServiceError& e) {
                return sendServiceError(cb, e);
            } catch (const std::exception& e) {
                return sendServerError(cb, "list public books", e);
            }
        },
        {drogon::Get}
    );

    // ?count= random public books (default 1, clamped to [1, 10])
    drogon::app().registerHandler("/api/books/random_public",
        [](const HttpRequestPtr& req, std::function<void (const HttpResponsePtr &)> &&cb) {
            if (SessionManager::instance().userIdIfValid(req) == 0)
                return sendUnauthorised(cb);

            try {
                long long count = 1;
                const auto& c = req->getParameter("count");
                if (!c.empty())
                    count = requireInt64(c, "count");

                Json::Value rows(Json::arrayValue);
                Database::get().randomPublicBooks(static_cast<int>(std::clamp(count, 1LL, 10LL)), rows);

                Json::Value j;
                j["books"] = rows;
                return sendOk(cb, j);
            } catch (const ServiceError& e) {
                return sendServiceError(cb, e);
            } catch (const std::exception& e) {
                return sendServerError(cb, "random public books", e);
            }
        },
        {drogon::Get}
    );

    return 0;
}
