#include <algorithm>
#include <syslog.h>

#include "dhutils.h"
#include "Database.h"
#include "utils.h"

void sendOk(const Callback& cb, Json::Value j) {
    j["ok"] = true;
    auto r = drogon::HttpResponse::newHttpJsonResponse(j);
    r->setStatusCode(drogon::k200OK);
    cb(r);
}

void sendError(const Callback& cb, drogon::HttpStatusCode status,
               const char* error, int code, const std::string& reason) {
    Json::Value j;
    j["ok"]    = false;
    j["error"] = error;
    j["code"]  = code;
    if (!reason.empty())
        j["reason"] = reason;
    auto r = drogon::HttpResponse::newHttpJsonResponse(j);
    r->setStatusCode(status);
    cb(r);
}

void sendServiceError(const Callback& cb, const ServiceError& e) {
    drogon::HttpStatusCode status = drogon::k400BadRequest;
    switch (e.kind()) {
        case ErrorKind::NotFound:  status = drogon::k404NotFound;  break;
        case ErrorKind::Forbidden: status = drogon::k403Forbidden; break;
        default:                   break;
    }
    sendError(cb, status, e.name(), e.code(), e.what());
}

void sendUnauthorised(const Callback& cb) {
    sendError(cb, drogon::k401Unauthorized, "unauthorised", 1004);
}

void sendServerError(const Callback& cb, const char* where, const std::exception& e) {
    syslog(SYSLOG_ERR, "%s: %s", where, e.what());
    sendError(cb, drogon::k500InternalServerError, "server_error", 9999);
}

long long requireInt64(const std::string& value, const char* what) {
    long long v = 0;
    if (!parseInt64(value, v))
        throw ServiceError(ErrorKind::BadRequest, std::string("invalid ") + what);
    return v;
}

BookRecord loadReadableBook(long long bookId, long long userId) {
    auto book = Database::get().getBook(bookId);
    if (!book)
        throw ServiceError(ErrorKind::NotFound, "book " + std::to_string(bookId) + " not found");
    if (!book->readableBy(userId))
        throw ServiceError(ErrorKind::Forbidden, "no access to book " + std::to_string(bookId));
    return *book;
}

void parsePaging(const drogon::HttpRequestPtr& req, int& pageOut, int& limitOut) {
    long long page = 1, limit = 10;
    const auto& p = req->getParameter("page");
    const auto& l = req->getParameter("limit");
    if (!p.empty()) page  = requireInt64(p, "page");
    if (!l.empty()) limit = requireInt64(l, "limit");
    if (page < 1 || page > 1000000)
        throw ServiceError(ErrorKind::BadRequest, "invalid page");
    pageOut  = static_cast<int>(page);
    limitOut = static_cast<int>(std::clamp(limit, 1LL, 100LL));
}

bool parseBoolFlexible(const std::string& s, bool& out) {
    if (s == "true" || s == "1")  { out = true;  return true; }
    if (s == "false"|| s == "0")  { out = false; return true; }
    return false;
}

bool parseBoolFlexible(const Json::Value& v, bool& out) {
    if (v.isBool()) { out = v.asBool(); return true; }
    if (v.isString()) return parseBoolFlexible(v.asString(), out);
    return false;
}
