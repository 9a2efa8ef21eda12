#ifndef TXTREADER_DHUTILS_H
#define TXTREADER_DHUTILS_H

#include <functional>
#include <string>

#include <drogon/drogon.h>

#include "Models.h"
#include "ServiceError.h"

using Callback = std::function<void (const drogon::HttpResponsePtr &)>;

// {"ok": true, ...j}
void sendOk(const Callback& cb, Json::Value j = Json::Value(Json::objectValue));

// {"ok": false, "error": error, "code": code, "reason": reason}
void sendError(const Callback& cb, drogon::HttpStatusCode status,
               const char* error, int code, const std::string& reason = "");
void sendServiceError(const Callback& cb, const ServiceError& e);
void sendUnauthorised(const Callback& cb);

// storage/internal failure: logged in full, reported opaquely
void sendServerError(const Callback& cb, const char* where, const std::exception& e);

// path segment or query value -> int64; throws ServiceError(BadRequest) when malformed
long long requireInt64(const std::string& value, const char* what);

// the book if this user may read it.  throws ServiceError(NotFound/Forbidden)
BookRecord loadReadableBook(long long bookId, long long userId);

// ?page=&limit=  (page >= 1, limit clamped to [1, 100])
void parsePaging(const drogon::HttpRequestPtr& req, int& pageOut, int& limitOut);

// Accept bool or "true"/"false"/"1"/"0" (string)
bool parseBoolFlexible(const Json::Value& v, bool& out);
bool parseBoolFlexible(const std::string& s, bool& out);

#endif // TXTREADER_DHUTILS_H
