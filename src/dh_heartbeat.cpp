//*************************************************************
// drogon handler for "POST /api/reading/heartbeat" requests
//     {"book_id": n, "position": n, "device_id": "..."}
//*************************************************************
#include <drogon/drogon.h>

#include "Config.h"
#include "Database.h"
#include "ProgressSync.h"
#include "SessionManager.h"
#include "dh_heartbeat.h"
#include "dhutils.h"
#include "utils.h"

using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;

// JSON integer, or a string holding one
static bool jsonInt64(const Json::Value& v, long long& out) {
    if (v.isInt64()) { out = v.asInt64(); return true; }
    if (v.isString()) return parseInt64(v.asString(), out);
    return false;
}

int registerHeartbeatHandler(void) {
    drogon::app().registerHandler("/api/reading/heartbeat",
        [](const HttpRequestPtr& req, std::function<void (const HttpResponsePtr &)> &&cb) {

            const long long userId = SessionManager::instance().userIdIfValid(req);
            if (userId == 0)
                return sendUnauthorised(cb);

            try {
                auto bodyPtr = req->getJsonObject();
                if (!bodyPtr || !bodyPtr->isObject())
                    throw ServiceError(ErrorKind::BadRequest, "parsing failed");
                const auto& body = *bodyPtr;

                long long bookId = 0, position = 0;
                if (!jsonInt64(body["book_id"], bookId))
                    throw ServiceError(ErrorKind::BadRequest, "invalid book_id");
                if (!jsonInt64(body["position"], position))
                    throw ServiceError(ErrorKind::BadRequest, "invalid position");
                if (!body["device_id"].isString() || trimAscii(body["device_id"].asString()).empty())
                    throw ServiceError(ErrorKind::BadRequest, "device_id is required");
                const std::string deviceId = trimAscii(body["device_id"].asString());

                loadReadableBook(bookId, userId);

                ProgressSync sync(Database::get(), Config::get().maxHeartbeatInterval(), nowMs);
                const HeartbeatResult r = sync.heartbeat(userId, bookId, deviceId, position);

                Json::Value j;
                j["synced"]       = r.synced;
                j["position"]     = static_cast<Json::Int64>(r.position);
                j["reading_time"] = static_cast<Json::Int64>(r.readingTime);
                return sendOk(cb, j);
            } catch (const ServiceError& e) {
                return sendServiceError(cb, e);
            } catch (const std::exception& e) {
                return sendServerError(cb, "heartbeat", e);
            }
        },
        {drogon::Post}
    );

    return 0;
}
