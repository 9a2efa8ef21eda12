//******************************************************
// drogon handler for "GET /api/auth/user_info" requests
//******************************************************
#include <drogon/drogon.h>

#include "Database.h"
#include "SessionManager.h"
#include "dh_userInfo.h"
#include "dhutils.h"

using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;

int registerUserInfoHandler(void) {
    drogon::app().registerHandler("/api/auth/user_info",
        [](const HttpRequestPtr& req, std::function<void (const HttpResponsePtr &)> &&cb) {
            const long long userId = SessionManager::instance().userIdIfValid(req);
            if (userId == 0)
                return sendUnauthorised(cb);

            try {
                const auto info = Database::get().getUserInfo(userId);
                if (!info)      // session outlived the account
                    return sendUnauthorised(cb);

                Json::Value j;
                j["user_id"]            = static_cast<Json::Int64>(info->id);
                j["username"]           = info->username;
                j["total_reading_time"] = static_cast<Json::Int64>(info->totalReadingTime);
                j["book_count"]         = static_cast<Json::Int64>(info->bookCount);
                return sendOk(cb, j);
            } catch (const std::exception& e) {
                return sendServerError(cb, "user_info", e);
            }
        },
        {drogon::Get}
    );

    return 0;
}
