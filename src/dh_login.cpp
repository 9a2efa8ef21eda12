//***************************************************
// drogon handler for "POST /api/auth/login" requests
//***************************************************
#include <syslog.h>

#include <drogon/drogon.h>
#include <sodium.h>

#include "Database.h"
#include "SessionManager.h"
#include "dh_login.h"
#include "dhutils.h"
#include "utils.h"

using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;

// check username/password against users.pwd_hash
// RETURNS: user id, 0 if the credentials are wrong
static long long verifyPassword(const std::string& username, const std::string& password) {
    long long userId = 0;
    const std::string stored = Database::get().getUserPwdHash(username, userId);
    if (stored.empty()) return 0; // user not found

    if (crypto_pwhash_str_verify(stored.c_str(), password.c_str(), password.size()) != 0)
        return 0;
    return userId;
}

int registerLoginHandler(void) {

    drogon::app().registerHandler(
        "/api/auth/login",
        [](const HttpRequestPtr &req,
                            std::function<void (const HttpResponsePtr &)> &&cb) {

            auto json = req->getJsonObject();
            if (!json) {
                return sendError(cb, drogon::k400BadRequest, "invalid_request", 400, "invalid json");
            }

            const auto username = (*json)["username"].asString();
            const auto password = (*json)["password"].asString();
            const auto device   = json->get("device","unidentified").asString();     // "device" tag is optional

            if (username.empty() || password.empty()) {
                return sendError(cb, drogon::k400BadRequest, "invalid_request", 400, "missing fields");
            }

            long long userId = 0;
            try {
                userId = verifyPassword(username, password);
            } catch (const std::exception& e) {
                return sendServerError(cb, "login", e);
            }

            if (userId == 0) {
                syslog(SYSLOG_ERR, "invalid username/password for user [%s] on device [%s]", username.c_str(), device.c_str());
                return sendError(cb, drogon::k401Unauthorized, "invalid_credentials", 1001);
            }

            syslog(SYSLOG_INFO, "user [%s] logged in on device [%s]", username.c_str(), device.c_str());

            // Issue session token
            const auto session = SessionManager::instance().add(userId, username, device);

            Json::Value j;
            j["token"] = session.token;
            j["userId"] = static_cast<Json::Int64>(userId);
            j["expiresAt"] = static_cast<Json::Int64>(
                std::chrono::duration_cast<std::chrono::milliseconds>(session.expiry.time_since_epoch()).count()
            );
            sendOk(cb, j);
        },
        {drogon::Post} // limit to POST
    );

    return 0;
}
