//****************************************
// drogon handler for "GET /" requests
//   liveness, plus the limits a reader client paces itself by
//****************************************

#include <drogon/drogon.h>

#include "Config.h"
#include "Database.h"
#include "dh_root.h"
#include "version.h"

int registerRootHandler(void) {

    drogon::app().registerHandler(
        "/",
        [](const drogon::HttpRequestPtr &,
            std::function<void (const drogon::HttpResponsePtr &)> &&cb) {
            const Config& cfg = Config::get();
            const bool dbUp = Database::get().isOpen();

            Json::Value limits;
            limits["max_file_size_mb"]       = cfg.maxFileSizeMB();
            limits["default_window"]         = cfg.defaultWindow();
            limits["max_window"]             = cfg.maxWindow();
            limits["max_heartbeat_interval"] = cfg.maxHeartbeatInterval();

            Json::Value j;
            j["ok"]      = dbUp;
            j["status"]  = dbUp ? "server up" : "database unavailable";
            j["name"]    = "txtreaderd";
            j["version"] = TXTREADERD_VERSION;
            j["limits"]  = limits;

            auto r = drogon::HttpResponse::newHttpJsonResponse(j);
            r->setStatusCode(dbUp ? drogon::k200OK : drogon::k503ServiceUnavailable);
            cb(r);
        },
        {drogon::Get}   // limit to GET
    );

    return 0;
}
