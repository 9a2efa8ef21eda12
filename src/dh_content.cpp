//*************************************************************
// drogon handler for "GET /api/books/{id}/content" requests
//     ?position=<chars>&length=<chars>
//*************************************************************
#include <algorithm>

#include <drogon/drogon.h>

#include "Config.h"
#include "ContentWindow.h"
#include "SessionManager.h"
#include "dh_content.h"
#include "dhutils.h"

using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;

int registerContentHandler(const TextStore& store) {
    drogon::app().registerHandler("/api/books/{1}/content",
        [&store](const HttpRequestPtr& req,
                 std::function<void (const HttpResponsePtr &)> &&cb,
                 const std::string& id) {

            const long long userId = SessionManager::instance().userIdIfValid(req);
            if (userId == 0)
                return sendUnauthorised(cb);

            try {
                const long long bookId = requireInt64(id, "book id");

                const auto& p = req->getParameter("position");
                if (p.empty())
                    throw ServiceError(ErrorKind::BadRequest, "position is required");
                const long long position = requireInt64(p, "position");

                long long length = Config::get().defaultWindow();
                const auto& l = req->getParameter("length");
                if (!l.empty())
                    length = requireInt64(l, "length");
                if (length < 0)
                    throw ServiceError(ErrorKind::InvalidRange, "length must not be negative");
                length = std::min<long long>(length, Config::get().maxWindow());

                const BookRecord book = loadReadableBook(bookId, userId);
                const ContentSlice slice = ContentWindow(store).read(book, position, length);

                Json::Value j;
                j["content"]       = slice.content;
                j["next_position"] = static_cast<Json::Int64>(slice.nextPosition);
                return sendOk(cb, j);
            } catch (const ServiceError& e) {
                return sendServiceError(cb, e);
            } catch (const std::exception& e) {
                return sendServerError(cb, "content", e);
            }
        },
        {drogon::Get}
    );

    return 0;
}
