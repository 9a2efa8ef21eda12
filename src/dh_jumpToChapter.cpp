//*********************************************************************
// drogon handler for "GET /api/books/{id}/jump_to_chapter" requests
//     ?chapter_id=<id>
// Returns the chapter's start position; progress is left alone.
//*********************************************************************
#include <drogon/drogon.h>

#include "ChapterNavigator.h"
#include "Database.h"
#include "SessionManager.h"
#include "dh_jumpToChapter.h"
#include "dhutils.h"

using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;

int registerJumpToChapterHandler(void) {
    drogon::app().registerHandler("/api/books/{1}/jump_to_chapter",
        [](const HttpRequestPtr& req,
           std::function<void (const HttpResponsePtr &)> &&cb,
           const std::string& id) {

            const long long userId = SessionManager::instance().userIdIfValid(req);
            if (userId == 0)
                return sendUnauthorised(cb);

            try {
                const long long bookId = requireInt64(id, "book id");
                const auto& c = req->getParameter("chapter_id");
                if (c.empty())
                    throw ServiceError(ErrorKind::BadRequest, "chapter_id is required");
                const long long chapterId = requireInt64(c, "chapter_id");

                loadReadableBook(bookId, userId);
                const ChapterNavigator nav(bookId, Database::get().listChapters(bookId));

                Json::Value j;
                j["position"] = static_cast<Json::Int64>(nav.locate(bookId, chapterId));
                return sendOk(cb, j);
            } catch (const ServiceError& e) {
                return sendServiceError(cb, e);
            } catch (const std::exception& e) {
                return sendServerError(cb, "jump_to_chapter", e);
            }
        },
        {drogon::Get}
    );

    return 0;
}
