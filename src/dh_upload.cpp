//*********************************************************
// drogon handler for "POST /api/books/upload" requests
//   multipart: file, title, author (optional), is_public
//*********************************************************
#include <filesystem>
#include <unistd.h>    // for close()

#include <drogon/drogon.h>

#include "BookIngest.h"
#include "Config.h"
#include "Database.h"
#include "SessionManager.h"
#include "dh_upload.h"
#include "dhutils.h"
#include "utils.h"

using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;
namespace fs = std::filesystem;

int registerUploadHandler(TextStore& store, const ChapterIndexer& indexer) {
    drogon::app().registerHandler("/api/books/upload",
        [&store, &indexer](const HttpRequestPtr& req,
                           std::function<void (const HttpResponsePtr &)> &&cb) {

            // check whether token is valid
            const long long userId = SessionManager::instance().userIdIfValid(req);
            if (userId == 0)
                return sendUnauthorised(cb);

            // parse multipart
            drogon::MultiPartParser parser;
            if (parser.parse(req) != 0)
                return sendError(cb, drogon::k400BadRequest, "invalid_request", 400, "failed to parse multipart");

            UploadRequest up;
            up.userId = userId;
            for (const auto& p : parser.getParameters()) {
                const auto& name = p.first;
                const auto& val = p.second;
                if (name == "title")
                    up.title = val;
                else if (name == "author")
                    up.author = val;
                else if (name == "is_public" && !parseBoolFlexible(val, up.isPublic))
                    return sendError(cb, drogon::k400BadRequest, "invalid_request", 400, "invalid is_public");
            }

            // have file part?
            const auto& files = parser.getFiles();
            if (files.empty())
                return sendError(cb, drogon::k400BadRequest, "invalid_request", 400, "no file");
            up.clientFileName = files.front().getFileName();

            // save upload to temp
            fs::path tmpPath;
            try {
                char templ[] = "/tmp/txtreader_upload_XXXXXX";
                int fd = mkstemp(templ);
                if (fd == -1)
                    throw std::runtime_error("mkstemp failed");
                close(fd);
                tmpPath = templ;
                if (files.front().saveAs(tmpPath.string()) != 0)
                    throw std::runtime_error("could not save upload");
            } catch (const std::exception& e) {
                std::error_code ec; fs::remove(tmpPath, ec);
                return sendServerError(cb, "upload", e);
            }
            up.filePath = tmpPath.string();

            auto cleanupTmp = [&](void){
                std::error_code ec; fs::remove(tmpPath, ec);
            };

            try {
                BookIngest ingest(Database::get(), store, indexer, Config::get().maxFileSize());
                const auto result = ingest.ingest(up, nowMs());
                cleanupTmp();

                Json::Value chapters(Json::arrayValue);
                for (const auto& c : result.chapters) {
                    Json::Value row;
                    row["chapter_id"] = static_cast<Json::Int64>(c.id);
                    row["title"]      = c.title;
                    row["position"]   = static_cast<Json::Int64>(c.position);
                    chapters.append(row);
                }

                Json::Value j;
                j["book_id"]     = static_cast<Json::Int64>(result.book.id);
                j["title"]       = result.book.title;
                if (result.book.author)
                    j["author"]  = *result.book.author;
                j["is_public"]   = result.book.isPublic;
                j["sha256"]      = result.book.sha256;
                j["char_length"] = static_cast<Json::Int64>(result.book.charLength());
                j["chapters"]    = chapters;
                return sendOk(cb, j);
            } catch (const ServiceError& e) {
                cleanupTmp();
                return sendServiceError(cb, e);
            } catch (const std::exception& e) {
                cleanupTmp();
                return sendServerError(cb, "upload", e);
            }
        },
        {drogon::Post}  // limit to POST
    );

    return 0;
}
