#ifndef TXTREADER_BOOKINGEST_H
#define TXTREADER_BOOKINGEST_H

#include <optional>
#include <string>
#include <vector>

#include "ChapterIndexer.h"
#include "Database.h"
#include "Models.h"
#include "TextStore.h"

struct UploadRequest {
    long long                  userId = 0;
    std::string                filePath;        // where the upload landed (we don't take ownership)
    std::string                clientFileName;  // as sent by the client; must end in .txt
    std::string                title;
    std::optional<std::string> author;
    bool                       isPublic = false;
};

struct UploadResult {
    BookRecord                 book;
    std::vector<ChapterRecord> chapters;
};

//
// BookIngest: validate -> index chapters -> store text -> insert rows.
//   Either everything lands (text file, book row, chapter rows) or nothing does.
//
class BookIngest {
public:
    BookIngest(Database& db, TextStore& store, const ChapterIndexer& indexer, long long maxBytes)
        : db_(db), store_(store), indexer_(indexer), maxBytes_(maxBytes) {}

    // throws ServiceError (BadRequest, UnsupportedFormat, TooLarge) for bad uploads,
    // std::runtime_error for storage failures
    UploadResult ingest(const UploadRequest& req, long long nowMs);

private:
    Database&             db_;
    TextStore&            store_;
    const ChapterIndexer& indexer_;
    long long             maxBytes_;
};

// hex SHA-256 of a buffer (libsodium)
std::string sha256Hex(const std::string& bytes);

#endif // TXTREADER_BOOKINGEST_H
