#include <filesystem>
#include <fstream>
#include <iterator>
#include <syslog.h>

#include <sodium.h>

#include "BookIngest.h"
#include "CharIndex.h"
#include "ServiceError.h"
#include "Utf8.h"
#include "utils.h"

namespace fs = std::filesystem;

std::string sha256Hex(const std::string& bytes) {
    unsigned char out[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(out, reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
    char hex[crypto_hash_sha256_BYTES * 2 + 1];
    sodium_bin2hex(hex, sizeof hex, out, sizeof out);
    return std::string(hex);
}

static std::string readWholeFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error("cannot open upload " + path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

UploadResult BookIngest::ingest(const UploadRequest& req, long long nowMs) {
    const std::string title = trimAscii(req.title);
    if (title.empty())
        throw ServiceError(ErrorKind::BadRequest, "title is required");

    if (!endsWithNoCase(req.clientFileName, ".txt"))
        throw ServiceError(ErrorKind::UnsupportedFormat, "only .txt books are supported");

    // policy size check (before reading it into memory)
    std::error_code ec;
    const auto onDisk = fs::file_size(req.filePath, ec);
    if (ec)
        throw std::runtime_error("cannot stat upload: " + ec.message());
    if (maxBytes_ > 0 && static_cast<long long>(onDisk) > maxBytes_)
        throw ServiceError(ErrorKind::TooLarge, "book exceeds " + std::to_string(maxBytes_) + " bytes");

    std::string text = readWholeFile(req.filePath);
    stripUtf8Bom(text);
    if (!utf8IsValid(text))
        throw ServiceError(ErrorKind::UnsupportedFormat, "book is not valid UTF-8");

    const auto markers = indexer_.index(text);

    UploadResult result;
    BookRecord& book = result.book;
    book.userId    = req.userId;
    book.title     = title;
    if (req.author) {
        const std::string author = trimAscii(*req.author);
        if (!author.empty()) book.author = author;
    }
    book.isPublic  = req.isPublic;
    book.createdAt = nowMs;
    book.sha256    = sha256Hex(text);
    book.charIndex = CharIndex::build(text);
    book.location  = store_.put(text);

    try {
        db_.insertBook(book, markers, result.chapters);
    } catch (...) {
        store_.remove(book.location);   // no orphaned text without a row
        throw;
    }

    syslog(SYSLOG_INFO, "user [%lld] uploaded book [%lld] \"%s\": %lld chars, %zu chapters",
           req.userId, book.id, book.title.c_str(), book.charLength(), result.chapters.size());
    return result;
}
