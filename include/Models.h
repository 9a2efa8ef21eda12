#ifndef TXTREADER_MODELS_H
#define TXTREADER_MODELS_H

#include <optional>
#include <string>
#include <vector>

#include "CharIndex.h"

// a detected heading: chapter title and the character offset of its line
struct ChapterMarker {
    std::string title;
    long long   position = 0;
};

struct ChapterRecord {
    long long   id       = 0;
    long long   bookId   = 0;
    std::string title;
    long long   position = 0;
    int         ordinal  = 0;
};

struct BookRecord {
    long long                  id        = 0;
    long long                  userId    = 0;     // owner
    std::string                title;
    std::optional<std::string> author;
    std::string                location;          // storage handle under librarydir
    bool                       isPublic  = false;
    long long                  createdAt = 0;     // epoch ms (UTC)
    std::string                sha256;
    CharIndex                  charIndex;

    long long charLength() const { return charIndex.charLength(); }

    // owner may always read; anyone may read a public book
    bool readableBy(long long user) const { return user == userId || isPublic; }
};

// a user plus their reading aggregates
struct UserInfo {
    long long   id               = 0;
    std::string username;
    long long   totalReadingTime = 0;   // seconds, all books
    long long   bookCount        = 0;   // books owned
};

// one row of reading_progress
struct ProgressRecord {
    long long   position     = 0;   // characters
    long long   readingTime  = 0;   // seconds
    long long   lastReadAt   = 0;   // epoch ms (UTC)
    std::string lastDeviceId;
};

// outcome of reconciling one heartbeat against the stored row
struct ProgressDecision {
    ProgressRecord next;            // row to persist
    bool           synced   = true; // false: caller must re-anchor to next.position
    long long      credited = 0;    // seconds added to reading_time by this heartbeat
};

#endif // TXTREADER_MODELS_H
