#ifndef TXTREADER_CHAPTERNAVIGATOR_H
#define TXTREADER_CHAPTERNAVIGATOR_H

#include <unordered_map>
#include <vector>

#include "Models.h"

//
// ChapterNavigator: "jump to chapter" for one book.
//   Jumping writes nothing; clients follow up with a heartbeat at the new position.
//
class ChapterNavigator {
public:
    ChapterNavigator(long long bookId, const std::vector<ChapterRecord>& chapters);

    // start position of the chapter.
    // throws ServiceError(NotFound) if chapterId isn't one of this book's chapters
    long long locate(long long bookId, long long chapterId) const;

    size_t size() const { return positions_.size(); }

private:
    long long bookId_;
    std::unordered_map<long long, long long> positions_;    // chapter id -> position
};

#endif // TXTREADER_CHAPTERNAVIGATOR_H
