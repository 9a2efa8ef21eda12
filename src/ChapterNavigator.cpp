#include <string>

#include "ChapterNavigator.h"
#include "ServiceError.h"

ChapterNavigator::ChapterNavigator(long long bookId, const std::vector<ChapterRecord>& chapters)
    : bookId_(bookId) {
    positions_.reserve(chapters.size());
    for (const auto& c : chapters) {
        if (c.bookId == bookId_) positions_.emplace(c.id, c.position);
    }
}

long long ChapterNavigator::locate(long long bookId, long long chapterId) const {
    if (bookId == bookId_) {
        auto it = positions_.find(chapterId);
        if (it != positions_.end()) return it->second;
    }
    throw ServiceError(ErrorKind::NotFound,
                       "chapter " + std::to_string(chapterId) + " not found in book " + std::to_string(bookId));
}
