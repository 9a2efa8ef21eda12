#ifndef TXTREADER_CONTENTWINDOW_H
#define TXTREADER_CONTENTWINDOW_H

#include <string>

#include "Models.h"
#include "TextStore.h"

struct ContentSlice {
    std::string content;        // UTF-8, whole characters only
    long long   nextPosition = 0;
};

//
// ContentWindow: position-addressed reads over a stored book.
//   Pure read; never touches reading progress and needs no locking.
//
class ContentWindow {
public:
    explicit ContentWindow(const TextStore& store) : store_(store) {}

    // up to `length` characters starting at character `position`.
    // throws ServiceError(InvalidRange) if position is outside [0, charLength]
    // or length is negative.
    ContentSlice read(const BookRecord& book, long long position, long long length) const;

private:
    const TextStore& store_;
};

#endif // TXTREADER_CONTENTWINDOW_H
