#include <algorithm>
#include <stdexcept>
#include <string>

#include "ContentWindow.h"
#include "ServiceError.h"
#include "Utf8.h"

ContentSlice ContentWindow::read(const BookRecord& book, long long position, long long length) const {
    const long long bookLength = book.charLength();

    if (position < 0 || position > bookLength)
        throw ServiceError(ErrorKind::InvalidRange,
                           "position " + std::to_string(position) + " outside [0, " + std::to_string(bookLength) + "]");
    if (length < 0)
        throw ServiceError(ErrorKind::InvalidRange, "negative length");

    const long long want = std::min(length, bookLength - position);
    if (want == 0)
        return ContentSlice{"", position};     // end of book, or nothing asked for

    // start from the nearest checkpoint and skip forward to position
    long long charAt = 0;
    const long long byteStart = book.charIndex.checkpointFor(position, charAt);
    const long long skip = position - charAt;

    // 4 bytes is the longest UTF-8 sequence, so this always covers the window
    const std::string raw = store_.read(book.location, byteStart, (skip + want) * 4);

    size_t i = 0;
    char32_t cp;
    for (long long k = 0; k < skip; ++k) {
        if (!utf8Next(raw, i, cp))
            throw std::runtime_error("book text shorter than its index [" + book.location + "]");
    }

    const size_t begin = i;
    long long taken = 0;
    while (taken < want && utf8Next(raw, i, cp)) ++taken;     // stops before a cut sequence

    return ContentSlice{raw.substr(begin, i - begin), position + taken};
}
