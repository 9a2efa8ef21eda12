#ifndef TXTREADER_CHARINDEX_H
#define TXTREADER_CHARINDEX_H

#include <string>
#include <string_view>
#include <vector>

//
// CharIndex: sparse character offset -> byte offset table for one book.
//   checkpoints[k] is the byte offset of character k * kStride.
//   Built once at upload, persisted with the book (books.char_index) so that
//   a content window never has to scan the text from its start.
//
class CharIndex {
public:
    static constexpr long long kStride = 1024;

    CharIndex() = default;

    // text must be valid UTF-8
    static CharIndex build(std::string_view text);

    // BLOB form: little-endian int64 charLength, byteLength, then one int64 per checkpoint
    std::string serialize() const;
    static CharIndex deserialize(const void* data, size_t size);

    long long charLength() const { return charLength_; }
    long long byteLength() const { return byteLength_; }

    // nearest checkpoint at or before position.
    // RETURNS: byte offset of that checkpoint; charAtOut receives its character offset
    long long checkpointFor(long long position, long long& charAtOut) const;

private:
    long long charLength_ = 0;
    long long byteLength_ = 0;
    std::vector<long long> checkpoints_{0};
};

#endif // TXTREADER_CHARINDEX_H
