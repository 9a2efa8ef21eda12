#include <cstdint>
#include <stdexcept>

#include "CharIndex.h"

CharIndex CharIndex::build(std::string_view text) {
    CharIndex idx;
    idx.checkpoints_.clear();

    long long chars = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) == 0x80) continue;   // continuation byte
        if (chars % kStride == 0) idx.checkpoints_.push_back(static_cast<long long>(i));
        ++chars;
    }
    if (idx.checkpoints_.empty()) idx.checkpoints_.push_back(0);

    idx.charLength_ = chars;
    idx.byteLength_ = static_cast<long long>(text.size());
    return idx;
}

static void putInt64(std::string& out, long long v) {
    auto u = static_cast<std::uint64_t>(v);
    for (int k = 0; k < 8; ++k) out.push_back(static_cast<char>((u >> (8 * k)) & 0xFF));
}

static long long getInt64(const unsigned char* p) {
    std::uint64_t u = 0;
    for (int k = 7; k >= 0; --k) u = (u << 8) | p[k];
    return static_cast<long long>(u);
}

std::string CharIndex::serialize() const {
    std::string out;
    out.reserve(8 * (checkpoints_.size() + 2));
    putInt64(out, charLength_);
    putInt64(out, byteLength_);
    for (long long cp : checkpoints_) putInt64(out, cp);
    return out;
}

CharIndex CharIndex::deserialize(const void* data, size_t size) {
    if (data == nullptr || size < 24 || size % 8 != 0)
        throw std::runtime_error("corrupt char index (size)");

    const auto* p = static_cast<const unsigned char*>(data);
    CharIndex idx;
    idx.charLength_ = getInt64(p);
    idx.byteLength_ = getInt64(p + 8);
    idx.checkpoints_.clear();
    for (size_t off = 16; off < size; off += 8) idx.checkpoints_.push_back(getInt64(p + off));

    const auto expected = idx.charLength_ == 0 ? 1 : (idx.charLength_ + kStride - 1) / kStride;
    if (idx.charLength_ < 0 || static_cast<long long>(idx.checkpoints_.size()) != expected)
        throw std::runtime_error("corrupt char index (checkpoints)");

    return idx;
}

long long CharIndex::checkpointFor(long long position, long long& charAtOut) const {
    long long k = position / kStride;
    const auto last = static_cast<long long>(checkpoints_.size()) - 1;
    if (k > last) k = last;
    if (k < 0) k = 0;
    charAtOut = k * kStride;
    return checkpoints_[static_cast<size_t>(k)];
}
