#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "CharIndex.h"

namespace {

std::string repeat(const std::string& unit, int n) {
    std::string out;
    for (int k = 0; k < n; ++k) out += unit;
    return out;
}

} // namespace

TEST(CharIndexTest, EmptyText) {
    const CharIndex idx = CharIndex::build("");
    EXPECT_EQ(idx.charLength(), 0);
    EXPECT_EQ(idx.byteLength(), 0);

    long long charAt = -1;
    EXPECT_EQ(idx.checkpointFor(0, charAt), 0);
    EXPECT_EQ(charAt, 0);
}

TEST(CharIndexTest, AsciiCheckpointsMatchCharOffsets) {
    const CharIndex idx = CharIndex::build(std::string(3000, 'x'));
    EXPECT_EQ(idx.charLength(), 3000);
    EXPECT_EQ(idx.byteLength(), 3000);

    long long charAt = 0;
    EXPECT_EQ(idx.checkpointFor(2500, charAt), 2048);
    EXPECT_EQ(charAt, 2048);
    EXPECT_EQ(idx.checkpointFor(1023, charAt), 0);
    EXPECT_EQ(charAt, 0);
    EXPECT_EQ(idx.checkpointFor(1024, charAt), 1024);
    EXPECT_EQ(charAt, 1024);
}

TEST(CharIndexTest, MultibyteCheckpointsPointAtByteOffsets) {
    const CharIndex idx = CharIndex::build(repeat("中", 3000));
    EXPECT_EQ(idx.charLength(), 3000);
    EXPECT_EQ(idx.byteLength(), 9000);

    long long charAt = 0;
    EXPECT_EQ(idx.checkpointFor(1500, charAt), 1024 * 3);
    EXPECT_EQ(charAt, 1024);
}

TEST(CharIndexTest, PositionPastEndUsesLastCheckpoint) {
    const CharIndex idx = CharIndex::build(std::string(3000, 'x'));
    long long charAt = 0;
    EXPECT_EQ(idx.checkpointFor(3000, charAt), 2048);
    EXPECT_EQ(charAt, 2048);
}

TEST(CharIndexTest, SurvivesSerialization) {
    const std::string text = repeat("a中\xF0\x9F\x98\x80", 700);     // 2100 chars, mixed widths
    const CharIndex idx = CharIndex::build(text);
    const std::string blob = idx.serialize();

    const CharIndex back = CharIndex::deserialize(blob.data(), blob.size());
    EXPECT_EQ(back.charLength(), idx.charLength());
    EXPECT_EQ(back.byteLength(), idx.byteLength());
    for (long long pos : {0LL, 1023LL, 1024LL, 2099LL}) {
        long long a = 0, b = 0;
        EXPECT_EQ(back.checkpointFor(pos, a), idx.checkpointFor(pos, b));
        EXPECT_EQ(a, b);
    }
}

TEST(CharIndexTest, RejectsCorruptBlob) {
    EXPECT_THROW(CharIndex::deserialize(nullptr, 0), std::runtime_error);

    const std::string blob = CharIndex::build(std::string(5000, 'x')).serialize();
    EXPECT_THROW(CharIndex::deserialize(blob.data(), 10), std::runtime_error);
    EXPECT_THROW(CharIndex::deserialize(blob.data(), blob.size() - 8), std::runtime_error);
}
