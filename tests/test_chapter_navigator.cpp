#include <gtest/gtest.h>

#include "ChapterNavigator.h"
#include "ServiceError.h"

namespace {

std::vector<ChapterRecord> sampleChapters() {
    return {
        {11, 7, "序章",       0,   0},
        {12, 7, "第一章",     120, 1},
        {13, 7, "第二章",     980, 2},
        {21, 8, "Chapter 1",  0,   0},     // another book
    };
}

} // namespace

TEST(ChapterNavigatorTest, LocatesChapterStart) {
    const ChapterNavigator nav(7, sampleChapters());
    EXPECT_EQ(nav.size(), 3u);
    EXPECT_EQ(nav.locate(7, 11), 0);
    EXPECT_EQ(nav.locate(7, 12), 120);
    EXPECT_EQ(nav.locate(7, 13), 980);
}

TEST(ChapterNavigatorTest, UnknownChapterIsNotFound) {
    const ChapterNavigator nav(7, sampleChapters());
    try {
        nav.locate(7, 99);
        FAIL() << "unknown chapter located";
    } catch (const ServiceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
        EXPECT_EQ(e.code(), 2001);
    }
}

TEST(ChapterNavigatorTest, ChapterOfAnotherBookIsNotFound) {
    const ChapterNavigator nav(7, sampleChapters());
    EXPECT_THROW(nav.locate(7, 21), ServiceError);
    EXPECT_THROW(nav.locate(8, 11), ServiceError);
}

TEST(ChapterNavigatorTest, BookWithoutChapters) {
    const ChapterNavigator nav(5, {});
    EXPECT_EQ(nav.size(), 0u);
    EXPECT_THROW(nav.locate(5, 1), ServiceError);
}
