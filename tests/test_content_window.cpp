#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>

#include "CharIndex.h"
#include "ContentWindow.h"
#include "ServiceError.h"
#include "TextStore.h"
#include "Utf8.h"

namespace fs = std::filesystem;

class ContentWindowTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "txtreader_content_test";
        fs::remove_all(test_dir_);
        store_ = std::make_unique<TextStore>(test_dir_);
    }

    void TearDown() override {
        store_.reset();
        fs::remove_all(test_dir_);
    }

    BookRecord storeBook(const std::string& text) {
        BookRecord book;
        book.id        = 1;
        book.userId    = 1;
        book.title     = "test";
        book.location  = store_->put(text);
        book.charIndex = CharIndex::build(text);
        return book;
    }

    // expected slice, computed the slow way
    static std::string slice(const std::string& text, long long pos, long long len) {
        const std::u32string all = utf8Decode(text);
        return utf8Encode(std::u32string_view(all).substr(static_cast<size_t>(pos), static_cast<size_t>(len)));
    }

    // ~6000 characters of mixed 1-, 2-, 3- and 4-byte characters
    static std::string mixedText() {
        std::string text;
        for (int k = 0; k < 500; ++k)
            text += "line " + std::to_string(k) + " é中文\xF0\x9F\x98\x80\n";
        return text;
    }

    fs::path test_dir_;
    std::unique_ptr<TextStore> store_;
};

TEST_F(ContentWindowTest, ReadsFromStart) {
    const BookRecord book = storeBook("Hello, world");
    const ContentSlice s = ContentWindow(*store_).read(book, 0, 5);
    EXPECT_EQ(s.content, "Hello");
    EXPECT_EQ(s.nextPosition, 5);
}

TEST_F(ContentWindowTest, NeverSplitsMultibyteCharacters) {
    const BookRecord book = storeBook("中文测试");
    const ContentSlice s = ContentWindow(*store_).read(book, 1, 2);
    EXPECT_EQ(s.content, "文测");
    EXPECT_EQ(s.nextPosition, 3);
    EXPECT_TRUE(utf8IsValid(s.content));
}

TEST_F(ContentWindowTest, LengthPastEndIsTruncated) {
    const BookRecord book = storeBook("abc中");
    const ContentSlice s = ContentWindow(*store_).read(book, 2, 100);
    EXPECT_EQ(s.content, "c中");
    EXPECT_EQ(s.nextPosition, 4);
}

TEST_F(ContentWindowTest, EndOfBookIsEmpty) {
    const BookRecord book = storeBook("abc");
    const ContentSlice s = ContentWindow(*store_).read(book, 3, 10);
    EXPECT_EQ(s.content, "");
    EXPECT_EQ(s.nextPosition, 3);
}

TEST_F(ContentWindowTest, ZeroLengthIsEmpty) {
    const BookRecord book = storeBook("abc");
    const ContentSlice s = ContentWindow(*store_).read(book, 1, 0);
    EXPECT_EQ(s.content, "");
    EXPECT_EQ(s.nextPosition, 1);
}

TEST_F(ContentWindowTest, OutOfRangeIsRejected) {
    const BookRecord book = storeBook("abc");
    const ContentWindow window(*store_);

    for (long long pos : {-1LL, 4LL}) {
        try {
            window.read(book, pos, 1);
            FAIL() << "position " << pos << " accepted";
        } catch (const ServiceError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidRange);
        }
    }

    try {
        window.read(book, 0, -1);
        FAIL() << "negative length accepted";
    } catch (const ServiceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidRange);
    }
}

TEST_F(ContentWindowTest, WindowAcrossCheckpoint) {
    const std::string text = mixedText();
    const BookRecord book = storeBook(text);
    ASSERT_GT(book.charLength(), 2 * CharIndex::kStride);

    const ContentWindow window(*store_);
    for (long long pos : {1000LL, 1023LL, 1024LL, 1025LL, 2047LL, 2050LL}) {
        const ContentSlice s = window.read(book, pos, 40);
        EXPECT_EQ(s.content, slice(text, pos, 40)) << "at " << pos;
        EXPECT_EQ(s.nextPosition, pos + 40);
    }
}

TEST_F(ContentWindowTest, SameRequestSameAnswer) {
    const BookRecord book = storeBook(mixedText());
    const ContentWindow window(*store_);

    const ContentSlice a = window.read(book, 1500, 333);
    const ContentSlice b = window.read(book, 1500, 333);
    EXPECT_EQ(a.content, b.content);
    EXPECT_EQ(a.nextPosition, b.nextPosition);
}

TEST_F(ContentWindowTest, ConsecutiveWindowsRebuildTheBook) {
    const std::string text = mixedText();
    const BookRecord book = storeBook(text);
    const ContentWindow window(*store_);

    std::string rebuilt;
    long long pos = 0;
    int reads = 0;
    while (pos < book.charLength()) {
        const ContentSlice s = window.read(book, pos, 333);
        ASSERT_GT(s.nextPosition, pos);
        rebuilt += s.content;
        pos = s.nextPosition;
        ASSERT_LT(++reads, 1000);
    }

    EXPECT_EQ(pos, book.charLength());
    EXPECT_EQ(rebuilt, text);
}
