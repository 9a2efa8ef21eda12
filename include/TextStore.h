#ifndef TXTREADER_TEXTSTORE_H
#define TXTREADER_TEXTSTORE_H

#include <filesystem>
#include <string>

//
// TextStore: immutable raw book text on disk, one file per book.
//   Books are addressed by a storage handle (the file name under root).
//
class TextStore {
public:
    explicit TextStore(std::filesystem::path root);

    // write bytes under a fresh random handle.  RETURNS: the handle
    std::string put(const std::string& bytes);

    // read up to maxBytes starting at byteOffset (short at end of file)
    std::string read(const std::string& handle, long long byteOffset, long long maxBytes) const;

    long long size(const std::string& handle) const;
    bool exists(const std::string& handle) const;

    // no-op if already gone
    void remove(const std::string& handle) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path pathFor(const std::string& handle) const;

    std::filesystem::path root_;
};

#endif // TXTREADER_TEXTSTORE_H
