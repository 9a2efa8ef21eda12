#include <fstream>
#include <utility>
#include <stdexcept>
#include <syslog.h>
#include <vector>

#include <sodium.h>

#include "TextStore.h"
#include "utils.h"

namespace fs = std::filesystem;

TextStore::TextStore(fs::path root) : root_(std::move(root)) {
    if (sodium_init() < 0)
        throw std::runtime_error("libsodium init failed");

    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec)
        throw std::runtime_error("cannot create library dir " + root_.string() + ": " + ec.message());
}

fs::path TextStore::pathFor(const std::string& handle) const {
    // handles are flat file names we generated ourselves
    if (handle.empty() || handle.find('/') != std::string::npos || handle.find("..") != std::string::npos)
        throw std::runtime_error("bad storage handle [" + handle + "]");
    return root_ / handle;
}

std::string TextStore::put(const std::string& bytes) {
    unsigned char rnd[16];
    randombytes_buf(rnd, sizeof rnd);
    char hex[sizeof rnd * 2 + 1];
    sodium_bin2hex(hex, sizeof hex, rnd, sizeof rnd);

    const std::string handle = std::string(hex) + ".txt";
    const fs::path dst = pathFor(handle);
    const fs::path tmp = root_ / (handle + ".part");

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
            throw std::runtime_error("cannot create " + tmp.string());
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            std::error_code ec; fs::remove(tmp, ec);
            throw std::runtime_error("write failed for " + tmp.string());
        }
    }

    // publish atomically so a reader never sees a half-written book
    std::error_code ec;
    fs::rename(tmp, dst, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw std::runtime_error("cannot store book text: " + ec.message());
    }
    return handle;
}

std::string TextStore::read(const std::string& handle, long long byteOffset, long long maxBytes) const {
    if (byteOffset < 0 || maxBytes < 0)
        throw std::runtime_error("negative read range");

    std::ifstream in(pathFor(handle), std::ios::binary);
    if (!in)
        throw std::runtime_error("cannot open book text [" + handle + "]");

    in.seekg(byteOffset, std::ios::beg);
    if (!in)
        throw std::runtime_error("seek failed in [" + handle + "]");

    std::string buf(static_cast<size_t>(maxBytes), '\0');
    in.read(&buf[0], static_cast<std::streamsize>(maxBytes));
    buf.resize(static_cast<size_t>(in.gcount()));   // short read at end of file is fine
    return buf;
}

long long TextStore::size(const std::string& handle) const {
    std::error_code ec;
    auto n = fs::file_size(pathFor(handle), ec);
    if (ec)
        throw std::runtime_error("cannot stat book text [" + handle + "]: " + ec.message());
    return static_cast<long long>(n);
}

bool TextStore::exists(const std::string& handle) const {
    std::error_code ec;
    return fs::exists(pathFor(handle), ec) && !ec;
}

void TextStore::remove(const std::string& handle) const {
    std::error_code ec;
    fs::remove(pathFor(handle), ec);
    if (ec)
        syslog(SYSLOG_ERR, "could not remove book text [%s]: %s", handle.c_str(), ec.message().c_str());
}
