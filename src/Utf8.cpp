#include "Utf8.h"

int utf8SeqLen(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;   // continuation byte, overlong lead or out of range
}

bool utf8Next(std::string_view s, size_t& i, char32_t& cp) {
    if (i >= s.size()) return false;

    const auto lead = static_cast<unsigned char>(s[i]);
    const int n = utf8SeqLen(lead);
    if (n == 0 || i + n > s.size()) return false;

    if (n == 1) {
        cp = lead;
        i += 1;
        return true;
    }

    char32_t v = lead & (0xFF >> (n + 1));
    for (int k = 1; k < n; ++k) {
        const auto c = static_cast<unsigned char>(s[i + k]);
        if ((c & 0xC0) != 0x80) return false;
        v = (v << 6) | (c & 0x3F);
    }

    // reject overlongs, surrogates and anything past U+10FFFF
    if ((n == 3 && v < 0x800) || (n == 4 && v < 0x10000)) return false;
    if (v >= 0xD800 && v <= 0xDFFF) return false;
    if (v > 0x10FFFF) return false;

    cp = v;
    i += n;
    return true;
}

bool utf8IsValid(std::string_view s) {
    size_t i = 0;
    char32_t cp;
    while (i < s.size()) {
        if (!utf8Next(s, i, cp)) return false;
    }
    return true;
}

long long utf8Count(std::string_view s) {
    long long n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;    // count everything but continuation bytes
    }
    return n;
}

std::u32string utf8Decode(std::string_view s) {
    std::u32string out;
    out.reserve(s.size());
    size_t i = 0;
    char32_t cp;
    while (i < s.size()) {
        if (!utf8Next(s, i, cp)) {
            out.push_back(U'\uFFFD');
            ++i;
            continue;
        }
        out.push_back(cp);
    }
    return out;
}

void utf8Append(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string utf8Encode(std::u32string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char32_t cp : s) utf8Append(out, cp);
    return out;
}

bool stripUtf8Bom(std::string& s) {
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s.erase(0, 3);
        return true;
    }
    return false;
}
