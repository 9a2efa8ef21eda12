#include <algorithm>
#include <array>
#include <initializer_list>
#include <string>
#include <utility>

#include "ChapterIndexer.h"
#include "Utf8.h"

namespace {

    // longest title fragment allowed after a CJK heading token
    constexpr size_t kCjkTitleTail = 30;
    // longest whole line for the english shapes
    constexpr size_t kEnglishMaxLine = 80;
    // lines longer than this (in characters) are body text, not headings
    constexpr size_t kMaxHeadingLine = 120;

    bool isSpace(char32_t c) {
        return c == U' ' || c == U'\t' || c == U'\r' || c == U'\v' || c == U'\f' ||
               c == 0x3000 || c == 0x00A0 || c == 0xFEFF;
    }

    std::u32string_view trim(std::u32string_view s) {
        size_t a = 0, b = s.size();
        while (a < b && isSpace(s[a])) ++a;
        while (b > a && isSpace(s[b - 1])) --b;
        return s.substr(a, b - a);
    }

    bool startsWith(std::u32string_view s, std::u32string_view prefix) {
        return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
    }

    bool contains(std::u32string_view set, char32_t c) {
        return set.find(c) != std::u32string_view::npos;
    }

    bool isDigit(char32_t c) { return c >= U'0' && c <= U'9'; }
    bool isAsciiAlpha(char32_t c) { return (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z'); }
    char32_t asciiLower(char32_t c) { return (c >= U'A' && c <= U'Z') ? c + 32 : c; }

    size_t skipSpaces(std::u32string_view s, size_t i, size_t max) {
        size_t n = 0;
        while (i < s.size() && n < max && isSpace(s[i])) { ++i; ++n; }
        return i;
    }

    // case-insensitive ASCII prefix test
    bool startsWithNoCase(std::u32string_view s, const char* prefix) {
        size_t i = 0;
        for (; prefix[i]; ++i) {
            if (i >= s.size() || asciiLower(s[i]) != static_cast<char32_t>(prefix[i])) return false;
        }
        return true;
    }

    const std::u32string_view kCjkNumerals = U"〇零一二两三四五六七八九十百千万壹贰叁肆伍陆柒捌玖拾佰仟";
    const std::u32string_view kCjkUnits    = U"章节卷集部篇";

    // unit followed by these is ordinary prose ("一节课", "三部分", ...)
    bool excludedUnit(char32_t unit, char32_t after) {
        switch (unit) {
            case U'节': return after == U'课';
            case U'集': return after == U'合' || after == U'和';
            case U'部': return after == U'分' || after == U'赛' || after == U'游';
            case U'篇': return after == U'张';
            default:    return false;
        }
    }

    // [第] [spaces<=4] numerals [spaces<=4] unit [title<=30]
    bool matchNumbered(std::u32string_view line) {
        size_t i = 0;
        if (line[0] == U'第') i = 1;
        i = skipSpaces(line, i, 4);

        const size_t numStart = i;
        while (i < line.size() && (isDigit(line[i]) || contains(kCjkNumerals, line[i]))) ++i;
        if (i == numStart) return false;

        i = skipSpaces(line, i, 4);
        if (i >= line.size() || !contains(kCjkUnits, line[i])) return false;

        const char32_t unit  = line[i];
        const char32_t after = (i + 1 < line.size()) ? line[i + 1] : 0;
        if (excludedUnit(unit, after)) return false;

        return line.size() - (i + 1) <= kCjkTitleTail;
    }

    bool matchNamed(std::u32string_view line) {
        static const std::array<std::u32string_view, 10> kNames = {
            U"序章", U"序言", U"卷首语", U"扉页", U"楔子", U"正文", U"终章", U"后记", U"尾声", U"番外"
        };
        for (const auto& name : kNames) {
            if (!startsWith(line, name)) continue;
            const size_t end = name.size();
            if (name == U"正文" && end < line.size() && (line[end] == U'完' || line[end] == U'结'))
                return false;
            return line.size() - end <= kCjkTitleTail;
        }
        return false;
    }

    // value of a canonical roman numeral (I..MMMCMXCIX), 0 if not one
    int romanValue(std::u32string_view s, bool anyCase) {
        if (s.empty() || s.size() > 15) return 0;

        auto digit = [&](char32_t c) -> int {
            if (anyCase && c >= U'a' && c <= U'z') c -= 32;
            switch (c) {
                case U'I': return 1;    case U'V': return 5;
                case U'X': return 10;   case U'L': return 50;
                case U'C': return 100;  case U'D': return 500;
                case U'M': return 1000;
                default:   return 0;
            }
        };

        int total = 0;
        for (size_t k = 0; k < s.size(); ++k) {
            const int v = digit(s[k]);
            if (v == 0) return 0;
            const int nextV = (k + 1 < s.size()) ? digit(s[k + 1]) : 0;
            total += (v < nextV) ? -v : v;
        }
        if (total <= 0 || total > 3999) return 0;

        // only accept the canonical spelling ("IIII", "IC" etc. are not numerals)
        static const std::array<std::pair<int, const char*>, 13> kTable = {{
            {1000, "M"}, {900, "CM"}, {500, "D"}, {400, "CD"}, {100, "C"}, {90, "XC"},
            {50, "L"}, {40, "XL"}, {10, "X"}, {9, "IX"}, {5, "V"}, {4, "IV"}, {1, "I"}
        }};
        std::u32string canonical;
        int rest = total;
        for (const auto& [value, text] : kTable) {
            while (rest >= value) {
                for (const char* p = text; *p; ++p) canonical.push_back(static_cast<char32_t>(*p));
                rest -= value;
            }
        }
        if (canonical.size() != s.size()) return 0;
        for (size_t k = 0; k < s.size(); ++k) {
            char32_t c = s[k];
            if (anyCase && c >= U'a' && c <= U'z') c -= 32;
            if (c != canonical[k]) return 0;
        }
        return total;
    }

    // "Chapter 7", "PART IV: The Return", "Book twelve - ...", "Prologue"
    bool matchEnglish(std::u32string_view line) {
        if (line.size() > kEnglishMaxLine) return false;

        for (const char* bare : {"prologue", "epilogue"}) {
            if (startsWithNoCase(line, bare)) {
                const size_t end = std::char_traits<char>::length(bare);
                return end == line.size() || !isAsciiAlpha(line[end]);
            }
        }

        size_t i = 0;
        for (const char* keyword : {"chapter", "part", "book"}) {
            if (startsWithNoCase(line, keyword)) { i = std::char_traits<char>::length(keyword); break; }
        }
        if (i == 0 || i >= line.size() || !isSpace(line[i])) return false;
        i = skipSpaces(line, i, 4);

        const size_t tokStart = i;
        while (i < line.size() && (isDigit(line[i]) || isAsciiAlpha(line[i]))) ++i;
        const std::u32string_view token = line.substr(tokStart, i - tokStart);
        if (token.empty()) return false;

        bool numeric = std::all_of(token.begin(), token.end(), isDigit);
        if (numeric && token.size() > 4) return false;
        if (!numeric && romanValue(token, true) == 0) {
            static const std::array<const char*, 20> kWords = {
                "one", "two", "three", "four", "five", "six", "seven", "eight", "nine", "ten",
                "eleven", "twelve", "thirteen", "fourteen", "fifteen", "sixteen", "seventeen",
                "eighteen", "nineteen", "twenty"
            };
            bool word = false;
            for (const char* w : kWords) {
                if (std::char_traits<char>::length(w) == token.size() && startsWithNoCase(token, w)) {
                    word = true;
                    break;
                }
            }
            if (!word) return false;
        }

        // whatever follows must be separated from the number
        return i == line.size() || !isAsciiAlpha(line[i]);
    }

    // a line holding only "12", "12.", "XIV" or "XIV."
    bool matchNumeral(std::u32string_view line) {
        if (line.back() == U'.') line.remove_suffix(1);
        if (line.empty()) return false;
        if (std::all_of(line.begin(), line.end(), isDigit)) return line.size() <= 4;
        return romanValue(line, false) > 0;
    }

} // namespace

ChapterRuleSet defaultChapterRules() {
    return {
        {"numbered", matchNumbered},
        {"named",    matchNamed},
        {"english",  matchEnglish},
        {"numeral",  matchNumeral},
    };
}

ChapterIndexer::ChapterIndexer(ChapterRuleSet rules) : rules_(std::move(rules)) {}

std::string ChapterIndexer::classify(std::u32string_view line) const {
    const auto t = trim(line);
    if (t.empty() || t.size() > kMaxHeadingLine) return {};
    for (const auto& rule : rules_) {
        if (rule.matches && rule.matches(t)) return rule.name;
    }
    return {};
}

std::vector<ChapterMarker> ChapterIndexer::index(std::string_view text) const {
    std::vector<ChapterMarker> chapters;

    long long lineStart = 0;    // character offset of the current line
    size_t pos = 0;             // byte offset of the current line
    while (pos < text.size()) {
        size_t nl = text.find('\n', pos);
        const bool last = (nl == std::string_view::npos);
        if (last) nl = text.size();

        const std::string_view raw = text.substr(pos, nl - pos);
        const long long lineChars = utf8Count(raw);

        // cheap reject before decoding: too long to be a heading
        if (raw.size() <= kMaxHeadingLine * 4) {
            const std::u32string decoded = utf8Decode(raw);
            if (!classify(decoded).empty())
                chapters.push_back(ChapterMarker{utf8Encode(trim(decoded)), lineStart});
        }

        lineStart += lineChars + (last ? 0 : 1);
        pos = nl + 1;
    }

    return chapters;
}
