#ifndef TXTREADER_CHAPTERINDEXER_H
#define TXTREADER_CHAPTERINDEXER_H

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "Models.h"

//
// ChapterRule: one heading shape.  The predicate sees a single line with
// leading/trailing whitespace already removed (never empty).
//
struct ChapterRule {
    std::string name;
    std::function<bool(std::u32string_view line)> matches;
};

using ChapterRuleSet = std::vector<ChapterRule>;

// the canonical heading shapes, highest priority first:
//   numbered ("第十二章 ...", "3节"), named ("序章", "番外 ..."),
//   english ("Chapter 7: ...", "PART IV"), numeral ("12", "XIV.")
ChapterRuleSet defaultChapterRules();

//
// ChapterIndexer: single left-to-right pass over the lines of a book.
//   Each line is tested against the rules in order; the first match makes the
//   line a chapter whose position is the character offset of the line start.
//   Text before the first heading is preamble and gets no entry.
//
class ChapterIndexer {
public:
    explicit ChapterIndexer(ChapterRuleSet rules = defaultChapterRules());

    // text must be valid UTF-8; never throws on valid input
    std::vector<ChapterMarker> index(std::string_view text) const;

    // name of the first rule matching this (untrimmed) line, or empty
    std::string classify(std::u32string_view line) const;

    const ChapterRuleSet& rules() const { return rules_; }

private:
    ChapterRuleSet rules_;
};

#endif // TXTREADER_CHAPTERINDEXER_H
