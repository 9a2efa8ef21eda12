#ifndef TXTREADER_UTF8_H
#define TXTREADER_UTF8_H

#include <string>
#include <string_view>

//
// UTF-8 helpers. A "character" everywhere in txtreaderd is one Unicode code point.
//

// length of the sequence introduced by this lead byte, or 0 if it can't start one
int utf8SeqLen(unsigned char lead);

// decode one code point at s[i], advancing i past it.
// RETURNS: false (i untouched) if the sequence is truncated or malformed
bool utf8Next(std::string_view s, size_t& i, char32_t& cp);

bool utf8IsValid(std::string_view s);

// number of code points; s must be valid UTF-8
long long utf8Count(std::string_view s);

std::u32string utf8Decode(std::string_view s);
std::string utf8Encode(std::u32string_view s);
void utf8Append(std::string& out, char32_t cp);

// remove a leading byte order mark, if present
bool stripUtf8Bom(std::string& s);

#endif // TXTREADER_UTF8_H
