#ifndef fin_UTF8_H
#define fin_UTF8_H

#include "fin_string.h"
#include <cstdint>
#include <vector>

// Code point helpers. Text is sanitized first, so invalid sequences count
// as one replacement character each.

fin_string utf8_sanitize(const fin_string& text);
std::vector<uint32_t> utf8_decode(const fin_string& text);
fin_string utf8_encode(const std::vector<uint32_t>& codepoints, size_t start = 0,
                       size_t count = fin_string::npos);
size_t utf8_length(const fin_string& text);
fin_string utf8_left(const fin_string& text, size_t count);

// Letters and digits: ASCII alnum plus non-ASCII letters outside the
// punctuation, symbol and currency blocks
bool utf8_is_alnum(uint32_t cp);

#endif // fin_UTF8_H
