#include "fin_utf8.h"
#include <utf8cpp/utf8.h>
#include <iterator>

fin_string utf8_sanitize(const fin_string& text)
{
  const std::string& in = text.to_std_const();
  if (utf8::is_valid(in.begin(), in.end())) {
    return text;
  }
  std::string out;
  utf8::replace_invalid(in.begin(), in.end(), std::back_inserter(out));
  return fin_string(out);
}

std::vector<uint32_t> utf8_decode(const fin_string& text)
{
  fin_string clean = utf8_sanitize(text);
  const std::string& in = clean.to_std_const();
  std::vector<uint32_t> out;
  out.reserve(in.size());
  utf8::utf8to32(in.begin(), in.end(), std::back_inserter(out));
  return out;
}

fin_string utf8_encode(const std::vector<uint32_t>& codepoints, size_t start, size_t count)
{
  if (start >= codepoints.size()) {
    return fin_string();
  }
  size_t end = (count == fin_string::npos || count > codepoints.size() - start)
    ? codepoints.size() : start + count;
  std::string out;
  utf8::utf32to8(codepoints.begin() + static_cast<std::ptrdiff_t>(start),
                 codepoints.begin() + static_cast<std::ptrdiff_t>(end),
                 std::back_inserter(out));
  return fin_string(out);
}

size_t utf8_length(const fin_string& text)
{
  fin_string clean = utf8_sanitize(text);
  const std::string& in = clean.to_std_const();
  return static_cast<size_t>(utf8::distance(in.begin(), in.end()));
}

fin_string utf8_left(const fin_string& text, size_t count)
{
  return utf8_encode(utf8_decode(text), 0, count);
}

bool utf8_is_alnum(uint32_t cp)
{
  if (cp < 0x80) {
    return std::isalnum(static_cast<int>(cp)) != 0;
  }
  if (cp < 0xC0) {
    return cp == 0xAA || cp == 0xB2 || cp == 0xB3 || cp == 0xB5 || cp == 0xB9 || cp == 0xBA;
  }
  if (cp == 0xD7 || cp == 0xF7) {
    return false;
  }
  // general punctuation, super/subscripts, currency, letterlike, arrows,
  // math operators, box drawing and other symbol blocks
  if (cp >= 0x2000 && cp <= 0x2BFF) {
    return false;
  }
  if (cp >= 0x3000 && cp <= 0x303F) {
    return false;
  }
  if (cp >= 0xFE30 && cp <= 0xFE4F) {
    return false;
  }
  if (cp >= 0xFF00 && cp <= 0xFF0F) {
    return false;
  }
  if (cp == 0xFFFD) {
    return false;
  }
  return true;
}
