#include "fin_chunk_tags.h"
#include <algorithm>
#include <regex>
#include <set>

namespace {
  const std::regex acronym_pattern(R"(\b[A-Z]{2,6}\b)");
  const std::regex year_pattern(R"((?:^|\D)((?:19|20)\d{2})(?!\d))");
  const std::regex period_pattern(R"(\b(Q[1-4]|H[12])\s?((?:19|20)\d{2})(?!\d)|\bFY\s?((?:19|20)\d{2})(?!\d))");
  const std::regex currency_pattern(R"(\b(USD|EUR|GBP|JPY|CHF)\b|(\$|€|£))");
  // Scales may follow a number directly, as in "3.1bn"
  const std::regex scale_pattern(R"((?:^|[^A-Za-z])(billion|bn|million|mln|mn|thousand)(?![A-Za-z]))",
                                 std::regex::icase);
  const std::regex percent_pattern(R"(%|\bper ?cent\b)", std::regex::icase);
  const std::regex basis_point_pattern(R"((?:^|[^A-Za-z])(bps?|basis points?)(?![A-Za-z]))", std::regex::icase);

  // All-caps words that are not entities
  const std::set<std::string> not_entities = {
    "USD", "EUR", "GBP", "JPY", "CHF", "FY", "YOY", "QOQ",
    "THE", "AND", "FOR", "OF", "IN", "TO", "ON", "AT", "BY", "OR", "AS", "IS"
  };
}

std::vector<fin_string> find_entities(const fin_string& text, size_t max_count)
{
  std::vector<fin_string> entities;
  const std::string& s = text.to_std_const();
  for (std::sregex_iterator it(s.begin(), s.end(), acronym_pattern), end; it != end; ++it) {
    if (entities.size() >= max_count) {
      break;
    }
    std::string word = it->str();
    if (not_entities.count(word) > 0) {
      continue;
    }
    if (std::find(entities.begin(), entities.end(), fin_string(word)) == entities.end()) {
      entities.push_back(word);
    }
  }
  return entities;
}

fin_string find_time_range(const fin_string& text)
{
  const std::string& s = text.to_std_const();

  std::set<std::string> periods;
  for (std::sregex_iterator it(s.begin(), s.end(), period_pattern), end; it != end; ++it) {
    const std::smatch& m = *it;
    periods.insert(m[1].matched ? m[1].str() + " " + m[2].str() : "FY" + m[3].str());
  }
  if (periods.size() == 1) {
    return *periods.begin();
  }

  int first = 0;
  int last = 0;
  for (std::sregex_iterator it(s.begin(), s.end(), year_pattern), end; it != end; ++it) {
    int year = std::stoi((*it)[1].str());
    if (first == 0 || year < first) {
      first = year;
    }
    last = std::max(last, year);
  }
  if (first == 0) {
    return "";
  }
  if (first == last) {
    return fin_string(first);
  }
  return fin_string(first) + "-" + fin_string(last);
}

fin_string find_units(const fin_string& text)
{
  const std::string& s = text.to_std_const();
  std::vector<fin_string> parts;

  std::smatch m;
  if (std::regex_search(s, m, currency_pattern)) {
    if (m[1].matched) {
      parts.push_back(m[1].str());
    } else if (m[2].str() == "$") {
      parts.push_back("USD");
    } else if (m[2].str() == "€") {
      parts.push_back("EUR");
    } else {
      parts.push_back("GBP");
    }
  }

  if (std::regex_search(s, m, scale_pattern)) {
    fin_string scale = fin_string(m[1].str()).lower();
    if (scale == "bn") {
      scale = "billion";
    } else if (scale == "mn" || scale == "mln") {
      scale = "million";
    }
    parts.push_back(scale);
  }

  if (!parts.empty()) {
    return fin_string(" ").join(parts);
  }
  if (std::regex_search(s, percent_pattern)) {
    return "%";
  }
  if (std::regex_search(s, basis_point_pattern)) {
    return "bp";
  }
  return "";
}

void tag_chunk(fin_chunk& chunk, const fin_string& text)
{
  finv_vector entities;
  for (const auto& entity : find_entities(text)) {
    entities.push_back(entity);
  }
  chunk.entities = entities;
  chunk.time_range = find_time_range(text);
  chunk.units = find_units(text);
}
