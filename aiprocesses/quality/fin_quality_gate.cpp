#include "fin_quality_gate.h"
#include "../../utils/fin_utf8.h"
#include <cstdio>
#include <iostream>
#include <set>

namespace {
  const double min_alnum_ratio = 0.30;
  const size_t min_words = 5;
  const size_t min_figure_text = 10;

  fin_quality_verdict accept()
  {
    return {true, "OK"};
  }

  fin_quality_verdict reject(const fin_string& reason)
  {
    return {false, reason};
  }
}

fin_quality_gate::fin_quality_gate(long long min_length, long long max_length, long long table_min_rows, bool verbose)
  : min_length(min_length), max_length(max_length), table_min_rows(table_min_rows), verbose(verbose)
{
}

bool fin_quality_gate::is_repetitive(const fin_string& text, double threshold)
{
  std::vector<fin_string> words = text.words();
  if (words.size() < min_words) {
    return true;
  }
  std::set<fin_string> unique(words.begin(), words.end());
  return static_cast<double>(unique.size()) / static_cast<double>(words.size()) < threshold;
}

fin_quality_verdict fin_quality_gate::validate_text(const fin_chunk& chunk) const
{
  std::vector<uint32_t> cps = utf8_decode(chunk.text.value().trim());
  long long length = static_cast<long long>(cps.size());

  if (length < min_length) {
    return reject("Too short (" + fin_string(length) + " chars)");
  }
  if (length > max_length) {
    return reject("Too long (" + fin_string(length) + " chars)");
  }

  size_t alnum = 0;
  for (uint32_t cp : cps) {
    if (utf8_is_alnum(cp)) {
      alnum++;
    }
  }
  double ratio = static_cast<double>(alnum) / static_cast<double>(length);
  if (ratio < min_alnum_ratio) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", ratio);
    return reject("Low alphanumeric ratio (" + fin_string(buf) + ")");
  }

  if (is_repetitive(chunk.text.value().trim())) {
    return reject("Repetitive content detected");
  }

  return accept();
}

fin_quality_verdict fin_quality_gate::validate_table(const fin_chunk& chunk) const
{
  fin_string markdown = chunk.markdown.value().trim();
  if (markdown.empty()) {
    return reject("Empty table");
  }

  long long data_lines = 0;
  for (const auto& line : markdown.lines()) {
    if (line.trim().starts_with("|") && !line.contains("---")) {
      data_lines++;
    }
  }
  if (data_lines < table_min_rows) {
    return reject("Too few rows (" + fin_string(data_lines) + ")");
  }
  return accept();
}

fin_quality_verdict fin_quality_gate::validate_figure(const fin_chunk& chunk) const
{
  if (utf8_length(chunk_to_text(chunk).trim()) < min_figure_text) {
    return reject("Insufficient textual representation");
  }
  return accept();
}

fin_quality_verdict fin_quality_gate::validate(const fin_chunk& chunk) const
{
  switch (chunk.get_kind())
  {
    case fin_chunk_kind::text: return validate_text(chunk);
    case fin_chunk_kind::table: return validate_table(chunk);
    case fin_chunk_kind::figure: return validate_figure(chunk);
    case fin_chunk_kind::unknown: break;
  }
  return {true, "unknown type"};
}

void fin_quality_gate::filter(const fin_model_list<fin_chunk>& chunks, fin_model_list<fin_chunk>& accepted,
                              fin_model_list<fin_chunk>& rejected) const
{
  for (size_t i = 0; i < chunks.size(); ++i) {
    const fin_chunk& chunk = chunks[i];
    fin_quality_verdict verdict = validate(chunk);
    if (verdict.accepted) {
      accepted.push_back(chunk);
    } else {
      rejected.push_back(chunk);
      if (verbose) {
        std::cout << "[QUALITY] rejected (" << verdict.reason << "): "
                  << utf8_left(chunk_to_text(chunk), 80) << std::endl;
      }
    }
  }

  if (!rejected.empty()) {
    std::cout << "[QUALITY] " << accepted.size() << " chunks passed, " << rejected.size() << " rejected" << std::endl;
  }
}
