#include "fin_chunk.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

fin_chunk_kind fin_chunk::get_kind() const
{
  const fin_string& k = kind.value();
  if (k == "text") return fin_chunk_kind::text;
  if (k == "table") return fin_chunk_kind::table;
  if (k == "figure") return fin_chunk_kind::figure;
  return fin_chunk_kind::unknown;
}

void fin_chunk::set_kind(fin_chunk_kind value)
{
  switch (value)
  {
    case fin_chunk_kind::text: kind = "text"; break;
    case fin_chunk_kind::table: kind = "table"; break;
    case fin_chunk_kind::figure: kind = "figure"; break;
    case fin_chunk_kind::unknown: kind = "unknown"; break;
  }
}

fin_string chunk_to_text(const fin_chunk& chunk)
{
  switch (chunk.get_kind())
  {
    case fin_chunk_kind::text:
      return chunk.text.value();
    case fin_chunk_kind::table:
    {
      fin_string result = chunk.markdown.value();
      if (!chunk.summary.value().empty()) {
        result += "\nSummary: " + chunk.summary.value();
      }
      return result;
    }
    case fin_chunk_kind::figure:
    {
      std::vector<fin_string> parts;
      if (!chunk.caption.value().empty()) {
        parts.push_back("Caption: " + chunk.caption.value());
      }
      if (!chunk.chart_description.value().empty()) {
        parts.push_back(chunk.chart_description.value());
      }
      if (!chunk.ocr_text.value().empty()) {
        parts.push_back("OCR overlay: " + chunk.ocr_text.value());
      }
      if (parts.empty()) {
        return "(figure \xE2\x80\x93 no text extracted)";
      }
      return fin_string("\n").join(parts);
    }
    case fin_chunk_kind::unknown:
      break;
  }
  return chunk.text.value();
}

fin_string chunk_citation(const fin_chunk& chunk)
{
  fin_string citation = chunk.source_file.value() + ", p." + fin_string(chunk.page.value());
  if (!chunk.exhibit_id.value().empty()) {
    citation += " \xE2\x80\x93 " + chunk.exhibit_id.value();
  }
  return citation;
}

finv_map chunk_to_metadata(const fin_chunk& chunk)
{
  finv_map meta;
  meta["kind"] = chunk.kind.value();
  meta["doc_id"] = chunk.doc_id.value();
  meta["source_file"] = chunk.source_file.value();
  meta["page"] = chunk.page.value();
  meta["block_type"] = chunk.block_type.value();
  meta["section"] = chunk.section.value();
  meta["exhibit_id"] = chunk.exhibit_id.value();
  meta["time_range"] = chunk.time_range.value();
  meta["units"] = chunk.units.value();
  meta["content_hash"] = chunk.content_hash.value();
  meta["created_at"] = chunk.created_at.value();
  meta["citation"] = chunk_citation(chunk);

  std::vector<fin_string> entities;
  for (const auto& entity : chunk.entities.value()) {
    entities.push_back(entity.convert(fin_variant::string_state).string_value());
  }
  meta["entities"] = fin_string(", ").join(entities);

  if (chunk.get_kind() == fin_chunk_kind::figure) {
    meta["figure_type"] = chunk.figure_type.value();
    meta["image_path"] = chunk.image_path.value();
  }
  return meta;
}

fin_string utc_timestamp()
{
  auto now = std::chrono::system_clock::now();
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  long long micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros << "+00:00";
  return out.str();
}
