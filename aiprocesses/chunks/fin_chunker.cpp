#include "fin_chunker.h"
#include "fin_chunk_tags.h"
#include "../../utils/fin_hash.h"
#include "../../utils/fin_utf8.h"
#include <stdexcept>

namespace {
  struct heading_marker {
    size_t offset;  // code points into the stripped page text
    fin_string text;
  };

  void fill_metadata(fin_chunk& chunk, const fin_string& doc_id, const fin_string& source_file,
                     long long page_number, const fin_string& block_type, const fin_string& section)
  {
    chunk.doc_id = doc_id;
    chunk.source_file = source_file;
    chunk.page = page_number;
    chunk.block_type = block_type;
    chunk.section = section;
    chunk.created_at = utc_timestamp();
  }
}

fin_chunker::fin_chunker(long long chunk_size, long long chunk_overlap, long long min_length,
                         long long max_length, bool include_page_summary, bool rescan_tail)
  : chunk_size(chunk_size), chunk_overlap(chunk_overlap), min_length(min_length),
    max_length(max_length), include_page_summary(include_page_summary), rescan_tail(rescan_tail)
{
  if (chunk_size <= 0 || chunk_overlap < 0 || chunk_overlap >= chunk_size) {
    throw std::invalid_argument("text chunk overlap must be smaller than the chunk size");
  }
}

void fin_chunker::add_text_chunk(const fin_string& text, const fin_string& doc_id, const fin_string& source_file,
                                 long long page_number, const fin_string& section,
                                 fin_model_list<fin_chunk>& chunks) const
{
  chunks.add_element();
  fin_chunk& chunk = chunks.back();
  chunk.set_kind(fin_chunk_kind::text);
  fill_metadata(chunk, doc_id, source_file, page_number, "text", section);
  chunk.text = text;
  chunk.content_hash = sha256_hex(text);
  tag_chunk(chunk, text);
}

fin_string fin_chunker::chunk_text_blocks(const fin_model_list<fin_layout_block>& blocks, const fin_string& doc_id,
                                          const fin_string& source_file, long long page_number,
                                          const fin_string& current_section, fin_model_list<fin_chunk>& chunks) const
{
  fin_string full_text;
  std::vector<std::pair<size_t, fin_string>> marker_bytes;
  fin_string last_section = current_section;

  for (size_t i = 0; i < blocks.size(); ++i) {
    const fin_layout_block& block = blocks[i];
    if (block.is(fin_block_role::heading)) {
      last_section = block.text.value();
      marker_bytes.push_back(std::make_pair(full_text.size(), block.text.value()));
      full_text += "\n## " + block.text.value() + "\n";
    } else if (block.is(fin_block_role::paragraph) || block.is(fin_block_role::footnote)) {
      full_text += block.text.value() + " ";
    }
  }

  // Strip, keeping the marker offsets aligned
  const std::string& raw = full_text.to_std_const();
  size_t lead = raw.find_first_not_of(" \t\n\r\f\v");
  if (lead == std::string::npos) {
    return last_section;
  }
  fin_string stripped = full_text.trim();

  std::vector<heading_marker> markers;
  for (const auto& entry : marker_bytes) {
    size_t byte_offset = entry.first > lead ? entry.first - lead : 0;
    markers.push_back({utf8_length(stripped.left(byte_offset)), entry.second});
  }

  std::vector<uint32_t> cps = utf8_decode(stripped);
  size_t length = cps.size();
  size_t size = static_cast<size_t>(chunk_size);
  size_t step = static_cast<size_t>(chunk_size - chunk_overlap);
  size_t min_len = static_cast<size_t>(std::max(0LL, min_length));

  auto section_at = [&markers, &current_section](size_t start) {
    fin_string section = current_section;
    for (const auto& marker : markers) {
      if (marker.offset <= start) {
        section = marker.text;
      }
    }
    return section;
  };

  fin_string last_kept;
  size_t last_kept_end = 0;
  bool kept_any = false;

  for (size_t start = 0; start < length; start += step) {
    fin_string snippet = utf8_encode(cps, start, size).trim();
    if (utf8_length(snippet) < min_len) {
      continue;
    }
    add_text_chunk(snippet, doc_id, source_file, page_number, section_at(start), chunks);
    last_kept = snippet;
    last_kept_end = std::min(start + size, length);
    kept_any = true;
  }

  if (rescan_tail && kept_any && last_kept_end < length) {
    size_t tail_start = length > size ? length - size : 0;
    fin_string tail = utf8_encode(cps, tail_start, size).trim();
    if (utf8_length(tail) >= min_len && tail != last_kept) {
      add_text_chunk(tail, doc_id, source_file, page_number, section_at(tail_start), chunks);
    }
  }

  return last_section;
}

void fin_chunker::chunk_tables(const fin_model_list<fin_extracted_table>& tables, const fin_string& doc_id,
                               const fin_string& source_file, const fin_string& section,
                               fin_model_list<fin_chunk>& chunks) const
{
  for (size_t i = 0; i < tables.size(); ++i) {
    const fin_extracted_table& table = tables[i];
    fin_string markdown = table.markdown.value();
    if (markdown.trim().empty()) {
      continue;
    }
    long long page_number = table.page_number.value();

    chunks.add_element();
    fin_chunk& chunk = chunks.back();
    chunk.set_kind(fin_chunk_kind::table);
    fill_metadata(chunk, doc_id, source_file, page_number, "table", section);
    chunk.exhibit_id = "Table " + fin_string(static_cast<long long>(i + 1)) + " (p." + fin_string(page_number) + ")";
    chunk.markdown = markdown;
    chunk.csv = table.csv.value();
    chunk.summary = "";
    chunk.content_hash = sha256_hex(markdown);
    tag_chunk(chunk, markdown);
  }
}

void fin_chunker::chunk_figures(const fin_model_list<fin_extracted_figure>& figures,
                                const std::vector<fin_figure_signals>& signals, const fin_string& doc_id,
                                const fin_string& source_file, const fin_string& section,
                                fin_model_list<fin_chunk>& chunks) const
{
  for (size_t i = 0; i < figures.size(); ++i) {
    const fin_extracted_figure& figure = figures[i];
    fin_figure_signals empty;
    const fin_figure_signals& signal = i < signals.size() ? signals[i] : empty;
    long long page_number = figure.page_number.value();

    fin_string text_repr = (figure.caption.value() + " " + signal.description + " " + signal.ocr_text).trim();
    if (static_cast<long long>(utf8_length(text_repr)) < min_length) {
      text_repr = "Figure from " + source_file + " page " + fin_string(page_number);
    }

    chunks.add_element();
    fin_chunk& chunk = chunks.back();
    chunk.set_kind(fin_chunk_kind::figure);
    fill_metadata(chunk, doc_id, source_file, page_number, "figure", section);
    chunk.exhibit_id = "Figure " + fin_string(figure.figure_index.value()) + " (p." + fin_string(page_number) + ")";
    chunk.caption = figure.caption.value();
    chunk.ocr_text = signal.ocr_text;
    chunk.chart_description = signal.description;
    chunk.figure_type = figure_type_name(signal.type);
    if (!signal.series.empty()) {
      chunk.series = signal.series;
    }
    chunk.image_path = figure.image_path.value();
    chunk.content_hash = sha256_hex(text_repr);
    tag_chunk(chunk, text_repr);
  }
}

bool fin_chunker::page_summary(const fin_string& raw_text, const fin_string& doc_id, const fin_string& source_file,
                               long long page_number, fin_model_list<fin_chunk>& chunks) const
{
  if (!include_page_summary) {
    return false;
  }
  // The marker counts against max_length
  fin_string marker = "[Page " + fin_string(page_number) + " overview] ";
  long long budget = max_length - static_cast<long long>(utf8_length(marker));
  if (budget <= 0) {
    return false;
  }
  fin_string truncated = utf8_left(raw_text.trim(), static_cast<size_t>(budget));
  if (static_cast<long long>(utf8_length(truncated)) < min_length) {
    return false;
  }

  chunks.add_element();
  fin_chunk& chunk = chunks.back();
  chunk.set_kind(fin_chunk_kind::text);
  fill_metadata(chunk, doc_id, source_file, page_number, "page_summary", "");
  chunk.text = marker + truncated;
  chunk.content_hash = sha256_hex(truncated);
  tag_chunk(chunk, truncated);
  return true;
}
