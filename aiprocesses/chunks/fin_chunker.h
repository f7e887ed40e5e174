#ifndef fin_CHUNKER_H
#define fin_CHUNKER_H

#include "fin_chunk.h"
#include "../layout/fin_layout_block.h"
#include "../tables/fin_extracted_table.h"
#include "../figures/fin_extracted_figure.h"
#include "../vision/fin_figure_type.h"
#include <vector>

// Collaborator output for one extracted figure
struct fin_figure_signals {
  fin_string ocr_text;
  fin_string description;
  fin_figure_type type = fin_figure_type::unknown;
  finv_map series;  // empty when not digitized
};

class fin_chunker
{
public:
  fin_chunker(long long chunk_size = 450, long long chunk_overlap = 50, long long min_length = 30,
              long long max_length = 8000, bool include_page_summary = true, bool rescan_tail = false);

  // Sliding windows over the page prose. Returns the section in effect
  // after the page, for threading into the next one.
  fin_string chunk_text_blocks(const fin_model_list<fin_layout_block>& blocks, const fin_string& doc_id,
                               const fin_string& source_file, long long page_number,
                               const fin_string& current_section, fin_model_list<fin_chunk>& chunks) const;

  // One chunk per table with non-empty markdown, numbered within the list
  void chunk_tables(const fin_model_list<fin_extracted_table>& tables, const fin_string& doc_id,
                    const fin_string& source_file, const fin_string& section,
                    fin_model_list<fin_chunk>& chunks) const;

  // signals[i] belongs to figures[i]; missing entries count as empty
  void chunk_figures(const fin_model_list<fin_extracted_figure>& figures,
                     const std::vector<fin_figure_signals>& signals, const fin_string& doc_id,
                     const fin_string& source_file, const fin_string& section,
                     fin_model_list<fin_chunk>& chunks) const;

  // Optional whole-page overview chunk; false when disabled or too short
  bool page_summary(const fin_string& raw_text, const fin_string& doc_id, const fin_string& source_file,
                    long long page_number, fin_model_list<fin_chunk>& chunks) const;

  long long get_min_length() const { return min_length; }

private:
  long long chunk_size;
  long long chunk_overlap;
  long long min_length;
  long long max_length;
  bool include_page_summary;
  bool rescan_tail;

  void add_text_chunk(const fin_string& text, const fin_string& doc_id, const fin_string& source_file,
                      long long page_number, const fin_string& section, fin_model_list<fin_chunk>& chunks) const;
};

#endif // fin_CHUNKER_H
