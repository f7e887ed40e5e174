#ifndef fin_CHUNK_H
#define fin_CHUNK_H

#include "../../utils/fin_model.h"

enum class fin_chunk_kind
{
  text,
  table,
  figure,
  unknown
};

// Retrievable unit with provenance. One record for all variants; kind
// decides which of the variant fields are meaningful.
class fin_chunk : public fin_model
{
public:
  finp_string(kind);

  // Shared metadata
  finp_string(doc_id);
  finp_string(source_file);
  finp_int(page);
  finp_string(block_type);  // text, table, figure, page_summary
  finp_string(section);
  finp_string(exhibit_id);
  finp_vector(entities);
  finp_string(time_range);
  finp_string(units);
  finp_string(content_hash);
  finp_string(created_at);

  // Text
  finp_string(text);

  // Table
  finp_string(markdown);
  finp_string(csv);
  finp_string(summary);

  // Figure
  finp_string(caption);
  finp_string(ocr_text);
  finp_string(chart_description);
  finp_string(figure_type);
  finp_map(series);  // {"columns": [...], "data": [[...], ...]}
  finp_string(image_path);

  fin_chunk_kind get_kind() const;
  void set_kind(fin_chunk_kind value);

  bool has_series() const { return !series.is_null() && !series.value().empty(); }
};

// Flattened text used for embedding and display
fin_string chunk_to_text(const fin_chunk& chunk);

// "{source_file}, p.{page}" plus " – {exhibit}" when set
fin_string chunk_citation(const fin_chunk& chunk);

// Flat metadata record as stored next to the embedding
finv_map chunk_to_metadata(const fin_chunk& chunk);

// Current time as ISO-8601 UTC with microseconds
fin_string utc_timestamp();

#endif // fin_CHUNK_H
