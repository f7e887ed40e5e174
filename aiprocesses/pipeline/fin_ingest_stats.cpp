#include "fin_ingest_stats.h"
#include <cstdio>

void fin_ingest_stats::add(const fin_ingest_stats& other)
{
  files_processed += other.files_processed;
  files_skipped += other.files_skipped;
  files_failed += other.files_failed;
  pages_processed += other.pages_processed;
  text_chunks += other.text_chunks;
  table_chunks += other.table_chunks;
  figure_chunks += other.figure_chunks;
  chunks_rejected += other.chunks_rejected;
  chunks_stored += other.chunks_stored;
}

fin_string fin_ingest_stats::summary() const
{
  char elapsed[32];
  std::snprintf(elapsed, sizeof(elapsed), "%.1f", elapsed_seconds);

  return fin_string(files_processed) + " files (" + fin_string(files_skipped) + " skipped, " +
         fin_string(files_failed) + " failed), " + fin_string(pages_processed) + " pages, " +
         fin_string(text_chunks) + " text / " + fin_string(table_chunks) + " table / " +
         fin_string(figure_chunks) + " figure chunks, " + fin_string(chunks_rejected) + " rejected, " +
         fin_string(chunks_stored) + " stored in " + elapsed + "s";
}

fin_string document_state_name(fin_document_state state)
{
  switch (state) {
    case fin_document_state::NEW: return "NEW";
    case fin_document_state::PARSED: return "PARSED";
    case fin_document_state::SEGMENTED: return "SEGMENTED";
    case fin_document_state::EXTRACTED: return "EXTRACTED";
    case fin_document_state::CHUNKED: return "CHUNKED";
    case fin_document_state::FILTERED: return "FILTERED";
    case fin_document_state::STORED: return "STORED";
    case fin_document_state::SKIPPED: return "SKIPPED";
    case fin_document_state::FAILED: return "FAILED";
    case fin_document_state::CANCELLED: return "CANCELLED";
  }
  return "UNKNOWN";
}

bool is_terminal(fin_document_state state)
{
  return state == fin_document_state::STORED || state == fin_document_state::SKIPPED ||
         state == fin_document_state::FAILED || state == fin_document_state::CANCELLED;
}
