#ifndef fin_INGEST_STATS_H
#define fin_INGEST_STATS_H

#include "../../utils/fin_string.h"
#include <vector>

// Counters of one ingestion invocation, never persisted
struct fin_ingest_stats
{
  long long files_processed = 0;
  long long files_skipped = 0;
  long long files_failed = 0;
  long long pages_processed = 0;
  long long text_chunks = 0;
  long long table_chunks = 0;
  long long figure_chunks = 0;
  long long chunks_rejected = 0;
  long long chunks_stored = 0;
  double elapsed_seconds = 0.0;

  // Adds counters; elapsed time is left to the caller
  void add(const fin_ingest_stats& other);

  fin_string summary() const;
};

enum class fin_document_state
{
  NEW,
  PARSED,
  SEGMENTED,
  EXTRACTED,
  CHUNKED,
  FILTERED,
  STORED,
  SKIPPED,
  FAILED,
  CANCELLED
};

fin_string document_state_name(fin_document_state state);

bool is_terminal(fin_document_state state);

// Outcome of one document
struct fin_ingest_result
{
  fin_string file;
  fin_string doc_id;
  fin_document_state state = fin_document_state::NEW;
  std::vector<fin_document_state> history;  // every state entered, NEW first
  fin_string error;
  fin_ingest_stats stats;
};

#endif // fin_INGEST_STATS_H
