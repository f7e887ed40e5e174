#ifndef fin_INGEST_PIPELINE_H
#define fin_INGEST_PIPELINE_H

#include "fin_ingest_config.h"
#include "fin_ingest_stats.h"
#include "fin_known_documents.h"
#include "../chunks/fin_chunker.h"
#include "../figures/fin_figure_extractor.h"
#include "../layout/fin_layout_segmenter.h"
#include "../quality/fin_quality_gate.h"
#include "../tables/fin_table_extractor.h"
#include "../vision/fin_chart_classifier.h"
#include "../vision/fin_chart_describer.h"
#include "../vision/fin_ocr_engine.h"
#include "../../api/store/fin_chunk_store.h"
#include "../../documents/fin_doc_sio.h"
#include <atomic>
#include <functional>
#include <memory>

// Page source for one document
typedef std::function<std::unique_ptr<fin_doc_sio>(const fin_ingest_config&)> fin_page_source_factory;

// Optional collaborators, not owned. A missing one yields empty results.
struct fin_ingest_collaborators
{
  fin_ocr_engine* ocr = nullptr;
  fin_chart_classifier* classifier = nullptr;
  fin_chart_describer* describer = nullptr;
  fin_chart_digitizer* digitizer = nullptr;
  fin_region_detector* region_detector = nullptr;
};

/**
 * Per-document state machine:
 * NEW -> PARSED -> SEGMENTED -> EXTRACTED -> CHUNKED -> FILTERED -> STORED,
 * ending early in SKIPPED, FAILED or CANCELLED.
 *
 * Pages are processed in order and the section heading is carried from one
 * page to the next. All chunks of a document go through the quality gate
 * together and reach the store as one batch; the content hash of the file
 * is marked known only after that batch is stored.
 */
class fin_ingest_pipeline
{
public:
  // Throws fin_ingest_exception for an invalid config
  fin_ingest_pipeline(const fin_ingest_config& config, fin_chunk_store& store, fin_known_documents& known,
                      const fin_ingest_collaborators& collaborators = fin_ingest_collaborators());

  void set_page_source_factory(fin_page_source_factory factory);

  // Never throws; failures end in FAILED with result.error set
  fin_ingest_result ingest_file(const fin_string& path, bool force = false);

  // Every *.pdf in dir, sorted by name, on up to config.workers threads.
  // A failing file is counted and the run goes on.
  fin_ingest_stats ingest_folder(const fin_string& dir, bool force = false,
                                 std::vector<fin_ingest_result>* results = nullptr);

  // Checked between pages and before the store step
  void cancel();
  void reset_cancel();
  bool is_cancelled() const;

  // Segment, extract and chunk one page. current_section is read and
  // updated; the raster is released afterwards.
  void chunk_page(fin_page_record& page, const fin_string& doc_id, const fin_string& source_file,
                  fin_string& current_section, fin_model_list<fin_chunk>& chunks) const;

  const fin_ingest_config& get_config() const { return config; }

private:
  fin_ingest_config config;
  fin_chunk_store& store;
  fin_known_documents& known;
  fin_ingest_collaborators collaborators;
  fin_page_source_factory page_source_factory;
  std::atomic<bool> cancelled;

  fin_layout_segmenter segmenter;
  fin_table_extractor table_extractor;
  fin_figure_extractor figure_extractor;
  fin_chunker chunker;
  fin_quality_gate gate;

  void run_document(const fin_string& path, const fin_string& source_file, bool force, fin_ingest_result& result);

  // false when cancelled
  bool process_pages(fin_doc_sio& source, const fin_string& doc_id, const fin_string& source_file,
                     fin_model_list<fin_chunk>& chunks, fin_ingest_result& result);

  // Replace the text blocks of a page without text layer by one OCR
  // paragraph. Native blocks stay when OCR is missing, fails or reads nothing.
  void substitute_ocr_text(const fin_page_record& page, fin_model_list<fin_layout_block>& text_blocks) const;

  fin_figure_signals analyse_figure(const fin_extracted_figure& figure) const;

  // Throws fin_store_error once the retries are used up
  size_t store_with_retry(const fin_model_list<fin_chunk>& chunks, const fin_string& source_file);

  // Moves forward only; repeated or earlier states are ignored
  static void advance(fin_ingest_result& result, fin_document_state state);
};

#endif // fin_INGEST_PIPELINE_H
