#ifndef fin_INGEST_CONFIG_H
#define fin_INGEST_CONFIG_H

#include "../../utils/fin_string.h"

// Every ingestion tunable with its default. from_env() overrides each one
// from an INGEST_-prefixed variable, e.g. INGEST_DPI or INGEST_TEXT_CHUNK_SIZE.
struct fin_ingest_config
{
  // Page source
  long long dpi = 100;
  long long max_pages = 0;  // 0 = all pages

  // OCR
  double ocr_confidence_threshold = 0.40;
  double chart_ocr_confidence_threshold = 0.30;
  fin_string ocr_language = "eng";
  long long ocr_timeout_ms = 30000;  // per recognize call, 0 = no deadline

  // Tables
  long long table_min_rows = 2;
  long long table_min_cols = 2;
  long long quality_table_min_rows = 2;

  // Figures
  double figure_min_area_ratio = 0.02;
  double figure_image_min_area_ratio = 0.01;  // segmenter image blocks
  double figure_iou_threshold = 0.3;
  long long vector_min_paths = 5;
  double vector_merge_gap = 10.0;

  // Chunking and quality
  long long text_chunk_size = 450;
  long long text_chunk_overlap = 50;
  bool text_chunk_rescan_tail = false;
  bool include_page_summary = true;
  long long min_chunk_length = 30;
  long long max_chunk_length = 8000;

  // Store
  long long embedding_batch_size = 64;
  long long store_retries = 3;
  long long store_retry_backoff_ms = 200;

  // Runs
  long long workers = 1;
  fin_string storage_dir = "storage";
  fin_string resources_dir = "storage/resources";
  bool verbose = false;

  static fin_ingest_config from_env();

  // Throws fin_ingest_exception naming the first invalid setting
  void validate() const;
};

// Connection settings of the store and the model endpoints
struct fin_store_settings
{
  fin_string database_url;  // empty selects the in-memory store
  fin_string openai_api_key;
  fin_string embedding_model = "text-embedding-3-small";
  long long embedding_dimensions = 1536;
  fin_string embedding_base_url = "https://api.openai.com";
  fin_string describer_model;  // empty disables the LLM chart describer

  static fin_store_settings from_env();
};

#endif // fin_INGEST_CONFIG_H
