#include "fin_ingest_config.h"
#include "../../utils/fin_env.h"
#include "../../utils/fin_exceptions.h"

fin_ingest_config fin_ingest_config::from_env()
{
  fin_ingest_config c;
  c.dpi = env_int("INGEST_DPI", c.dpi);
  c.max_pages = env_int("INGEST_MAX_PAGES", c.max_pages);
  c.ocr_confidence_threshold = env_double("INGEST_OCR_CONFIDENCE_THRESHOLD", c.ocr_confidence_threshold);
  c.chart_ocr_confidence_threshold = env_double("INGEST_CHART_OCR_CONFIDENCE_THRESHOLD", c.chart_ocr_confidence_threshold);
  c.ocr_language = env_string("INGEST_OCR_LANGUAGE", c.ocr_language);
  c.ocr_timeout_ms = env_int("INGEST_OCR_TIMEOUT_MS", c.ocr_timeout_ms);
  c.table_min_rows = env_int("INGEST_TABLE_MIN_ROWS", c.table_min_rows);
  c.table_min_cols = env_int("INGEST_TABLE_MIN_COLS", c.table_min_cols);
  c.quality_table_min_rows = env_int("INGEST_QUALITY_TABLE_MIN_ROWS", c.quality_table_min_rows);
  c.figure_min_area_ratio = env_double("INGEST_FIGURE_MIN_AREA_RATIO", c.figure_min_area_ratio);
  c.figure_image_min_area_ratio = env_double("INGEST_FIGURE_IMAGE_MIN_AREA_RATIO", c.figure_image_min_area_ratio);
  c.figure_iou_threshold = env_double("INGEST_FIGURE_IOU_THRESHOLD", c.figure_iou_threshold);
  c.vector_min_paths = env_int("INGEST_VECTOR_MIN_PATHS", c.vector_min_paths);
  c.vector_merge_gap = env_double("INGEST_VECTOR_MERGE_GAP", c.vector_merge_gap);
  c.text_chunk_size = env_int("INGEST_TEXT_CHUNK_SIZE", c.text_chunk_size);
  c.text_chunk_overlap = env_int("INGEST_TEXT_CHUNK_OVERLAP", c.text_chunk_overlap);
  c.text_chunk_rescan_tail = env_bool("INGEST_TEXT_CHUNK_RESCAN_TAIL", c.text_chunk_rescan_tail);
  c.include_page_summary = env_bool("INGEST_INCLUDE_PAGE_SUMMARY", c.include_page_summary);
  c.min_chunk_length = env_int("INGEST_MIN_CHUNK_LENGTH", c.min_chunk_length);
  c.max_chunk_length = env_int("INGEST_MAX_CHUNK_LENGTH", c.max_chunk_length);
  c.embedding_batch_size = env_int("INGEST_EMBEDDING_BATCH_SIZE", c.embedding_batch_size);
  c.store_retries = env_int("INGEST_STORE_RETRIES", c.store_retries);
  c.store_retry_backoff_ms = env_int("INGEST_STORE_RETRY_BACKOFF_MS", c.store_retry_backoff_ms);
  c.workers = env_int("INGEST_WORKERS", c.workers);
  c.storage_dir = env_string("INGEST_STORAGE_DIR", c.storage_dir);
  c.resources_dir = env_string("INGEST_RESOURCES_DIR", c.resources_dir);
  c.verbose = env_bool("INGEST_VERBOSE", c.verbose);
  return c;
}

void fin_ingest_config::validate() const
{
  if (dpi <= 0) {
    throw fin_ingest_exception("dpi must be positive");
  }
  if (max_pages < 0) {
    throw fin_ingest_exception("max_pages must not be negative");
  }
  if (text_chunk_size <= 0 || text_chunk_overlap < 0 || text_chunk_overlap >= text_chunk_size) {
    throw fin_ingest_exception("text_chunk_overlap must be smaller than text_chunk_size");
  }
  if (min_chunk_length > max_chunk_length) {
    throw fin_ingest_exception("min_chunk_length exceeds max_chunk_length");
  }
  if (embedding_batch_size <= 0) {
    throw fin_ingest_exception("embedding_batch_size must be positive");
  }
  if (ocr_timeout_ms < 0) {
    throw fin_ingest_exception("ocr_timeout_ms must not be negative");
  }
  if (workers <= 0) {
    throw fin_ingest_exception("workers must be positive");
  }
  if (store_retries < 0 || store_retry_backoff_ms < 0) {
    throw fin_ingest_exception("store retry settings must not be negative");
  }
}

fin_store_settings fin_store_settings::from_env()
{
  fin_store_settings s;
  s.database_url = env_string("DATABASE_URL");
  s.openai_api_key = env_string("OPENAI_API_KEY");
  s.embedding_model = env_string("EMBEDDING_MODEL", s.embedding_model);
  s.embedding_dimensions = env_int("EMBEDDING_DIMENSIONS", s.embedding_dimensions);
  s.embedding_base_url = env_string("EMBEDDING_BASE_URL", s.embedding_base_url);
  s.describer_model = env_string("DESCRIBER_MODEL");
  return s;
}
