#include "fin_ingest_pipeline.h"
#include "../../documents/pdf/fin_pdf_sio.h"
#include "../../utils/fin_exceptions.h"
#include "../../utils/fin_hash.h"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>

namespace {

const fin_ingest_config& checked(const fin_ingest_config& config)
{
  config.validate();
  return config;
}

double seconds_since(const std::chrono::steady_clock::time_point& start)
{
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

fin_ingest_pipeline::fin_ingest_pipeline(const fin_ingest_config& config, fin_chunk_store& store,
                                         fin_known_documents& known,
                                         const fin_ingest_collaborators& collaborators)
  : config(checked(config))
  , store(store)
  , known(known)
  , collaborators(collaborators)
  , cancelled(false)
  , segmenter(config.figure_image_min_area_ratio)
  , table_extractor(config.table_min_rows, config.table_min_cols, static_cast<int>(config.dpi),
                    config.ocr_confidence_threshold)
  , figure_extractor(static_cast<int>(config.dpi), config.figure_min_area_ratio, config.figure_iou_threshold,
                     config.resources_dir, config.storage_dir)
  , chunker(config.text_chunk_size, config.text_chunk_overlap, config.min_chunk_length,
            config.max_chunk_length, config.include_page_summary, config.text_chunk_rescan_tail)
  , gate(config.min_chunk_length, config.max_chunk_length, config.quality_table_min_rows, config.verbose)
{
  segmenter.set_region_detector(collaborators.region_detector);
  table_extractor.set_ocr_engine(collaborators.ocr);

  page_source_factory = [](const fin_ingest_config& c) {
    std::unique_ptr<fin_pdf_sio> source(new fin_pdf_sio(static_cast<int>(c.dpi), static_cast<int>(c.max_pages)));
    source->set_drawing_clustering(c.vector_merge_gap, c.vector_min_paths);
    return std::unique_ptr<fin_doc_sio>(std::move(source));
  };
}

void fin_ingest_pipeline::set_page_source_factory(fin_page_source_factory factory)
{
  page_source_factory = std::move(factory);
}

void fin_ingest_pipeline::cancel()
{
  cancelled = true;
}

void fin_ingest_pipeline::reset_cancel()
{
  cancelled = false;
}

bool fin_ingest_pipeline::is_cancelled() const
{
  return cancelled;
}

void fin_ingest_pipeline::advance(fin_ingest_result& result, fin_document_state state)
{
  if (is_terminal(result.state) || static_cast<int>(state) <= static_cast<int>(result.state))
  {
    return;
  }
  result.state = state;
  result.history.push_back(state);
}

fin_ingest_result fin_ingest_pipeline::ingest_file(const fin_string& path, bool force)
{
  auto started = std::chrono::steady_clock::now();

  fin_ingest_result result;
  result.file = path;
  result.state = fin_document_state::NEW;
  result.history.push_back(fin_document_state::NEW);

  fin_string source_file = std::filesystem::path(path.to_std_const()).filename().string();

  try
  {
    run_document(path, source_file, force, result);
  }
  catch (const std::exception& e)
  {
    std::cerr << "[PIPELINE] " << source_file << ": " << e.what() << std::endl;
    if (!is_terminal(result.state))
    {
      if (!result.doc_id.empty())
      {
        known.release(result.doc_id);
      }
      result.state = fin_document_state::FAILED;
      result.history.push_back(fin_document_state::FAILED);
      result.error = e.what();
    }
  }

  if (result.state == fin_document_state::FAILED)
  {
    result.stats.files_failed = 1;
  }
  else if (result.state == fin_document_state::SKIPPED)
  {
    result.stats.files_skipped = 1;
  }
  result.stats.elapsed_seconds = seconds_since(started);
  return result;
}

void fin_ingest_pipeline::run_document(const fin_string& path, const fin_string& source_file, bool force,
                                       fin_ingest_result& result)
{
  auto fail = [&result](const fin_string& message) {
    result.error = message;
    result.state = fin_document_state::FAILED;
    result.history.push_back(fin_document_state::FAILED);
  };
  auto finish = [&result](fin_document_state state) {
    result.state = state;
    result.history.push_back(state);
  };

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path.to_std_const(), ec))
  {
    std::cerr << "[PIPELINE] File does not exist: " << path << std::endl;
    fail("file does not exist: " + path);
    return;
  }

  fin_string doc_id;
  if (!sha256_file(path, doc_id))
  {
    std::cerr << "[PIPELINE] Cannot read " << path << std::endl;
    fail("cannot read file: " + path);
    return;
  }
  result.doc_id = doc_id;

  if (!known.try_reserve(doc_id, !force))
  {
    std::cout << "[PIPELINE] Skipping " << source_file << " (already ingested)" << std::endl;
    finish(fin_document_state::SKIPPED);
    return;
  }

  try
  {
    if (!force && store.exists_by_doc_id(doc_id))
    {
      std::cout << "[PIPELINE] Skipping " << source_file << " (already stored)" << std::endl;
      known.commit(doc_id);
      finish(fin_document_state::SKIPPED);
      return;
    }
  }
  catch (const fin_store_error& e)
  {
    known.release(doc_id);
    fail(fin_string("store lookup failed: ") + e.what());
    return;
  }

  std::cout << "[PIPELINE] Ingesting " << source_file << " (" << doc_id.left(12) << ")" << std::endl;

  fin_model_list<fin_chunk> chunks;
  bool completed = false;
  try
  {
    std::unique_ptr<fin_doc_sio> source = page_source_factory(config);
    if (!source || !source->read(path))
    {
      fin_string message = source ? source->get_last_error() : fin_string("no page source");
      std::cerr << "[PDF] " << source_file << ": " << message << std::endl;
      known.release(doc_id);
      fail(message.empty() ? fin_string("cannot parse document") : message);
      return;
    }
    advance(result, fin_document_state::PARSED);

    completed = process_pages(*source, doc_id, source_file, chunks, result);
    if (completed)
    {
      // A document without pages still walks every stage
      advance(result, fin_document_state::SEGMENTED);
      advance(result, fin_document_state::EXTRACTED);
      advance(result, fin_document_state::CHUNKED);
    }
  }
  catch (const std::exception& e)
  {
    std::cerr << "[PIPELINE] " << source_file << ": " << e.what() << std::endl;
    known.release(doc_id);
    fail(e.what());
    return;
  }

  if (!completed)
  {
    std::cout << "[PIPELINE] Cancelled " << source_file << " after " << result.stats.pages_processed
              << " pages" << std::endl;
    known.release(doc_id);
    finish(fin_document_state::CANCELLED);
    return;
  }

  fin_model_list<fin_chunk> accepted;
  fin_model_list<fin_chunk> rejected;
  gate.filter(chunks, accepted, rejected);
  advance(result, fin_document_state::FILTERED);

  result.stats.chunks_rejected = static_cast<long long>(rejected.size());
  for (size_t i = 0; i < accepted.size(); ++i)
  {
    switch (accepted[i].get_kind())
    {
      case fin_chunk_kind::text: result.stats.text_chunks++; break;
      case fin_chunk_kind::table: result.stats.table_chunks++; break;
      case fin_chunk_kind::figure: result.stats.figure_chunks++; break;
      case fin_chunk_kind::unknown: break;
    }
  }

  if (cancelled)
  {
    std::cout << "[PIPELINE] Cancelled " << source_file << " before storing" << std::endl;
    known.release(doc_id);
    finish(fin_document_state::CANCELLED);
    return;
  }

  try
  {
    result.stats.chunks_stored = static_cast<long long>(store_with_retry(accepted, source_file));
  }
  catch (const fin_store_error& e)
  {
    std::cerr << "[DB] " << source_file << ": giving up: " << e.what() << std::endl;
    known.release(doc_id);
    fail(fin_string("store failed: ") + e.what());
    return;
  }

  known.commit(doc_id);
  advance(result, fin_document_state::STORED);
  result.stats.files_processed = 1;

  std::cout << "[PIPELINE] " << source_file << ": " << result.stats.pages_processed << " pages, "
            << accepted.size() << " chunks stored, " << rejected.size() << " rejected" << std::endl;
}

bool fin_ingest_pipeline::process_pages(fin_doc_sio& source, const fin_string& doc_id,
                                        const fin_string& source_file, fin_model_list<fin_chunk>& chunks,
                                        fin_ingest_result& result)
{
  fin_string current_section;
  int count = source.page_count();
  for (int index = 0; index < count; ++index)
  {
    if (cancelled)
    {
      return false;
    }

    fin_page_record page;
    if (!source.load_page(index, page))
    {
      std::cerr << "[PDF] " << source_file << ": skipping page " << (index + 1) << ": "
                << source.get_last_error() << std::endl;
      continue;
    }

    chunk_page(page, doc_id, source_file, current_section, chunks);
    advance(result, fin_document_state::SEGMENTED);
    advance(result, fin_document_state::EXTRACTED);
    advance(result, fin_document_state::CHUNKED);
    result.stats.pages_processed++;
  }
  return true;
}

void fin_ingest_pipeline::chunk_page(fin_page_record& page, const fin_string& doc_id,
                                     const fin_string& source_file, fin_string& current_section,
                                     fin_model_list<fin_chunk>& chunks) const
{
  long long page_number = page.page_number.value();

  fin_model_list<fin_layout_block> blocks;
  segmenter.segment(page, blocks);

  fin_model_list<fin_layout_block> text_blocks;
  for (size_t i = 0; i < blocks.size(); ++i)
  {
    const fin_layout_block& block = blocks[i];
    if (block.is(fin_block_role::heading) || block.is(fin_block_role::paragraph) ||
        block.is(fin_block_role::footnote))
    {
      text_blocks.push_back(block);
    }
  }
  if (!page.has_text_layer.value())
  {
    substitute_ocr_text(page, text_blocks);
  }
  fin_model_list<fin_layout_block> merged;
  fin_layout_segmenter::group_paragraphs(text_blocks, merged);

  fin_model_list<fin_extracted_table> tables;
  table_extractor.extract(page, blocks, tables);

  fin_model_list<fin_extracted_figure> figures;
  figure_extractor.extract(page, blocks, doc_id, figures);

  std::vector<fin_figure_signals> signals;
  signals.reserve(figures.size());
  for (size_t i = 0; i < figures.size(); ++i)
  {
    signals.push_back(analyse_figure(figures[i]));
  }

  current_section = chunker.chunk_text_blocks(merged, doc_id, source_file, page_number, current_section, chunks);
  chunker.chunk_tables(tables, doc_id, source_file, current_section, chunks);
  chunker.chunk_figures(figures, signals, doc_id, source_file, current_section, chunks);
  chunker.page_summary(page.raw_text.value(), doc_id, source_file, page_number, chunks);

  if (config.verbose)
  {
    std::cout << "[PIPELINE] " << source_file << " p." << page_number << ": " << blocks.size() << " blocks, "
              << tables.size() << " tables, " << figures.size() << " figures" << std::endl;
  }

  page.release_raster();
}

void fin_ingest_pipeline::substitute_ocr_text(const fin_page_record& page,
                                              fin_model_list<fin_layout_block>& text_blocks) const
{
  if (collaborators.ocr == nullptr || page.raster.empty())
  {
    return;
  }

  fin_string text;
  try
  {
    text = ocr_to_text(collaborators.ocr->recognize(page.raster, config.ocr_confidence_threshold)).trim();
  }
  catch (const std::exception& e)
  {
    std::cerr << "[OCR] Page " << page.page_number.value() << ": " << e.what() << std::endl;
    return;
  }
  if (text.empty())
  {
    return;
  }

  text_blocks.clear();
  text_blocks.add_element();
  fin_layout_block& block = text_blocks.back();
  block.set_bounds(0.0, 0.0, page.width.value(), page.height.value());
  block.set_role(fin_block_role::paragraph);
  block.text = text;
  block.page_number = page.page_number.value();
  block.confidence = 1.0;
}

fin_figure_signals fin_ingest_pipeline::analyse_figure(const fin_extracted_figure& figure) const
{
  fin_figure_signals signals;
  fin_string caption = figure.caption.value();
  cv::Mat image = figure.decode_image();

  if (collaborators.ocr != nullptr && !image.empty())
  {
    try
    {
      signals.ocr_text = ocr_to_text(collaborators.ocr->recognize(image, config.chart_ocr_confidence_threshold));
    }
    catch (const std::exception& e)
    {
      std::cerr << "[OCR] Figure " << figure.figure_index.value() << " on page " << figure.page_number.value()
                << ": " << e.what() << std::endl;
    }
  }

  if (collaborators.classifier != nullptr)
  {
    signals.type = collaborators.classifier->classify(caption, signals.ocr_text);
  }

  if (collaborators.describer != nullptr)
  {
    try
    {
      signals.description = collaborators.describer->describe(image, caption, signals.ocr_text).trim();
    }
    catch (const std::exception& e)
    {
      std::cerr << "[FIGURE] Describer failed on page " << figure.page_number.value() << ": " << e.what()
                << std::endl;
    }
  }

  if (collaborators.digitizer != nullptr && signals.type != fin_figure_type::unknown && !image.empty())
  {
    try
    {
      finv_map series;
      if (collaborators.digitizer->digitize(image, series))
      {
        signals.series = series;
      }
    }
    catch (const std::exception& e)
    {
      std::cerr << "[FIGURE] Digitizer failed on page " << figure.page_number.value() << ": " << e.what()
                << std::endl;
    }
  }

  return signals;
}

size_t fin_ingest_pipeline::store_with_retry(const fin_model_list<fin_chunk>& chunks, const fin_string& source_file)
{
  if (chunks.empty())
  {
    return 0;
  }

  long long delay_ms = config.store_retry_backoff_ms;
  for (long long attempt = 0;; ++attempt)
  {
    try
    {
      return store.upsert(chunks);
    }
    catch (const fin_store_error& e)
    {
      if (attempt >= config.store_retries)
      {
        throw;
      }
      std::cerr << "[DB] " << source_file << ": upsert failed (" << e.what() << "), retry " << (attempt + 1)
                << "/" << config.store_retries << " in " << delay_ms << " ms" << std::endl;
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
      delay_ms *= 2;
    }
  }
}

fin_ingest_stats fin_ingest_pipeline::ingest_folder(const fin_string& dir, bool force,
                                                    std::vector<fin_ingest_result>* results)
{
  auto started = std::chrono::steady_clock::now();
  fin_ingest_stats total;

  std::error_code ec;
  if (!std::filesystem::is_directory(dir.to_std_const(), ec))
  {
    std::cerr << "[PIPELINE] Folder does not exist: " << dir << std::endl;
    return total;
  }

  std::vector<fin_string> files;
  for (std::filesystem::directory_iterator it(dir.to_std_const(), ec), end; !ec && it != end; it.increment(ec))
  {
    if (it->is_regular_file() && it->path().extension() == ".pdf")
    {
      files.push_back(it->path().string());
    }
  }
  if (ec)
  {
    std::cerr << "[PIPELINE] Cannot list " << dir << ": " << ec.message() << std::endl;
  }
  std::sort(files.begin(), files.end());

  std::cout << "[PIPELINE] Found " << files.size() << " PDF files in " << dir << std::endl;

  std::vector<fin_ingest_result> collected(files.size());
  std::atomic<size_t> next(0);
  auto worker = [&]() {
    for (size_t i = next++; i < files.size(); i = next++)
    {
      collected[i] = ingest_file(files[i], force);
    }
  };

  size_t thread_count = std::min(static_cast<size_t>(config.workers), files.size());
  if (thread_count <= 1)
  {
    worker();
  }
  else
  {
    std::vector<std::thread> threads;
    for (size_t i = 0; i < thread_count; ++i)
    {
      threads.emplace_back(worker);
    }
    for (auto& thread : threads)
    {
      thread.join();
    }
  }

  for (const auto& result : collected)
  {
    total.add(result.stats);
  }
  total.elapsed_seconds = seconds_since(started);

  std::cout << "[PIPELINE] " << total.summary() << std::endl;

  if (results != nullptr)
  {
    *results = std::move(collected);
  }
  return total;
}
