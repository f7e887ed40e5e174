/**
 * fingest - financial report ingestion
 *
 * Usage:
 *   fingest ingest <file|folder> [--force] [--workers N]
 *   fingest query "<text>" [-k N] [--collection text|table|figure]
 *
 * Settings come from the environment and a .env file in the working
 * directory (see .env.example).
 */

#include "aiprocesses/pipeline/fin_ingest_pipeline.h"
#include "aiprocesses/vision/fin_tesseract_ocr.h"
#include "api/aimodels/fin_openai_api.h"
#include "api/db/pg_connection.h"
#include "api/store/fin_memory_chunk_store.h"
#include "api/store/fin_pg_chunk_store.h"
#include "utils/fin_env.h"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>

namespace {

std::atomic<fin_ingest_pipeline*> active_pipeline(nullptr);

void on_interrupt(int)
{
  fin_ingest_pipeline* pipeline = active_pipeline.load();
  if (pipeline != nullptr)
  {
    pipeline->cancel();
  }
}

void print_usage(const char* program_name)
{
  std::cout << "fingest - financial report ingestion\n" << std::endl;
  std::cout << "Usage:" << std::endl;
  std::cout << "  " << program_name << " ingest <file|folder> [--force] [--workers N]" << std::endl;
  std::cout << "  " << program_name << " query \"<text>\" [-k N] [--collection text|table|figure]\n" << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --force              Re-ingest documents that are already stored" << std::endl;
  std::cout << "  --workers N          Parallel documents for folder runs (default: INGEST_WORKERS or 1)" << std::endl;
  std::cout << "  -k N                 Number of hits (default: 5)" << std::endl;
  std::cout << "  --collection NAME    Restrict the query to text, table or figure chunks" << std::endl;
}

// Store and model clients of one invocation
struct fin_runtime
{
  fin_store_settings settings;
  std::unique_ptr<fin::llm::openai_api> api;
  std::unique_ptr<fin_chunk_embedder> embedder;
  std::unique_ptr<pg_connection> connection;
  std::unique_ptr<fin_chunk_store> store;

  bool open(const fin_ingest_config& config)
  {
    settings = fin_store_settings::from_env();
    if (!settings.openai_api_key.empty())
    {
      api.reset(new fin::llm::openai_api(settings.openai_api_key, settings.embedding_base_url,
                                         settings.embedding_model,
                                         static_cast<int>(settings.embedding_dimensions)));
      embedder.reset(new fin_chunk_embedder(*api, static_cast<size_t>(config.embedding_batch_size)));
    }

    if (settings.database_url.empty())
    {
      std::cout << "[DB] DATABASE_URL not set, using the in-memory store" << std::endl;
      store.reset(new fin_memory_chunk_store(embedder.get()));
      return true;
    }

    if (!embedder)
    {
      std::cerr << "[DB] OPENAI_API_KEY is required for the PostgreSQL store" << std::endl;
      return false;
    }

    connection.reset(new pg_connection());
    connection->set_verbose_sql(config.verbose);
    if (!connection->connect(settings.database_url))
    {
      std::cerr << "[DB] Connection failed: " << connection->get_last_error() << std::endl;
      return false;
    }

    std::unique_ptr<fin_pg_chunk_store> pg_store(
      new fin_pg_chunk_store(*connection, *embedder, static_cast<int>(settings.embedding_dimensions)));
    pg_store->ensure_schema();
    store = std::move(pg_store);
    return true;
  }
};

int run_ingest(const fin_string& target, bool force, long long workers)
{
  fin_ingest_config config = fin_ingest_config::from_env();
  if (workers > 0)
  {
    config.workers = workers;
  }
  config.validate();

  fin_runtime runtime;
  if (!runtime.open(config))
  {
    return 1;
  }

  fin_tesseract_ocr ocr(config.ocr_language, static_cast<int>(config.ocr_timeout_ms));
  fin_keyword_chart_classifier classifier;
  fin_fallback_chart_describer fallback_describer;
  fin_null_chart_digitizer digitizer;
  std::unique_ptr<fin_llm_chart_describer> llm_describer;

  fin_ingest_collaborators collaborators;
  if (ocr.initialize())
  {
    collaborators.ocr = &ocr;
  }
  else
  {
    std::cerr << "[OCR] Tesseract unavailable, continuing without OCR: " << ocr.get_last_error() << std::endl;
  }
  collaborators.classifier = &classifier;
  collaborators.digitizer = &digitizer;
  collaborators.describer = &fallback_describer;
  if (runtime.api && !runtime.settings.describer_model.empty())
  {
    llm_describer.reset(new fin_llm_chart_describer(*runtime.api, runtime.settings.describer_model));
    collaborators.describer = llm_describer.get();
  }

  fin_known_documents known;
  fin_ingest_pipeline pipeline(config, *runtime.store, known, collaborators);
  active_pipeline = &pipeline;
  std::signal(SIGINT, on_interrupt);

  std::error_code ec;
  int exit_code = 0;
  if (std::filesystem::is_directory(target.to_std_const(), ec))
  {
    fin_ingest_stats stats = pipeline.ingest_folder(target, force);
    exit_code = stats.files_failed > 0 ? 2 : 0;
  }
  else
  {
    fin_ingest_result result = pipeline.ingest_file(target, force);
    std::cout << "[PIPELINE] " << target << ": " << document_state_name(result.state);
    if (!result.error.empty())
    {
      std::cout << " (" << result.error << ")";
    }
    std::cout << std::endl;
    std::cout << "[PIPELINE] " << result.stats.summary() << std::endl;
    exit_code = result.state == fin_document_state::FAILED ? 2 : 0;
  }

  std::signal(SIGINT, SIG_DFL);
  active_pipeline = nullptr;
  return exit_code;
}

int run_query(const fin_string& text, int k, const fin_string& collection)
{
  if (!collection.empty() && !is_collection_name(collection))
  {
    std::cerr << "ERROR: Unknown collection: " << collection << std::endl;
    return 1;
  }

  fin_ingest_config config = fin_ingest_config::from_env();
  fin_runtime runtime;
  if (!runtime.open(config))
  {
    return 1;
  }
  if (runtime.settings.database_url.empty())
  {
    std::cerr << "[DB] Nothing to query: the in-memory store starts empty" << std::endl;
    return 1;
  }

  fin_model_list<fin_search_hit> hits;
  runtime.store->query(text, k, collection, hits);

  for (size_t i = 0; i < hits.size(); ++i)
  {
    const fin_search_hit& hit = hits[i];
    const finv_map& meta = hit.metadata.value();
    auto citation = meta.find("citation");

    std::cout << (i + 1) << ". [" << hit.collection.value() << "] distance " << hit.distance.value();
    if (citation != meta.end())
    {
      std::cout << "  " << citation->second.convert(fin_variant::string_state).string_value();
    }
    std::cout << "\n   " << hit.text.value().left(300) << std::endl;
  }
  if (hits.empty())
  {
    std::cout << "No results." << std::endl;
  }
  return 0;
}

} // namespace

int main(int argc, char* argv[])
{
  if (argc < 3)
  {
    print_usage(argv[0]);
    return 1;
  }

  load_env_file(".env");

  fin_string command = argv[1];
  fin_string target = argv[2];

  bool force = false;
  long long workers = 0;
  int k = 5;
  fin_string collection;

  for (int i = 3; i < argc; i++)
  {
    fin_string arg = argv[i];
    bool has_value = i + 1 < argc;

    if (arg == "--force")
    {
      force = true;
    }
    else if (arg == "--workers" && has_value)
    {
      workers = fin_string(argv[++i]).to_int(0);
    }
    else if (arg == "-k" && has_value)
    {
      k = static_cast<int>(fin_string(argv[++i]).to_int(5));
    }
    else if (arg == "--collection" && has_value)
    {
      collection = fin_string(argv[++i]).lower();
    }
    else
    {
      std::cerr << "ERROR: Unknown option: " << arg << std::endl;
      print_usage(argv[0]);
      return 1;
    }
  }

  try
  {
    if (command == "ingest")
    {
      return run_ingest(target, force, workers);
    }
    if (command == "query")
    {
      return run_query(target, k > 0 ? k : 5, collection);
    }
  }
  catch (const std::exception& e)
  {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  }

  std::cerr << "ERROR: Unknown command: " << command << std::endl;
  print_usage(argv[0]);
  return 1;
}
