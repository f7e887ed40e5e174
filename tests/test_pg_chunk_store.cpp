#include <catch2/catch_all.hpp>
#include "../api/aimodels/fin_openai_api.h"
#include "../api/db/pg_connection.h"
#include "../api/db/db_query.h"
#include "../api/store/fin_pg_chunk_store.h"
#include "../aiprocesses/pipeline/fin_ingest_config.h"
#include "../utils/fin_hash.h"

namespace {

void add_text(fin_model_list<fin_chunk>& chunks, const fin_string& doc_id, const fin_string& text)
{
  chunks.add_element();
  fin_chunk& chunk = chunks.back();
  chunk.set_kind(fin_chunk_kind::text);
  chunk.doc_id = doc_id;
  chunk.source_file = "integration.pdf";
  chunk.page = 1LL;
  chunk.block_type = "text";
  chunk.text = text;
  chunk.content_hash = sha256_hex(doc_id + text);
  chunk.created_at = utc_timestamp();
}

void delete_document(pg_connection& connection, const fin_string& doc_id)
{
  auto statement = connection.create_query();
  statement->prepare(fin_string("DELETE FROM ") + fin_pg_chunk_store::table_name() + " WHERE doc_id = :doc_id");
  statement->bind("doc_id", doc_id);
  if (!statement->execute()) {
    std::cerr << "[DB] cleanup failed: " << statement->get_last_error() << std::endl;
  }
}

} // namespace

SCENARIO("Chunks round-trip through PostgreSQL with pgvector", "[integration][db]") {
  fin_store_settings settings = fin_store_settings::from_env();
  if (settings.database_url.empty() || settings.openai_api_key.empty()) {
    SKIP("DATABASE_URL and OPENAI_API_KEY are required");
  }

  GIVEN("A connected store with its schema") {
    pg_connection connection;
    REQUIRE(connection.connect(settings.database_url));

    fin::llm::openai_api api(settings.openai_api_key, settings.embedding_base_url, settings.embedding_model,
                             static_cast<int>(settings.embedding_dimensions));
    fin_chunk_embedder embedder(api, 16);
    fin_pg_chunk_store store(connection, embedder, static_cast<int>(settings.embedding_dimensions));
    store.ensure_schema();

    fin_string doc_id = sha256_hex("fingest integration " + utc_timestamp());
    REQUIRE_FALSE(store.exists_by_doc_id(doc_id));

    WHEN("A batch with a duplicate is written") {
      fin_model_list<fin_chunk> chunks;
      add_text(chunks, doc_id, "Operating margin improved to 14.2 percent on lower energy costs.");
      add_text(chunks, doc_id, "The board proposes a dividend of 1.10 euros per share for 2023.");
      add_text(chunks, doc_id, "Operating margin improved to 14.2 percent on lower energy costs.");

      size_t written = store.upsert(chunks);

      THEN("Distinct chunks are stored once and can be found") {
        REQUIRE(written == 2);
        REQUIRE(store.exists_by_doc_id(doc_id));

        fin_model_list<fin_search_hit> hits;
        store.query("What dividend is proposed per share?", 2, "text", hits);
        REQUIRE(hits.size() >= 1);
        REQUIRE(hits[0].collection == "text");
        REQUIRE(hits[0].text.value().contains("dividend"));
      }

      THEN("Writing the batch again replaces the rows") {
        REQUIRE(store.upsert(chunks) == 2);
      }

      delete_document(connection, doc_id);
    }

    WHEN("A collection without rows is queried") {
      fin_model_list<fin_search_hit> hits;
      store.query("revenue", 3, "slides", hits);

      THEN("Nothing is found") {
        REQUIRE(hits.empty());
      }
    }
  }
}
