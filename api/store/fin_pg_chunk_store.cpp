#include "fin_pg_chunk_store.h"
#include "../db/db_exceptions.h"
#include "../db/db_query.h"
#include "../json/fin_json.h"
#include <iostream>

fin_pg_chunk_store::fin_pg_chunk_store(db_connection& connection, fin_chunk_embedder& embedder, int dimensions)
  : connection(connection), embedder(embedder), dimensions(dimensions)
{
  if (dimensions <= 0) {
    throw std::invalid_argument("embedding dimensions must be positive");
  }
}

void fin_pg_chunk_store::execute(db_query& query, const char* action)
{
  if (!query.execute()) {
    throw fin_store_error(fin_string(action) + " failed: " + query.get_last_error());
  }
}

void fin_pg_chunk_store::ensure_schema()
{
  std::lock_guard<std::mutex> lock(mutex);
  try {
    auto statement = connection.create_query();

    fin_string sql = "CREATE EXTENSION IF NOT EXISTS vector;\n";
    sql += fin_string("CREATE TABLE IF NOT EXISTS ") + table_name() + " (\n"
           "  content_hash TEXT PRIMARY KEY,\n"
           "  doc_id TEXT NOT NULL,\n"
           "  collection TEXT NOT NULL,\n"
           "  block_type TEXT NOT NULL,\n"
           "  page INTEGER NOT NULL,\n"
           "  text TEXT NOT NULL,\n"
           "  metadata JSONB NOT NULL,\n"
           "  embedding vector(" + fin_string(dimensions) + ") NOT NULL,\n"
           "  created_at TIMESTAMPTZ NOT NULL DEFAULT now()\n"
           ");\n";
    sql += fin_string("CREATE INDEX IF NOT EXISTS ") + table_name() + "_doc_id_idx ON " + table_name() + " (doc_id);\n";
    sql += fin_string("CREATE INDEX IF NOT EXISTS ") + table_name() + "_collection_idx ON " + table_name() + " (collection);";

    statement->prepare(sql);
    execute(*statement, "Schema setup");
    std::cout << "[DB] Table " << table_name() << " ready (vector(" << dimensions << "))" << std::endl;
  } catch (const db_exception& e) {
    throw fin_store_error(fin_string("Schema setup failed: ") + e.what());
  }
}

size_t fin_pg_chunk_store::upsert(const fin_model_list<fin_chunk>& chunks)
{
  std::vector<size_t> indices = unique_chunk_indices(chunks);
  if (indices.empty()) {
    return 0;
  }
  if (indices.size() < chunks.size()) {
    std::cout << "[DB] Dropped " << chunks.size() - indices.size() << " duplicate chunk(s) in batch" << std::endl;
  }

  std::vector<finv_vector> embeddings;
  if (!embedder.embed_chunks(chunks, indices, embeddings)) {
    throw fin_store_error(embedder.get_last_error());
  }

  std::lock_guard<std::mutex> lock(mutex);
  try {
    auto statement = connection.create_query();

    fin_string sql = fin_string("INSERT INTO ") + table_name() +
                     " (content_hash, doc_id, collection, block_type, page, text, metadata, embedding) VALUES ";
    std::vector<fin_string> rows;
    for (size_t j = 0; j < indices.size(); ++j) {
      fin_string n(j);
      rows.push_back("(:h" + n + ", :d" + n + ", :c" + n + ", :b" + n + ", :p" + n + ", :t" + n +
                     ", :m" + n + "::jsonb, :e" + n + "::vector)");
    }
    sql += fin_string(", ").join(rows);
    sql += " ON CONFLICT (content_hash) DO UPDATE SET"
           " doc_id = EXCLUDED.doc_id, collection = EXCLUDED.collection,"
           " block_type = EXCLUDED.block_type, page = EXCLUDED.page, text = EXCLUDED.text,"
           " metadata = EXCLUDED.metadata, embedding = EXCLUDED.embedding";
    statement->prepare(sql);

    for (size_t j = 0; j < indices.size(); ++j) {
      const fin_chunk& chunk = chunks.at(indices[j]);
      fin_string n(j);
      finv_map metadata = chunk_to_metadata(chunk);
      fin_json metadata_json(&metadata);

      statement->bind("h" + n, chunk.content_hash.value());
      statement->bind("d" + n, chunk.doc_id.value());
      statement->bind("c" + n, chunk_collection(chunk));
      statement->bind("b" + n, chunk.block_type.value());
      statement->bind("p" + n, chunk.page.value());
      statement->bind("t" + n, chunk_to_text(chunk));
      statement->bind("m" + n, metadata_json.create());
      statement->bind("e" + n, embeddings[j]);
    }

    execute(*statement, "Upsert");
  } catch (const db_exception& e) {
    throw fin_store_error(fin_string("Upsert failed: ") + e.what());
  }
  return indices.size();
}

void fin_pg_chunk_store::query(const fin_string& text, int k, const fin_string& collection,
                               fin_model_list<fin_search_hit>& hits)
{
  hits.clear();
  if (k <= 0) {
    return;
  }

  finv_vector query_embedding;
  if (!embedder.embed_query(text, query_embedding)) {
    throw fin_store_error(embedder.get_last_error());
  }

  std::lock_guard<std::mutex> lock(mutex);
  try {
    auto select = connection.create_query();

    fin_string sql = fin_string("SELECT content_hash, collection, text, metadata::text AS metadata, "
                                "embedding <=> :query::vector AS distance FROM ") + table_name();
    if (!collection.empty()) {
      sql += " WHERE collection = :collection";
    }
    sql += " ORDER BY distance LIMIT :k";
    select->prepare(sql);
    select->bind("query", query_embedding);
    select->bind("collection", collection);
    select->bind("k", k);
    execute(*select, "Query");

    while (select->next()) {
      finv_map row = select->get_row();
      hits.read_row(row);

      auto metadata = row.find("metadata");
      if (metadata != row.end() && metadata->second.is_string()) {
        fin_json parser(&hits.back().metadata.value());
        if (!parser.parse(metadata->second.string_value())) {
          std::cerr << "[DB] Unreadable metadata for " << hits.back().id.value() << ": "
                    << parser.get_last_error() << std::endl;
        }
      }
    }
  } catch (const db_exception& e) {
    throw fin_store_error(fin_string("Query failed: ") + e.what());
  }
}

bool fin_pg_chunk_store::exists_by_doc_id(const fin_string& doc_id)
{
  std::lock_guard<std::mutex> lock(mutex);
  try {
    auto statement = connection.create_query();
    statement->prepare(fin_string("SELECT 1 AS found FROM ") + table_name() + " WHERE doc_id = :doc_id LIMIT 1");
    statement->bind("doc_id", doc_id);
    execute(*statement, "Lookup");
    return statement->next();
  } catch (const db_exception& e) {
    throw fin_store_error(fin_string("Lookup failed: ") + e.what());
  }
}
