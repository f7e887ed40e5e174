#ifndef fin_PG_CHUNK_STORE_H
#define fin_PG_CHUNK_STORE_H

#include "fin_chunk_store.h"
#include "fin_chunk_embedder.h"
#include "../db/db_connection.h"
#include <mutex>

/**
 * PostgreSQL + pgvector chunk store.
 *
 * Table fingest_chunks, keyed by content_hash, with an embedding column of
 * the configured dimension compared by cosine distance (<=>). A batch is
 * written as one INSERT ... ON CONFLICT statement, so it lands completely
 * or not at all. Calls are serialized; the connection is not owned.
 */
class fin_pg_chunk_store : public fin_chunk_store
{
public:
  fin_pg_chunk_store(db_connection& connection, fin_chunk_embedder& embedder, int dimensions = 1536);

  // Creates the extension, table and index when missing
  void ensure_schema();

  size_t upsert(const fin_model_list<fin_chunk>& chunks) override;
  void query(const fin_string& text, int k, const fin_string& collection,
             fin_model_list<fin_search_hit>& hits) override;
  bool exists_by_doc_id(const fin_string& doc_id) override;

  static const char* table_name() { return "fingest_chunks"; }

private:
  db_connection& connection;
  fin_chunk_embedder& embedder;
  int dimensions;
  std::mutex mutex;

  void execute(db_query& query, const char* action);
};

#endif // fin_PG_CHUNK_STORE_H
