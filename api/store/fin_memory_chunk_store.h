#ifndef fin_MEMORY_CHUNK_STORE_H
#define fin_MEMORY_CHUNK_STORE_H

#include "fin_chunk_store.h"
#include "fin_chunk_embedder.h"
#include <map>
#include <mutex>

// Process-local store for tests and dry runs. Ranks by cosine distance
// over embeddings when an embedder is given, otherwise over word counts.
class fin_memory_chunk_store : public fin_chunk_store
{
public:
  explicit fin_memory_chunk_store(fin_chunk_embedder* embedder = nullptr);

  size_t upsert(const fin_model_list<fin_chunk>& chunks) override;
  void query(const fin_string& text, int k, const fin_string& collection,
             fin_model_list<fin_search_hit>& hits) override;
  bool exists_by_doc_id(const fin_string& doc_id) override;

  size_t size() const;
  size_t collection_size(const fin_string& collection) const;
  bool contains(const fin_string& content_hash) const;

  // Number of upsert() calls that reached the store
  size_t upsert_calls() const;

private:
  struct record {
    fin_string collection;
    fin_string doc_id;
    fin_string text;
    finv_map metadata;
    finv_vector embedding;
  };

  fin_chunk_embedder* embedder;
  std::map<fin_string, record> records;
  size_t upserts;
  mutable std::mutex mutex;
};

// 1 - cosine similarity; 1.0 when either vector is zero or sizes differ
double cosine_distance(const finv_vector& a, const finv_vector& b);

#endif // fin_MEMORY_CHUNK_STORE_H
