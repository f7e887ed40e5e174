#ifndef fin_CHUNK_STORE_H
#define fin_CHUNK_STORE_H

#include "../../aiprocesses/chunks/fin_chunk.h"
#include "../../utils/fin_exceptions.h"
#include <vector>

// One ranked query result; filled from a result row via read_row()
class fin_search_hit : public fin_model
{
public:
  finp_string(id, finv_map{{"column", "content_hash"}});
  finp_string(collection, finv_map{{"column", "collection"}});
  finp_string(text, finv_map{{"column", "text"}});
  finp_double(distance, finv_map{{"column", "distance"}});
  finp_map(metadata);
};

// Collection a chunk is stored in: "text" (text and page summaries),
// "table" or "figure"
fin_string chunk_collection(const fin_chunk& chunk);

// True for "text", "table" and "figure"
bool is_collection_name(const fin_string& name);

// Positions of the chunks that survive in-batch deduplication: for every
// content_hash the last occurrence, ordered by first appearance
std::vector<size_t> unique_chunk_indices(const fin_model_list<fin_chunk>& chunks);

// Vector store for chunks. Ids are content hashes, writes replace on
// conflict. Failures throw fin_store_error.
class fin_chunk_store
{
public:
  virtual ~fin_chunk_store() = default;

  // Returns the number of distinct ids written
  virtual size_t upsert(const fin_model_list<fin_chunk>& chunks) = 0;

  // Up to k hits ordered by ascending distance. An empty collection
  // searches all of them.
  virtual void query(const fin_string& text, int k, const fin_string& collection,
                     fin_model_list<fin_search_hit>& hits) = 0;

  virtual bool exists_by_doc_id(const fin_string& doc_id) = 0;
};

#endif // fin_CHUNK_STORE_H
