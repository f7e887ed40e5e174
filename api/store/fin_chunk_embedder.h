#ifndef fin_CHUNK_EMBEDDER_H
#define fin_CHUNK_EMBEDDER_H

#include "../../aiprocesses/chat/fin_llm_api.h"
#include "../../aiprocesses/chunks/fin_chunk.h"
#include <vector>

/**
 * Embeds chunks through an embedding endpoint.
 *
 * Texts are the canonical chunk_to_text() form and are sent in batches of
 * batch_size. A failed batch fails the whole call; get_last_error() says
 * which batch.
 */
class fin_chunk_embedder {
public:
  explicit fin_chunk_embedder(fin::llm::i_llm_api& api, size_t batch_size = 64);

  bool embed_texts(const std::vector<fin_string>& texts, std::vector<finv_vector>& vectors);

  // vectors[j] belongs to chunks[indices[j]]
  bool embed_chunks(const fin_model_list<fin_chunk>& chunks, const std::vector<size_t>& indices,
                    std::vector<finv_vector>& vectors);

  bool embed_query(const fin_string& text, finv_vector& vector);

  fin_string get_last_error() const { return last_error; }

private:
  fin::llm::i_llm_api& api;
  size_t batch_size;
  fin_string last_error;
};

#endif // fin_CHUNK_EMBEDDER_H
