#include "fin_chunk_embedder.h"
#include <algorithm>

fin_chunk_embedder::fin_chunk_embedder(fin::llm::i_llm_api& api, size_t batch_size)
  : api(api), batch_size(batch_size == 0 ? 1 : batch_size)
{
}

bool fin_chunk_embedder::embed_texts(const std::vector<fin_string>& texts, std::vector<finv_vector>& vectors)
{
  vectors.clear();
  vectors.reserve(texts.size());
  last_error = "";

  for (size_t start = 0; start < texts.size(); start += batch_size) {
    size_t end = std::min(texts.size(), start + batch_size);
    std::vector<fin_string> batch(texts.begin() + start, texts.begin() + end);

    std::vector<finv_vector> batch_vectors;
    if (!api.embeddings(batch, batch_vectors) || batch_vectors.size() != batch.size()) {
      last_error = "Embedding batch " + fin_string(start) + "-" + fin_string(end - 1) + " failed";
      vectors.clear();
      return false;
    }
    for (auto& vector : batch_vectors) {
      vectors.push_back(std::move(vector));
    }
  }
  return true;
}

bool fin_chunk_embedder::embed_chunks(const fin_model_list<fin_chunk>& chunks, const std::vector<size_t>& indices,
                                      std::vector<finv_vector>& vectors)
{
  std::vector<fin_string> texts;
  texts.reserve(indices.size());
  for (size_t index : indices) {
    texts.push_back(chunk_to_text(chunks.at(index)));
  }
  return embed_texts(texts, vectors);
}

bool fin_chunk_embedder::embed_query(const fin_string& text, finv_vector& vector)
{
  last_error = "";
  if (!api.embedding(text, vector)) {
    last_error = "Query embedding failed";
    return false;
  }
  return true;
}
