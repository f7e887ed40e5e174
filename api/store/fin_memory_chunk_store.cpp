#include "fin_memory_chunk_store.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

namespace {

  // Lower-cased alphanumeric words
  std::vector<fin_string> tokenize(const fin_string& text)
  {
    std::vector<fin_string> words;
    fin_string current;
    for (char c : text.to_std_const()) {
      if (std::isalnum(static_cast<unsigned char>(c))) {
        current += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      } else if (!current.empty()) {
        words.push_back(current);
        current.clear();
      }
    }
    if (!current.empty()) {
      words.push_back(current);
    }
    return words;
  }

} // namespace

double cosine_distance(const finv_vector& a, const finv_vector& b)
{
  if (a.size() != b.size() || a.empty()) {
    return 1.0;
  }
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    double x = a[i].convert(fin_variant::double_state).double_value();
    double y = b[i].convert(fin_variant::double_state).double_value();
    dot += x * y;
    norm_a += x * x;
    norm_b += y * y;
  }
  if (norm_a == 0.0 || norm_b == 0.0) {
    return 1.0;
  }
  return 1.0 - dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

fin_memory_chunk_store::fin_memory_chunk_store(fin_chunk_embedder* embedder)
  : embedder(embedder), upserts(0)
{
}

size_t fin_memory_chunk_store::upsert(const fin_model_list<fin_chunk>& chunks)
{
  std::vector<size_t> indices = unique_chunk_indices(chunks);
  if (indices.size() < chunks.size()) {
    std::cout << "[DB] Dropped " << chunks.size() - indices.size() << " duplicate chunk(s) in batch" << std::endl;
  }

  std::vector<finv_vector> embeddings;
  if (embedder != nullptr && !embedder->embed_chunks(chunks, indices, embeddings)) {
    throw fin_store_error(embedder->get_last_error());
  }

  std::lock_guard<std::mutex> lock(mutex);
  upserts++;
  for (size_t j = 0; j < indices.size(); ++j) {
    const fin_chunk& chunk = chunks.at(indices[j]);
    record& entry = records[chunk.content_hash.value()];
    entry.collection = chunk_collection(chunk);
    entry.doc_id = chunk.doc_id.value();
    entry.text = chunk_to_text(chunk);
    entry.metadata = chunk_to_metadata(chunk);
    entry.embedding = embedder != nullptr ? embeddings[j] : finv_vector();
  }
  return indices.size();
}

void fin_memory_chunk_store::query(const fin_string& text, int k, const fin_string& collection,
                                   fin_model_list<fin_search_hit>& hits)
{
  hits.clear();
  if (k <= 0) {
    return;
  }

  finv_vector query_embedding;
  if (embedder != nullptr && !embedder->embed_query(text, query_embedding)) {
    throw fin_store_error(embedder->get_last_error());
  }

  std::lock_guard<std::mutex> lock(mutex);

  // Shared vocabulary for word-count ranking
  std::map<fin_string, size_t> vocabulary;
  if (embedder == nullptr) {
    for (const auto& word : tokenize(text)) {
      vocabulary.emplace(word, vocabulary.size());
    }
  }
  auto word_counts = [&vocabulary](const fin_string& source) {
    finv_vector counts(vocabulary.size(), fin_variant(0.0));
    for (const auto& word : tokenize(source)) {
      auto it = vocabulary.find(word);
      if (it != vocabulary.end()) {
        counts[it->second] = counts[it->second].double_value() + 1.0;
      }
    }
    return counts;
  };
  if (embedder == nullptr) {
    query_embedding = word_counts(text);
  }

  std::vector<std::pair<double, const std::pair<const fin_string, record>*>> ranked;
  for (const auto& entry : records) {
    if (!collection.empty() && entry.second.collection != collection) {
      continue;
    }
    double distance = embedder != nullptr ? cosine_distance(query_embedding, entry.second.embedding)
                                          : cosine_distance(query_embedding, word_counts(entry.second.text));
    ranked.emplace_back(distance, &entry);
  }

  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const auto& a, const auto& b) { return a.first < b.first; });

  for (size_t i = 0; i < ranked.size() && i < static_cast<size_t>(k); ++i) {
    hits.add_element();
    fin_search_hit& hit = hits.back();
    hit.id = ranked[i].second->first;
    hit.collection = ranked[i].second->second.collection;
    hit.text = ranked[i].second->second.text;
    hit.metadata = ranked[i].second->second.metadata;
    hit.distance = ranked[i].first;
  }
}

bool fin_memory_chunk_store::exists_by_doc_id(const fin_string& doc_id)
{
  std::lock_guard<std::mutex> lock(mutex);
  for (const auto& entry : records) {
    if (entry.second.doc_id == doc_id) {
      return true;
    }
  }
  return false;
}

size_t fin_memory_chunk_store::size() const
{
  std::lock_guard<std::mutex> lock(mutex);
  return records.size();
}

size_t fin_memory_chunk_store::collection_size(const fin_string& collection) const
{
  std::lock_guard<std::mutex> lock(mutex);
  size_t count = 0;
  for (const auto& entry : records) {
    if (entry.second.collection == collection) {
      count++;
    }
  }
  return count;
}

bool fin_memory_chunk_store::contains(const fin_string& content_hash) const
{
  std::lock_guard<std::mutex> lock(mutex);
  return records.find(content_hash) != records.end();
}

size_t fin_memory_chunk_store::upsert_calls() const
{
  std::lock_guard<std::mutex> lock(mutex);
  return upserts;
}
