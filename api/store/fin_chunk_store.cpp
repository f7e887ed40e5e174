#include "fin_chunk_store.h"
#include <map>

fin_string chunk_collection(const fin_chunk& chunk)
{
  switch (chunk.get_kind()) {
    case fin_chunk_kind::table: return "table";
    case fin_chunk_kind::figure: return "figure";
    case fin_chunk_kind::text:
    case fin_chunk_kind::unknown:
      break;
  }
  return "text";
}

bool is_collection_name(const fin_string& name)
{
  return name == "text" || name == "table" || name == "figure";
}

std::vector<size_t> unique_chunk_indices(const fin_model_list<fin_chunk>& chunks)
{
  std::vector<fin_string> order;
  std::map<fin_string, size_t> last;
  for (size_t i = 0; i < chunks.size(); ++i) {
    const fin_string& id = chunks.at(i).content_hash.value();
    if (last.find(id) == last.end()) {
      order.push_back(id);
    }
    last[id] = i;
  }

  std::vector<size_t> indices;
  indices.reserve(order.size());
  for (const auto& id : order) {
    indices.push_back(last[id]);
  }
  return indices;
}
