#include "fin_known_documents.h"

bool fin_known_documents::try_reserve(const fin_string& hash, bool include_known)
{
  std::lock_guard<std::mutex> lock(mutex);
  if (reserved.count(hash) > 0) {
    return false;
  }
  if (include_known && known.count(hash) > 0) {
    return false;
  }
  reserved.insert(hash);
  return true;
}

void fin_known_documents::commit(const fin_string& hash)
{
  std::lock_guard<std::mutex> lock(mutex);
  reserved.erase(hash);
  known.insert(hash);
}

void fin_known_documents::release(const fin_string& hash)
{
  std::lock_guard<std::mutex> lock(mutex);
  reserved.erase(hash);
}

bool fin_known_documents::contains(const fin_string& hash) const
{
  std::lock_guard<std::mutex> lock(mutex);
  return known.count(hash) > 0;
}

size_t fin_known_documents::size() const
{
  std::lock_guard<std::mutex> lock(mutex);
  return known.size();
}
