#ifndef fin_KNOWN_DOCUMENTS_H
#define fin_KNOWN_DOCUMENTS_H

#include "../../utils/fin_string.h"
#include <mutex>
#include <set>

// Content hashes of documents ingested during this process. A worker
// reserves a hash before processing and commits or releases it afterwards,
// so two workers never ingest the same content at once.
class fin_known_documents
{
public:
  // false when the hash is being processed, or is already known and
  // include_known is set
  bool try_reserve(const fin_string& hash, bool include_known = true);

  // Reservation becomes a known document
  void commit(const fin_string& hash);

  // Drop the reservation without marking the document known
  void release(const fin_string& hash);

  bool contains(const fin_string& hash) const;
  size_t size() const;

private:
  std::set<fin_string> known;
  std::set<fin_string> reserved;
  mutable std::mutex mutex;
};

#endif // fin_KNOWN_DOCUMENTS_H
