#ifndef fin_DOC_SIO_H
#define fin_DOC_SIO_H

#include "../utils/fin_string.h"
#include "layout/fin_page_record.h"

// Format-agnostic page source: read a document, then pull page records
// one at a time in page order.
class fin_doc_sio
{
public:
  virtual ~fin_doc_sio() = default;

  virtual bool read(fin_string filename);
  virtual bool parse(fin_string &data) = 0;

  virtual int page_count() const = 0;

  // Fill page with the record of the page at index (0-based)
  virtual bool load_page(int index, fin_page_record& page) = 0;

  fin_string get_last_error() const { return last_error; }

protected:
  fin_string last_error;
};

#endif // fin_DOC_SIO_H
