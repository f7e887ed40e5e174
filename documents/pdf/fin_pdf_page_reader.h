#ifndef fin_PDF_PAGE_READER_H
#define fin_PDF_PAGE_READER_H

#include "../layout/fin_page_record.h"
#include <string>
#include <vector>

#include <podofo/podofo.h>

// Walks one page's content stream and collects text spans, image
// placements and painted path boxes in top-left origin point space.
class fin_pdf_page_reader {
public:
  fin_pdf_page_reader();

  bool read_page(const PoDoFo::PdfPage& page, fin_page_record& record);

  fin_string get_last_error() const { return last_error; }

private:
  struct graphics_state;
  struct path_state;
  class page_context;

  // Join consecutive strings of one style on one line into text runs
  static void merge_runs(fin_model_list<fin_layout_span>& spans);

  static void read(const PoDoFo::PdfVariantStack& stack, double &tx, double &ty);
  static void read(const PoDoFo::PdfVariantStack& stack, double &a, double &b, double &c, double &d, double &e, double &f);

  fin_string last_error;
};

#endif // fin_PDF_PAGE_READER_H
