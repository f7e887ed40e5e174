#ifndef fin_PDF_SIO_H
#define fin_PDF_SIO_H

#include "../fin_doc_sio.h"
#include <filesystem>
#include <vector>
#include <opencv2/opencv.hpp>

namespace PoDoFo {
  class PdfMemDocument;
}

// PDF page source: PoDoFo for the text layer, images and vector paths,
// pdftoppm for the page rasters.
class fin_pdf_sio : public fin_doc_sio
{
private:
  PoDoFo::PdfMemDocument *m_pdf;
  std::vector<char> pdf_data_buffer;  // Stable buffer for LoadFromBuffer, PoDoFo reads it lazily
  std::filesystem::path temp_dir;     // Holds input.pdf for pdftoppm
  int dpi;
  int max_pages;
  double merge_gap;
  long long min_paths;

public:
  explicit fin_pdf_sio(int render_dpi = 100, int page_limit = 0);
  ~fin_pdf_sio();

  void set_drawing_clustering(double gap, long long paths);

  bool parse(fin_string &data) override;
  int page_count() const override;
  bool load_page(int index, fin_page_record& page) override;

  // Render one page (0-based) to a BGR raster
  bool render_page(int index, cv::Mat& output);

  void clear();
};

#endif // fin_PDF_SIO_H
