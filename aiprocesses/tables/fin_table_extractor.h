#ifndef fin_TABLE_EXTRACTOR_H
#define fin_TABLE_EXTRACTOR_H

#include "fin_extracted_table.h"
#include "../layout/fin_layout_block.h"
#include "../vision/fin_ocr_engine.h"
#include "../../documents/layout/fin_page_record.h"

// Tables from ruled lines in the vector layer, with OCR over segmenter
// table regions as fallback.
class fin_table_extractor
{
public:
  fin_table_extractor(long long min_rows = 2, long long min_cols = 2, int dpi = 100,
                      double ocr_confidence_threshold = 0.40);

  void set_ocr_engine(fin_ocr_engine* engine);

  // Primary method first; OCR fallback only when it found nothing
  void extract(const fin_page_record& page, const fin_model_list<fin_layout_block>& blocks,
               fin_model_list<fin_extracted_table>& tables) const;

  // Ruled-line grids with text spans assigned to cells
  void extract_ruled(const fin_page_record& page, fin_model_list<fin_extracted_table>& tables) const;

  // OCR one region of the raster; false when no acceptable table results
  bool extract_ocr(const cv::Mat& raster, const fin_layout_bounds& region, long long page_number,
                   fin_extracted_table& table) const;

  // Group OCR boxes into rows by vertical center. A box joins the first
  // row whose key is within tolerance pixels.
  static fin_table_rows cluster_rows(const std::vector<fin_ocr_box>& boxes, int tolerance = 12);

  bool meets_minimums(const fin_table_rows& rows) const;

private:
  long long min_rows;
  long long min_cols;
  int dpi;
  double ocr_confidence_threshold;
  fin_ocr_engine* ocr;
};

#endif // fin_TABLE_EXTRACTOR_H
