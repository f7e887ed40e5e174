#ifndef fin_FIGURE_EXTRACTOR_H
#define fin_FIGURE_EXTRACTOR_H

#include "fin_extracted_figure.h"
#include "../layout/fin_layout_block.h"
#include "../../documents/layout/fin_page_record.h"

// Figure candidates from layout blocks, embedded images and vector drawing
// clusters, deduplicated by overlap, cropped from the page raster and saved
// under the resources directory.
class fin_figure_extractor
{
public:
  fin_figure_extractor(int dpi = 100, double min_area_ratio = 0.02, double iou_threshold = 0.3,
                       const fin_string& resources_dir = "storage/resources",
                       const fin_string& storage_dir = "storage");

  void extract(const fin_page_record& page, const fin_model_list<fin_layout_block>& blocks,
               const fin_string& doc_id, fin_model_list<fin_extracted_figure>& figures) const;

  // Accepted candidate boxes in order: layout figures, images, drawings
  void collect_candidates(const fin_page_record& page, const fin_model_list<fin_layout_block>& blocks,
                          fin_model_list<fin_layout_bounds>& candidates) const;

  // Text of the caption block whose center is closest to the figure's,
  // empty without caption blocks
  static fin_string nearest_caption(const fin_layout_bounds& figure, const fin_model_list<fin_layout_block>& blocks);

private:
  int dpi;
  double min_area_ratio;
  double iou_threshold;
  fin_string resources_dir;
  fin_string storage_dir;

  bool is_covered(const fin_layout_bounds& box, const fin_model_list<fin_layout_bounds>& candidates) const;
};

#endif // fin_FIGURE_EXTRACTOR_H
