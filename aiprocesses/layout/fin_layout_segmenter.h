#ifndef fin_LAYOUT_SEGMENTER_H
#define fin_LAYOUT_SEGMENTER_H

#include "fin_layout_block.h"
#include "../../documents/layout/fin_page_record.h"

// Optional model-backed detector for table and figure regions
class fin_region_detector
{
public:
  virtual ~fin_region_detector() = default;

  // Append detected regions (role, bounds, confidence) to regions
  virtual void detect(const fin_page_record& page, fin_model_list<fin_layout_block>& regions) = 0;
};

// Heuristic page segmentation from span position and typography
class fin_layout_segmenter
{
public:
  explicit fin_layout_segmenter(double image_min_area_ratio = 0.01);

  void set_region_detector(fin_region_detector* detector);

  // Classify spans, then append image regions and detected regions
  void segment(const fin_page_record& page, fin_model_list<fin_layout_block>& blocks) const;

  fin_block_role classify(const fin_layout_span& span, double median_font_size, double page_height) const;

  // Upper median of the positive span font sizes, 12.0 without any
  static double median_font_size(const fin_page_record& page);

  // Merge each run of consecutive paragraph blocks into one block
  static void group_paragraphs(const fin_model_list<fin_layout_block>& blocks,
                               fin_model_list<fin_layout_block>& merged);

private:
  double image_min_area_ratio;
  fin_region_detector* region_detector;
};

#endif // fin_LAYOUT_SEGMENTER_H
