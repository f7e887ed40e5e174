#ifndef fin_PAGE_RECORD_H
#define fin_PAGE_RECORD_H

#include "fin_layout_span.h"
#include "fin_layout_image.h"
#include "fin_layout_drawing.h"
#include <opencv2/opencv.hpp>

// Everything the pipeline knows about one page
class fin_page_record : public fin_model
{
public:
  finp_int(page_number);
  finp_double(width);
  finp_double(height);
  finp_string(raw_text);
  finp_bool(has_text_layer);

  finp_model_list(spans, fin_layout_span);
  finp_model_list(images, fin_layout_image);
  finp_model_list(paths, fin_layout_path);
  finp_model_list(drawings, fin_layout_drawing);

  // Rendered page (BGR). Empty when rendering failed.
  cv::Mat raster;

  double area() const;

  // Recompute raw_text and has_text_layer from the spans
  void update_text_layer();

  void release_raster();
};

#endif // fin_PAGE_RECORD_H
