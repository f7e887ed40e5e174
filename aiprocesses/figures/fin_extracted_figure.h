#ifndef fin_EXTRACTED_FIGURE_H
#define fin_EXTRACTED_FIGURE_H

#include "../../documents/layout/fin_layout_bounds.h"
#include <opencv2/core.hpp>

// Cropped figure region with its linked caption
class fin_extracted_figure : public fin_layout_bounds
{
public:
  finp_int(page_number);
  finp_int(figure_index);    // 1-based within the page
  finp_string(image_bytes);  // PNG
  finp_string(image_path);   // relative to the storage directory
  finp_string(caption);

  // Decoded crop, empty when there are no image bytes
  cv::Mat decode_image() const;
};

#endif // fin_EXTRACTED_FIGURE_H
