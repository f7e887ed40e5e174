#ifndef fin_OCR_ENGINE_H
#define fin_OCR_ENGINE_H

#include "../../documents/layout/fin_layout_bounds.h"
#include <opencv2/core.hpp>
#include <vector>

struct fin_ocr_box {
  fin_string text;
  double confidence;  // 0.0-1.0
  int x0;
  int y0;
  int x1;
  int y1;
};

// Text recognition over a raster (full page or a cropped region)
class fin_ocr_engine {
public:
  virtual ~fin_ocr_engine() = default;

  // Boxes at or above the threshold, top-to-bottom then left-to-right
  virtual std::vector<fin_ocr_box> recognize(const cv::Mat& image, double confidence_threshold) = 0;
};

void sort_reading_order(std::vector<fin_ocr_box>& boxes);

// Space-joined box texts in the given order
fin_string ocr_to_text(const std::vector<fin_ocr_box>& boxes);

// Crop a region given in PDF points from a raster rendered at dpi.
// Edges are truncated to whole pixels and clamped to the raster; the
// result is empty when nothing is left.
cv::Mat crop_region(const cv::Mat& raster, const fin_layout_bounds& region, int dpi);

#endif // fin_OCR_ENGINE_H
