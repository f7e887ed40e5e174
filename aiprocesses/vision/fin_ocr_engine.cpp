#include "fin_ocr_engine.h"
#include "../../documents/pdf/fin_pdf_coords.h"
#include <algorithm>

void sort_reading_order(std::vector<fin_ocr_box>& boxes)
{
  std::stable_sort(boxes.begin(), boxes.end(), [](const fin_ocr_box& a, const fin_ocr_box& b) {
    if (a.y0 != b.y0) {
      return a.y0 < b.y0;
    }
    return a.x0 < b.x0;
  });
}

fin_string ocr_to_text(const std::vector<fin_ocr_box>& boxes)
{
  std::vector<fin_string> parts;
  parts.reserve(boxes.size());
  for (const auto& box : boxes) {
    parts.push_back(box.text);
  }
  return fin_string(" ").join(parts);
}

cv::Mat crop_region(const cv::Mat& raster, const fin_layout_bounds& region, int dpi)
{
  if (raster.empty() || dpi <= 0) {
    return cv::Mat();
  }
  int x0 = std::max(0, static_cast<int>(fin_coords::pdf_to_png_coord(region.get_left(), dpi)));
  int y0 = std::max(0, static_cast<int>(fin_coords::pdf_to_png_coord(region.get_top(), dpi)));
  int x1 = std::min(raster.cols, static_cast<int>(fin_coords::pdf_to_png_coord(region.get_right(), dpi)));
  int y1 = std::min(raster.rows, static_cast<int>(fin_coords::pdf_to_png_coord(region.get_bottom(), dpi)));
  if (x1 <= x0 || y1 <= y0) {
    return cv::Mat();
  }
  return raster(cv::Rect(x0, y0, x1 - x0, y1 - y0)).clone();
}
