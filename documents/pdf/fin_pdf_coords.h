#ifndef fin_PDF_COORDS_H
#define fin_PDF_COORDS_H
#include <stdexcept>

namespace fin_coords {
  /**
   * @brief Converts a PDF coordinate (points) into a raster pixel coordinate.
   * @param pdf_coord Coordinate in PDF points (1/72 inch).
   * @param dpi Resolution the page was rendered with.
   */
  inline double pdf_to_png_coord(double pdf_coord, double dpi) {
    if (dpi <= 0) {
      throw std::invalid_argument("dpi must be positive");
    }
    return (pdf_coord * dpi) / 72.0;
  }

  /**
   * @brief Converts a raster pixel coordinate back into PDF points.
   */
  inline double png_to_pdf_coord(double png_coord, double dpi) {
    if (dpi <= 0) {
      throw std::invalid_argument("dpi must be positive");
    }
    return (png_coord * 72.0) / dpi;
  }
} // namespace fin_coords

#endif // fin_PDF_COORDS_H
