#ifndef fin_TESSERACT_OCR_H
#define fin_TESSERACT_OCR_H

#include "fin_ocr_engine.h"
#include <atomic>
#include <memory>
#include <mutex>

namespace tesseract {
  class TessBaseAPI;
}

// Word-level OCR through Tesseract. One engine instance, calls serialized.
// A recognize call running past timeout_ms is abandoned and returns no boxes.
class fin_tesseract_ocr : public fin_ocr_engine {
public:
  explicit fin_tesseract_ocr(const fin_string& language = "eng", int timeout_ms = 30000);
  ~fin_tesseract_ocr();

  // Loads the language data from TESSDATA_PREFIX (or Tesseract's default)
  bool initialize();
  bool is_initialized() const { return initialized; }
  fin_string get_last_error() const { return last_error; }

  std::vector<fin_ocr_box> recognize(const cv::Mat& image, double confidence_threshold) override;

private:
  std::unique_ptr<tesseract::TessBaseAPI> api;
  fin_string language;
  fin_string last_error;
  int timeout_ms;
  std::atomic<bool> initialized;
  std::mutex engine_mutex;

  void set_image(const cv::Mat& image);
};

#endif // fin_TESSERACT_OCR_H
