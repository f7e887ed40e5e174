#include "fin_tesseract_ocr.h"
#include <tesseract/baseapi.h>
#include <tesseract/ocrclass.h>
#include <tesseract/resultiterator.h>
#include <opencv2/imgproc.hpp>
#include <cstdlib>
#include <iostream>

fin_tesseract_ocr::fin_tesseract_ocr(const fin_string& language, int timeout_ms)
  : api(std::make_unique<tesseract::TessBaseAPI>()), language(language), timeout_ms(timeout_ms), initialized(false)
{
}

fin_tesseract_ocr::~fin_tesseract_ocr()
{
  if (api) {
    api->End();
  }
}

bool fin_tesseract_ocr::initialize()
{
  std::lock_guard<std::mutex> lock(engine_mutex);
  if (initialized) {
    return true;
  }

  // nullptr lets Tesseract fall back to its compiled-in data path
  const char* tessdata = std::getenv("TESSDATA_PREFIX");
  if (api->Init(tessdata, language.c_str()) != 0) {
    last_error = "failed to initialize Tesseract with language: " + language;
    std::cerr << "[OCR] " << last_error << std::endl;
    return false;
  }
  api->SetPageSegMode(tesseract::PSM_AUTO);
  initialized = true;
  return true;
}

void fin_tesseract_ocr::set_image(const cv::Mat& image)
{
  cv::Mat rgb;

  // Tesseract expects RGB
  if (image.channels() == 1) {
    cv::cvtColor(image, rgb, cv::COLOR_GRAY2RGB);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, rgb, cv::COLOR_BGRA2RGB);
  } else {
    cv::cvtColor(image, rgb, cv::COLOR_BGR2RGB);
  }

  // SetImage copies the pixels
  api->SetImage(rgb.data, rgb.cols, rgb.rows, 3, static_cast<int>(rgb.step));
}

std::vector<fin_ocr_box> fin_tesseract_ocr::recognize(const cv::Mat& image, double confidence_threshold)
{
  std::vector<fin_ocr_box> boxes;
  if (image.empty()) {
    return boxes;
  }
  if (!initialized && !initialize()) {
    return boxes;
  }

  std::lock_guard<std::mutex> lock(engine_mutex);
  try {
    set_image(image);

    // ETEXT_DESC is global in Tesseract 4 and namespaced in 5
    using namespace tesseract;
    ETEXT_DESC monitor;
    if (timeout_ms > 0) {
      monitor.set_deadline_msecs(timeout_ms);
    }
    int status = api->Recognize(&monitor);
    if (monitor.deadline_exceeded()) {
      std::cerr << "[OCR] recognition exceeded " << timeout_ms << " ms, no text used" << std::endl;
      api->Clear();
      return boxes;
    }
    if (status != 0) {
      std::cerr << "[OCR] recognition failed" << std::endl;
      api->Clear();
      return boxes;
    }

    std::unique_ptr<tesseract::ResultIterator> ri(api->GetIterator());
    tesseract::PageIteratorLevel level = tesseract::RIL_WORD;
    if (ri != nullptr) {
      do {
        std::unique_ptr<char[]> word(ri->GetUTF8Text(level));
        if (word == nullptr) {
          continue;
        }
        double conf = ri->Confidence(level) / 100.0;
        fin_string text = fin_string(word.get()).trim();
        if (text.empty() || conf < confidence_threshold) {
          continue;
        }

        fin_ocr_box box;
        box.text = text;
        box.confidence = conf;
        ri->BoundingBox(level, &box.x0, &box.y0, &box.x1, &box.y1);
        boxes.push_back(box);
      } while (ri->Next(level));
    }
    api->Clear();
  } catch (const std::exception& e) {
    std::cerr << "[OCR] " << e.what() << std::endl;
    api->Clear();
    boxes.clear();
    return boxes;
  }

  sort_reading_order(boxes);
  return boxes;
}
