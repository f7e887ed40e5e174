#ifndef fin_CHART_DESCRIBER_H
#define fin_CHART_DESCRIBER_H

#include "../../utils/fin_variant.h"
#include "../chat/fin_llm_api.h"
#include <opencv2/core.hpp>

// Chart-to-text: a short prose description of a figure. May return empty.
class fin_chart_describer {
public:
  virtual ~fin_chart_describer() = default;
  virtual fin_string describe(const cv::Mat& image, const fin_string& caption, const fin_string& ocr_text) = 0;
};

// Composes the description from caption and OCR overlay only
class fin_fallback_chart_describer : public fin_chart_describer {
public:
  fin_string describe(const cv::Mat& image, const fin_string& caption, const fin_string& ocr_text) override;
};

// Chat completion over caption and OCR text. Any failure or an empty
// answer falls back to fin_fallback_chart_describer.
class fin_llm_chart_describer : public fin_chart_describer {
public:
  fin_llm_chart_describer(fin::llm::i_llm_api& api, const fin_string& model, int max_tokens = 256);

  fin_string describe(const cv::Mat& image, const fin_string& caption, const fin_string& ocr_text) override;

private:
  fin::llm::i_llm_api& api;
  fin_string model;
  int max_tokens;
  fin_fallback_chart_describer fallback;
};

// Structured data series behind a chart: {"columns": [...], "data": [[...], ...]}
class fin_chart_digitizer {
public:
  virtual ~fin_chart_digitizer() = default;

  // false when no series could be recovered; series is left untouched then
  virtual bool digitize(const cv::Mat& image, finv_map& series) = 0;
};

class fin_null_chart_digitizer : public fin_chart_digitizer {
public:
  bool digitize(const cv::Mat&, finv_map&) override { return false; }
};

#endif // fin_CHART_DESCRIBER_H
