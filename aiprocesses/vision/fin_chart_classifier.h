#ifndef fin_CHART_CLASSIFIER_H
#define fin_CHART_CLASSIFIER_H

#include "fin_figure_type.h"
#include <regex>
#include <utility>
#include <vector>

// Figure type from the caption and the text visible inside the figure.
// Implementations are pure: same input, same answer.
class fin_chart_classifier {
public:
  virtual ~fin_chart_classifier() = default;
  virtual fin_figure_type classify(const fin_string& caption, const fin_string& ocr_text) const = 0;
};

// Ordered keyword rules over "{caption} {ocr_text}", first match wins
class fin_keyword_chart_classifier : public fin_chart_classifier {
public:
  fin_keyword_chart_classifier();

  fin_figure_type classify(const fin_string& caption, const fin_string& ocr_text) const override;

private:
  std::vector<std::pair<std::regex, fin_figure_type>> rules;
};

#endif // fin_CHART_CLASSIFIER_H
