#include "fin_chart_classifier.h"

fin_keyword_chart_classifier::fin_keyword_chart_classifier()
{
  const auto flags = std::regex::ECMAScript | std::regex::icase;
  // More specific chart families go first: "stacked bar" before "bar",
  // two "line" mentions before a single one.
  rules.emplace_back(std::regex("\\bpie\\b", flags), fin_figure_type::pie_chart);
  rules.emplace_back(std::regex("\\bdonut\\b", flags), fin_figure_type::donut_chart);
  rules.emplace_back(std::regex("\\bscatter\\b", flags), fin_figure_type::scatter_chart);
  rules.emplace_back(std::regex("\\bbubble\\b", flags), fin_figure_type::bubble_chart);
  rules.emplace_back(std::regex("\\bcandle|ohlc\\b", flags), fin_figure_type::candlestick);
  rules.emplace_back(std::regex("\\bwaterfall\\b", flags), fin_figure_type::waterfall);
  rules.emplace_back(std::regex("\\bheat\\s*map\\b", flags), fin_figure_type::heatmap);
  rules.emplace_back(std::regex("\\bbox\\b.*\\bwhisker|box\\s*plot\\b", flags), fin_figure_type::box_whisker);
  rules.emplace_back(std::regex("\\bhistogram\\b", flags), fin_figure_type::histogram);
  rules.emplace_back(std::regex("\\bnetwork\\b", flags), fin_figure_type::network_graph);
  rules.emplace_back(std::regex("\\bparallel\\s*coord", flags), fin_figure_type::parallel_coordinates);
  rules.emplace_back(std::regex("\\bstacked\\s*(bar|column)\\b", flags), fin_figure_type::stacked_bar_chart);
  rules.emplace_back(std::regex("\\bbar\\b|\\bcolumn\\b", flags), fin_figure_type::bar_chart);
  rules.emplace_back(std::regex("\\barea\\b", flags), fin_figure_type::area_chart);
  rules.emplace_back(std::regex("\\bline\\b.*\\bline\\b|\\bmulti.?line\\b", flags), fin_figure_type::multi_line_chart);
  rules.emplace_back(std::regex("\\bline\\b", flags), fin_figure_type::line_chart);
}

fin_figure_type fin_keyword_chart_classifier::classify(const fin_string& caption, const fin_string& ocr_text) const
{
  const fin_string combined = caption + " " + ocr_text;
  const std::string& text = combined.to_std_const();
  for (const auto& rule : rules) {
    if (std::regex_search(text, rule.first)) {
      return rule.second;
    }
  }
  return fin_figure_type::unknown;
}
