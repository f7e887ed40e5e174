#include "fin_figure_type.h"

namespace {
  struct figure_type_entry {
    fin_figure_type type;
    const char* name;
  };

  const figure_type_entry figure_types[] = {
    {fin_figure_type::line_chart, "line_chart"},
    {fin_figure_type::multi_line_chart, "multi_line_chart"},
    {fin_figure_type::area_chart, "area_chart"},
    {fin_figure_type::bar_chart, "bar_chart"},
    {fin_figure_type::stacked_bar_chart, "stacked_bar_chart"},
    {fin_figure_type::pie_chart, "pie_chart"},
    {fin_figure_type::donut_chart, "donut_chart"},
    {fin_figure_type::scatter_chart, "scatter_chart"},
    {fin_figure_type::bubble_chart, "bubble_chart"},
    {fin_figure_type::box_whisker, "box_whisker"},
    {fin_figure_type::waterfall, "waterfall"},
    {fin_figure_type::heatmap, "heatmap"},
    {fin_figure_type::candlestick, "candlestick"},
    {fin_figure_type::histogram, "histogram"},
    {fin_figure_type::network_graph, "network_graph"},
    {fin_figure_type::parallel_coordinates, "parallel_coordinates"},
    {fin_figure_type::photo, "photo"},
    {fin_figure_type::diagram, "diagram"},
    {fin_figure_type::logo, "logo"},
    {fin_figure_type::unknown, "unknown"}
  };
}

fin_string figure_type_name(fin_figure_type type)
{
  for (const auto& entry : figure_types) {
    if (entry.type == type) {
      return entry.name;
    }
  }
  return "unknown";
}

fin_figure_type figure_type_from_name(const fin_string& name)
{
  fin_string lower = name.lower();
  for (const auto& entry : figure_types) {
    if (lower == entry.name) {
      return entry.type;
    }
  }
  return fin_figure_type::unknown;
}
