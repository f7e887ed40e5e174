#ifndef fin_FIGURE_TYPE_H
#define fin_FIGURE_TYPE_H

#include "../../utils/fin_string.h"

enum class fin_figure_type
{
  line_chart,
  multi_line_chart,
  area_chart,
  bar_chart,
  stacked_bar_chart,
  pie_chart,
  donut_chart,
  scatter_chart,
  bubble_chart,
  box_whisker,
  waterfall,
  heatmap,
  candlestick,
  histogram,
  network_graph,
  parallel_coordinates,
  photo,
  diagram,
  logo,
  unknown
};

fin_string figure_type_name(fin_figure_type type);

// Unrecognized names map to unknown
fin_figure_type figure_type_from_name(const fin_string& name);

#endif // fin_FIGURE_TYPE_H
