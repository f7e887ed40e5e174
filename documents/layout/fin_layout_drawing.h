#ifndef fin_LAYOUT_DRAWING_H
#define fin_LAYOUT_DRAWING_H

#include "fin_layout_bounds.h"

// One painted vector path
class fin_layout_path : public fin_layout_bounds
{
public:
  finp_bool(has_fill);
  finp_bool(has_stroke);
};

// Group of nearby painted paths, usually a chart or diagram
class fin_layout_drawing : public fin_layout_bounds
{
public:
  finp_int(path_count);
  finp_bool(has_fill);
  finp_bool(has_stroke);
};

// Greedy clustering: each path (at least 2pt in both dimensions) joins the
// first cluster it overlaps or lies within merge_gap of, otherwise starts a
// new one. Clusters with fewer than min_paths paths are dropped.
void cluster_drawings(const fin_model_list<fin_layout_path>& paths,
                      double merge_gap, long long min_paths,
                      fin_model_list<fin_layout_drawing>& clusters);

#endif // fin_LAYOUT_DRAWING_H
