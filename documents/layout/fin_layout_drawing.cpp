#include "fin_layout_drawing.h"

void cluster_drawings(const fin_model_list<fin_layout_path>& paths,
                      double merge_gap, long long min_paths,
                      fin_model_list<fin_layout_drawing>& clusters)
{
  fin_model_list<fin_layout_drawing> found;

  for (size_t i = 0; i < paths.size(); ++i) {
    const fin_layout_path& path = paths[i];
    if (path.width.value() < 2.0 || path.height.value() < 2.0) {
      continue;
    }

    bool merged = false;
    for (size_t c = 0; c < found.size(); ++c) {
      fin_layout_drawing& cluster = found[c];
      if (cluster.near(path, merge_gap)) {
        cluster.unite(path);
        cluster.path_count = cluster.path_count.value() + 1;
        cluster.has_fill = cluster.has_fill.value() || path.has_fill.value();
        cluster.has_stroke = cluster.has_stroke.value() || path.has_stroke.value();
        merged = true;
        break;
      }
    }

    if (!merged) {
      found.add_element();
      fin_layout_drawing& cluster = found.back();
      cluster.set_bounds(path);
      cluster.path_count = 1LL;
      cluster.has_fill = path.has_fill.value();
      cluster.has_stroke = path.has_stroke.value();
    }
  }

  for (size_t c = 0; c < found.size(); ++c) {
    if (found[c].path_count.value() >= min_paths) {
      clusters.push_back(found[c]);
    }
  }
}
