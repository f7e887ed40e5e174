#include "fin_table_extractor.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>

namespace {
  // Paths at most this thick and at least this long count as ruling lines
  const double rule_thickness = 2.0;
  const double rule_min_length = 10.0;
  // Line ends and positions closer than this are treated as touching
  const double snap_distance = 2.0;

  struct ruling_line {
    bool horizontal;
    double pos;
    double from;
    double to;
  };

  struct grid {
    std::vector<double> xs;
    std::vector<double> ys;
  };

  size_t find_root(std::vector<size_t>& parent, size_t i)
  {
    while (parent[i] != i) {
      parent[i] = parent[parent[i]];
      i = parent[i];
    }
    return i;
  }

  bool lines_touch(const ruling_line& a, const ruling_line& b)
  {
    if (a.horizontal != b.horizontal) {
      const ruling_line& h = a.horizontal ? a : b;
      const ruling_line& v = a.horizontal ? b : a;
      return v.pos >= h.from - snap_distance && v.pos <= h.to + snap_distance &&
             h.pos >= v.from - snap_distance && h.pos <= v.to + snap_distance;
    }
    return std::abs(a.pos - b.pos) <= snap_distance &&
           a.from <= b.to + snap_distance && b.from <= a.to + snap_distance;
  }

  std::vector<double> distinct_positions(std::vector<double> values)
  {
    std::sort(values.begin(), values.end());
    std::vector<double> result;
    for (double v : values) {
      if (result.empty() || v - result.back() > snap_distance) {
        result.push_back(v);
      }
    }
    return result;
  }

  // Index of the band [edges[i], edges[i+1]) holding value
  size_t band_index(const std::vector<double>& edges, double value)
  {
    size_t i = std::upper_bound(edges.begin(), edges.end(), value) - edges.begin();
    if (i == 0) {
      return 0;
    }
    return std::min(i - 1, edges.size() - 2);
  }
}

fin_table_extractor::fin_table_extractor(long long min_rows, long long min_cols, int dpi,
                                         double ocr_confidence_threshold)
  : min_rows(min_rows), min_cols(min_cols), dpi(dpi),
    ocr_confidence_threshold(ocr_confidence_threshold), ocr(nullptr)
{
}

void fin_table_extractor::set_ocr_engine(fin_ocr_engine* engine)
{
  ocr = engine;
}

bool fin_table_extractor::meets_minimums(const fin_table_rows& rows) const
{
  if (static_cast<long long>(rows.size()) < min_rows) {
    return false;
  }
  if (!rows.empty() && static_cast<long long>(rows[0].size()) < min_cols) {
    return false;
  }
  return true;
}

void fin_table_extractor::extract(const fin_page_record& page, const fin_model_list<fin_layout_block>& blocks,
                                  fin_model_list<fin_extracted_table>& tables) const
{
  size_t before = tables.size();
  extract_ruled(page, tables);
  if (tables.size() > before) {
    return;
  }

  if (ocr == nullptr || page.raster.empty()) {
    return;
  }

  for (size_t i = 0; i < blocks.size(); ++i) {
    const fin_layout_block& block = blocks[i];
    if (!block.is(fin_block_role::table)) {
      continue;
    }
    fin_extracted_table table;
    if (extract_ocr(page.raster, block, page.page_number.value(), table)) {
      tables.push_back(table);
    }
  }
}

void fin_table_extractor::extract_ruled(const fin_page_record& page, fin_model_list<fin_extracted_table>& tables) const
{
  std::vector<ruling_line> lines;
  for (size_t i = 0; i < page.paths.size(); ++i) {
    const fin_layout_path& path = page.paths[i];
    double w = path.width.value();
    double h = path.height.value();
    if (h <= rule_thickness && w >= rule_min_length) {
      lines.push_back({true, path.get_center_y(), path.get_left(), path.get_right()});
    } else if (w <= rule_thickness && h >= rule_min_length) {
      lines.push_back({false, path.get_center_x(), path.get_top(), path.get_bottom()});
    }
  }
  if (lines.size() < 4) {
    return;
  }

  std::vector<size_t> parent(lines.size());
  std::iota(parent.begin(), parent.end(), 0);
  for (size_t a = 0; a < lines.size(); ++a) {
    for (size_t b = a + 1; b < lines.size(); ++b) {
      if (lines_touch(lines[a], lines[b])) {
        parent[find_root(parent, a)] = find_root(parent, b);
      }
    }
  }

  std::map<size_t, std::pair<std::vector<double>, std::vector<double>>> components;
  for (size_t i = 0; i < lines.size(); ++i) {
    auto& component = components[find_root(parent, i)];
    if (lines[i].horizontal) {
      component.second.push_back(lines[i].pos);
    } else {
      component.first.push_back(lines[i].pos);
    }
  }

  std::vector<grid> grids;
  for (auto& entry : components) {
    grid g;
    g.xs = distinct_positions(entry.second.first);
    g.ys = distinct_positions(entry.second.second);
    if (g.xs.size() >= 2 && g.ys.size() >= 2) {
      grids.push_back(g);
    }
  }
  std::sort(grids.begin(), grids.end(), [](const grid& a, const grid& b) {
    if (a.ys.front() != b.ys.front()) {
      return a.ys.front() < b.ys.front();
    }
    return a.xs.front() < b.xs.front();
  });

  // Spans in reading order
  std::vector<size_t> order(page.spans.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&page](size_t a, size_t b) {
    const fin_layout_span& sa = page.spans[a];
    double ta = sa.get_top();
    double la = sa.get_left();
    const fin_layout_span& sb = page.spans[b];
    if (ta != sb.get_top()) {
      return ta < sb.get_top();
    }
    return la < sb.get_left();
  });

  for (const grid& g : grids) {
    fin_layout_bounds area;
    area.set_edges(g.xs.front(), g.ys.front(), g.xs.back(), g.ys.back());

    size_t row_count = g.ys.size() - 1;
    size_t col_count = g.xs.size() - 1;
    std::vector<std::vector<std::vector<fin_string>>> cells(row_count, std::vector<std::vector<fin_string>>(col_count));

    for (size_t idx : order) {
      const fin_layout_span& span = page.spans[idx];
      double cx = span.get_center_x();
      double cy = span.get_center_y();
      if (!area.contains_point(cx, cy)) {
        continue;
      }
      fin_string text = span.text.value().trim();
      if (text.empty()) {
        continue;
      }
      cells[band_index(g.ys, cy)][band_index(g.xs, cx)].push_back(text);
    }

    fin_table_rows rows;
    for (const auto& row_cells : cells) {
      std::vector<fin_string> row;
      bool any = false;
      for (const auto& parts : row_cells) {
        fin_string cell = fin_string(" ").join(parts);
        any = any || !cell.empty();
        row.push_back(cell);
      }
      if (any) {
        rows.push_back(row);
      }
    }

    if (rows.empty() || !meets_minimums(rows)) {
      continue;
    }

    tables.add_element();
    fin_extracted_table& table = tables.back();
    table.set_bounds(area);
    table.page_number = page.page_number.value();
    table.method = "primary";
    table.set_rows(rows);
  }
}

bool fin_table_extractor::extract_ocr(const cv::Mat& raster, const fin_layout_bounds& region, long long page_number,
                                      fin_extracted_table& table) const
{
  if (ocr == nullptr) {
    return false;
  }
  cv::Mat crop = crop_region(raster, region, dpi);
  if (crop.empty()) {
    return false;
  }

  std::vector<fin_ocr_box> boxes;
  try {
    boxes = ocr->recognize(crop, ocr_confidence_threshold);
  } catch (const std::exception& e) {
    std::cerr << "[TABLE] OCR failed on page " << page_number << ": " << e.what() << std::endl;
    return false;
  }
  if (boxes.empty()) {
    return false;
  }

  fin_table_rows rows = cluster_rows(boxes);
  if (!meets_minimums(rows)) {
    return false;
  }

  table.set_bounds(region);
  table.page_number = page_number;
  table.method = "ocr-fallback";
  table.set_rows(rows);
  return true;
}

fin_table_rows fin_table_extractor::cluster_rows(const std::vector<fin_ocr_box>& boxes, int tolerance)
{
  std::vector<int> keys;
  std::vector<std::vector<std::pair<int, fin_string>>> members;

  for (const auto& box : boxes) {
    int y_center = (box.y0 + box.y1) / 2;
    bool matched = false;
    for (size_t k = 0; k < keys.size(); ++k) {
      if (std::abs(keys[k] - y_center) < tolerance) {
        members[k].push_back(std::make_pair(box.x0, box.text));
        matched = true;
        break;
      }
    }
    if (!matched) {
      keys.push_back(y_center);
      members.push_back({std::make_pair(box.x0, box.text)});
    }
  }

  std::vector<size_t> order(keys.size());
  std::iota(order.begin(), order.end(), 0);
  std::sort(order.begin(), order.end(), [&keys](size_t a, size_t b) { return keys[a] < keys[b]; });

  fin_table_rows rows;
  for (size_t k : order) {
    auto cells = members[k];
    std::stable_sort(cells.begin(), cells.end(),
                     [](const std::pair<int, fin_string>& a, const std::pair<int, fin_string>& b) {
                       return a.first < b.first;
                     });
    std::vector<fin_string> row;
    for (const auto& cell : cells) {
      row.push_back(cell.second);
    }
    rows.push_back(row);
  }
  return rows;
}
