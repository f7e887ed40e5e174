#ifndef fin_LAYOUT_BOUNDS_H
#define fin_LAYOUT_BOUNDS_H

#include "../../utils/fin_model.h"

// Axis-aligned box in page space (points, top-left origin, y grows downward)
class fin_layout_bounds : public fin_model
{
public:
  finp_double(x);
  finp_double(y);
  finp_double(width);
  finp_double(height);

  fin_layout_bounds();
  fin_layout_bounds(double x_val, double y_val, double width_val, double height_val);

  void set_bounds(double x_val, double y_val, double width_val, double height_val);
  void set_bounds(const fin_layout_bounds& other);
  void set_edges(double left, double top, double right, double bottom);

  double get_left() const;
  double get_right() const;
  double get_top() const;
  double get_bottom() const;
  double get_center_x() const;
  double get_center_y() const;
  double area() const;

  bool contains_point(double px, double py) const;
  bool intersects_bounds(const fin_layout_bounds& other) const;

  // Grow to the union with other
  void unite(const fin_layout_bounds& other);

  // Intersection-over-union, 0 when the union is empty
  double iou(const fin_layout_bounds& other) const;

  // True when the boxes overlap or their gap is at most tolerance on both axes
  bool near(const fin_layout_bounds& other, double tolerance) const;

  // Euclidean distance between the centers
  double center_distance(const fin_layout_bounds& other) const;
};

#endif // fin_LAYOUT_BOUNDS_H
