#include "fin_layout_bounds.h"
#include <algorithm>
#include <cmath>

fin_layout_bounds::fin_layout_bounds() {}

fin_layout_bounds::fin_layout_bounds(double x_val, double y_val, double width_val, double height_val)
{
  set_bounds(x_val, y_val, width_val, height_val);
}

void fin_layout_bounds::set_bounds(double x_val, double y_val, double width_val, double height_val)
{
  x = x_val;
  y = y_val;
  width = width_val;
  height = height_val;
}

void fin_layout_bounds::set_bounds(const fin_layout_bounds& other)
{
  set_bounds(other.x.value(), other.y.value(), other.width.value(), other.height.value());
}

void fin_layout_bounds::set_edges(double left, double top, double right, double bottom)
{
  set_bounds(left, top, right - left, bottom - top);
}

double fin_layout_bounds::get_left() const {
  return x;
}

double fin_layout_bounds::get_right() const {
  return x.value() + width.value();
}

double fin_layout_bounds::get_top() const {
  return y;
}

double fin_layout_bounds::get_bottom() const {
  return y.value() + height.value();
}

double fin_layout_bounds::get_center_x() const {
  return x.value() + width.value() / 2.0;
}

double fin_layout_bounds::get_center_y() const {
  return y.value() + height.value() / 2.0;
}

double fin_layout_bounds::area() const {
  return std::max(0.0, width.value()) * std::max(0.0, height.value());
}

bool fin_layout_bounds::contains_point(double px, double py) const {
  return px >= get_left() && px <= get_right() &&
         py >= get_top() && py <= get_bottom();
}

bool fin_layout_bounds::intersects_bounds(const fin_layout_bounds& other) const {
  return !(other.get_right() < get_left() ||
           other.get_left() > get_right() ||
           other.get_bottom() < get_top() ||
           other.get_top() > get_bottom());
}

void fin_layout_bounds::unite(const fin_layout_bounds& other)
{
  set_edges(std::min(get_left(), other.get_left()),
            std::min(get_top(), other.get_top()),
            std::max(get_right(), other.get_right()),
            std::max(get_bottom(), other.get_bottom()));
}

double fin_layout_bounds::iou(const fin_layout_bounds& other) const
{
  double ix = std::max(0.0, std::min(get_right(), other.get_right()) - std::max(get_left(), other.get_left()));
  double iy = std::max(0.0, std::min(get_bottom(), other.get_bottom()) - std::max(get_top(), other.get_top()));
  double inter = ix * iy;
  double uni = area() + other.area() - inter;
  return uni > 0 ? inter / uni : 0.0;
}

bool fin_layout_bounds::near(const fin_layout_bounds& other, double tolerance) const
{
  return other.get_left() <= get_right() + tolerance &&
         other.get_right() >= get_left() - tolerance &&
         other.get_top() <= get_bottom() + tolerance &&
         other.get_bottom() >= get_top() - tolerance;
}

double fin_layout_bounds::center_distance(const fin_layout_bounds& other) const
{
  double dx = get_center_x() - other.get_center_x();
  double dy = get_center_y() - other.get_center_y();
  return std::sqrt(dx * dx + dy * dy);
}
