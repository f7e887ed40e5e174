#ifndef fin_LAYOUT_SPAN_H
#define fin_LAYOUT_SPAN_H

#include "fin_layout_bounds.h"

class fin_layout_span : public fin_layout_bounds
{
public:
  finp_string(text);
  finp_string(font_family);
  finp_double(font_size);
  finp_bool(bold);
};

#endif // fin_LAYOUT_SPAN_H
