#ifndef fin_LAYOUT_IMAGE_H
#define fin_LAYOUT_IMAGE_H

#include "fin_layout_bounds.h"

// Placement of an embedded image on the page
class fin_layout_image : public fin_layout_bounds
{
public:
  finp_int(pixel_width);
  finp_int(pixel_height);
};

#endif // fin_LAYOUT_IMAGE_H
