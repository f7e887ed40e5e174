#ifndef fin_LAYOUT_BLOCK_H
#define fin_LAYOUT_BLOCK_H

#include "../../documents/layout/fin_layout_bounds.h"

enum class fin_block_role
{
  heading,
  paragraph,
  table,
  figure,
  caption,
  footnote,
  header,
  footer,
  other
};

fin_string block_role_name(fin_block_role role);
fin_block_role block_role_from_name(const fin_string& name);

// Page region tagged with a semantic role
class fin_layout_block : public fin_layout_bounds
{
public:
  finp_string(role);
  finp_string(text);
  finp_int(page_number);
  finp_double(confidence);

  fin_layout_block();

  fin_block_role get_role() const;
  void set_role(fin_block_role value);
  bool is(fin_block_role value) const { return get_role() == value; }
};

#endif // fin_LAYOUT_BLOCK_H
