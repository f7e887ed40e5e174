#include "fin_layout_block.h"

fin_string block_role_name(fin_block_role role)
{
  switch (role)
  {
    case fin_block_role::heading: return "heading";
    case fin_block_role::paragraph: return "paragraph";
    case fin_block_role::table: return "table";
    case fin_block_role::figure: return "figure";
    case fin_block_role::caption: return "caption";
    case fin_block_role::footnote: return "footnote";
    case fin_block_role::header: return "header";
    case fin_block_role::footer: return "footer";
    case fin_block_role::other: return "other";
  }
  return "other";
}

fin_block_role block_role_from_name(const fin_string& name)
{
  static const fin_block_role all[] = {
    fin_block_role::heading, fin_block_role::paragraph, fin_block_role::table,
    fin_block_role::figure, fin_block_role::caption, fin_block_role::footnote,
    fin_block_role::header, fin_block_role::footer, fin_block_role::other
  };
  fin_string lower = name.lower();
  for (fin_block_role role : all)
  {
    if (block_role_name(role) == lower)
    {
      return role;
    }
  }
  return fin_block_role::other;
}

fin_layout_block::fin_layout_block()
{
}

fin_block_role fin_layout_block::get_role() const
{
  return block_role_from_name(role.value());
}

void fin_layout_block::set_role(fin_block_role value)
{
  role = block_role_name(value);
}
