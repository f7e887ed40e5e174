#include "fin_model.h"

fin_property_i::fin_property_i(fin_model *parent, const fin_string &name, const finv_map &meta)
  : parent(parent), name(name), metadata(meta)
{
  if (parent != nullptr)
  {
    parent->add_prop(this, name);
  }
}

fin_variant &fin_property_i::access()
{
  if (parent == nullptr)
  {
    throw std::logic_error("fin_property without parent model");
  }
  return (*parent)[name];
}

const fin_variant *fin_property_i::const_access() const
{
  if (parent == nullptr)
  {
    return nullptr;
  }
  return parent->find(name);
}

bool fin_property_i::is_null() const
{
  const fin_variant* v = const_access();
  return v == nullptr || v->is_null();
}

void fin_model::add_prop(fin_property_i *prop, const fin_string &name)
{
  props[name] = prop;
}

const fin_variant *fin_model::find(const fin_string &key) const
{
  if (is_null())
  {
    return nullptr;
  }
  const finv_map& data = **this;
  auto it = data.find(key);
  if (it == data.end())
  {
    return nullptr;
  }
  return &it->second;
}

void fin_model::assign(const fin_model &other)
{
  if (this == &other)
  {
    return;
  }
  finv_map copy = *other;
  **this = copy;
}

void fin_model::read_row(const finv_map &row)
{
  for (auto& entry : props)
  {
    const finv_map& meta = entry.second->get_meta();
    auto column = meta.find("column");
    if (column == meta.end())
    {
      continue;
    }
    auto value = row.find(column->second.convert(fin_variant::string_state).string_value());
    if (value == row.end() || value->second.is_null())
    {
      continue;
    }
    fin_variant& target = entry.second->access();
    target = value->second.convert(entry.second->get_variant_type());
  }
}
