#include "fin_variant.h"

void fin_variant::copy_from(const fin_variant &other)
{
  if (this == &other)
  {
    return;
  }
  reset(other.is);
  switch (other.is)
  {
    case string_state: *cast_content<fin_string>() = other.string_value(); break;
    case int_state: *cast_content<long long>() = other.int_value(); break;
    case double_state: *cast_content<double>() = other.double_value(); break;
    case bool_state: *cast_content<bool>() = other.bool_value(); break;
    case vector_state: *cast_content<finv_vector>() = other.vector_value(); break;
    case map_state: *cast_content<finv_map>() = other.map_value(); break;
    case none: break;
  }
}

void fin_variant::clear()
{
  switch (is)
  {
    case string_state: delete cast_content<fin_string>(); break;
    case int_state: delete cast_content<long long>(); break;
    case double_state: delete cast_content<double>(); break;
    case bool_state: delete cast_content<bool>(); break;
    case vector_state: delete cast_content<finv_vector>(); break;
    case map_state: delete cast_content<finv_map>(); break;
    case none: break;
  }
  content = nullptr;
  is = none;
}

void fin_variant::reset(fin_variant::state to)
{
  clear();
  is = to;
  switch (is)
  {
    case string_state: content = new fin_string; break;
    case int_state: content = new long long(0); break;
    case double_state: content = new double(0.0); break;
    case bool_state: content = new bool(false); break;
    case vector_state: content = new finv_vector; break;
    case map_state: content = new finv_map; break;
    case none: break;
  }
}

fin_variant::~fin_variant()
{
  clear();
}

fin_variant::fin_variant() : content(nullptr), is(none)
{
}

fin_variant::fin_variant(const char *from_string) : content(new fin_string(from_string)), is(string_state)
{
}

fin_variant::fin_variant(const fin_string &from_string) : content(new fin_string(from_string)), is(string_state)
{
}

fin_variant::fin_variant(int from_int) : content(new long long(from_int)), is(int_state)
{
}

fin_variant::fin_variant(bool from_bool) : content(new bool(from_bool)), is(bool_state)
{
}

fin_variant::fin_variant(long long from_int) : content(new long long(from_int)), is(int_state)
{
}

fin_variant::fin_variant(unsigned long from_int)
  : content(new long long(static_cast<long long>(from_int))), is(int_state)
{
}

fin_variant::fin_variant(double from_double) : content(new double(from_double)), is(double_state)
{
}

fin_variant::fin_variant(const finv_vector &from_vector) : content(new finv_vector(from_vector)), is(vector_state)
{
}

fin_variant::fin_variant(const finv_map &from_map) : content(new finv_map(from_map)), is(map_state)
{
}

fin_variant::fin_variant(const fin_variant &other) : content(nullptr), is(none)
{
  copy_from(other);
}

fin_variant::fin_variant(fin_variant &&other) noexcept : content(other.content), is(other.is)
{
  other.content = nullptr;
  other.is = none;
}

fin_string &fin_variant::to_string()
{
  if (is != string_state)
  {
    *this = convert(string_state);
  }
  return *cast_content<fin_string>();
}

long long &fin_variant::to_int()
{
  if (is != int_state)
  {
    *this = convert(int_state);
  }
  return *cast_content<long long>();
}

bool &fin_variant::to_bool()
{
  if (is != bool_state)
  {
    *this = convert(bool_state);
  }
  return *cast_content<bool>();
}

double &fin_variant::to_double()
{
  if (is != double_state)
  {
    *this = convert(double_state);
  }
  return *cast_content<double>();
}

finv_vector &fin_variant::to_vector()
{
  if (is != vector_state)
  {
    *this = convert(vector_state);
  }
  return *cast_content<finv_vector>();
}

finv_map &fin_variant::to_map()
{
  if (is != map_state)
  {
    *this = convert(map_state);
  }
  return *cast_content<finv_map>();
}

const fin_string &fin_variant::string_value() const
{
  return *cast_content<fin_string>();
}

const long long &fin_variant::int_value() const
{
  return *cast_content<long long>();
}

const bool &fin_variant::bool_value() const
{
  return *cast_content<bool>();
}

const double &fin_variant::double_value() const
{
  return *cast_content<double>();
}

const finv_vector &fin_variant::vector_value() const
{
  return *cast_content<finv_vector>();
}

const finv_map &fin_variant::map_value() const
{
  return *cast_content<finv_map>();
}

fin_variant fin_variant::convert(fin_variant::state to) const
{
  if (is == to)
  {
    return *this;
  }

  fin_variant res;
  res.reset(to);

  if (is == string_state)
  {
    if (to == int_state)
    {
      res = string_value().to_int(0);
    }
    else if (to == bool_state)
    {
      fin_string lower = string_value().lower();
      // "t" is what PostgreSQL returns for booleans
      res = (lower == "true" || lower == "t" || string_value().to_int(0) != 0);
    }
    else if (to == double_state)
    {
      res = string_value().to_double(0);
    }
  }
  else if (is == bool_state)
  {
    if (to == int_state)
    {
      res = bool_value() ? 1LL : 0LL;
    }
    else if (to == double_state)
    {
      res = bool_value() ? 1.0 : 0.0;
    }
    else if (to == string_state)
    {
      res = bool_value() ? "true" : "false";
    }
  }
  else if (is == int_state)
  {
    if (to == double_state)
    {
      res = static_cast<double>(int_value());
    }
    else if (to == bool_state)
    {
      res = int_value() != 0;
    }
    else if (to == string_state)
    {
      res = fin_string(int_value());
    }
  }
  else if (is == double_state)
  {
    if (to == int_state)
    {
      res = static_cast<long long>(double_value());
    }
    else if (to == bool_state)
    {
      res = double_value() != 0.0;
    }
    else if (to == string_state)
    {
      res = fin_string(double_value());
    }
  }
  return res;
}

fin_variant &fin_variant::operator=(const fin_variant &other)
{
  copy_from(other);
  return *this;
}

fin_variant &fin_variant::operator=(fin_variant &&other) noexcept
{
  if (this != &other)
  {
    clear();
    content = other.content;
    is = other.is;
    other.content = nullptr;
    other.is = none;
  }
  return *this;
}

bool fin_variant::operator==(const fin_variant &other) const
{
  switch (is)
  {
    case string_state: return other.is != none && string_value() == other.convert(string_state).string_value();
    case int_state: return other.is != none && int_value() == other.convert(int_state).int_value();
    case bool_state: return other.is != none && bool_value() == other.convert(bool_state).bool_value();
    case double_state: return other.is != none && double_value() == other.convert(double_state).double_value();
    case vector_state: return other.is == vector_state && vector_value() == other.vector_value();
    case map_state: return other.is == map_state && map_value() == other.map_value();
    case none: break;
  }
  return other.is == none;
}
