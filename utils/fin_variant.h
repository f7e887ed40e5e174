#ifndef fin_VARIANT_H
#define fin_VARIANT_H

#include "fin_string.h"
#include <map>

class fin_variant;

typedef std::vector<fin_variant> finv_vector;
typedef std::map<fin_string, fin_variant> finv_map;

#define finv_string fin_string
#define finv_int long long
#define finv_bool bool
#define finv_double double

#define finv_detect_state(value) fin_variant(value).in_state()

class fin_variant
{
public:
  enum state
  {
    none,
    string_state,
    int_state,
    bool_state,
    double_state,
    vector_state,
    map_state
  };

private:
  void* content;
  state is;

  void copy_from(const fin_variant &other);

public:
  template<typename to>
  to* cast_content() const
  {
    return static_cast<to*>(content);
  }
  void clear();
  void reset(state to);
  ~fin_variant();
  fin_variant();
  fin_variant(const char* from_string);
  fin_variant(const fin_string &from_string);
  fin_variant(int from_int);
  fin_variant(bool from_bool);
  fin_variant(long long from_int);
  fin_variant(unsigned long from_int);
  fin_variant(double from_double);
  fin_variant(const finv_vector &from_vector);
  fin_variant(const finv_map &from_map);
  fin_variant(const fin_variant &other);
  fin_variant(fin_variant &&other) noexcept;

  state in_state() const { return is; }
  bool is_null() const { return is == none; }
  bool is_string() const { return is == string_state; }
  bool is_int() const { return is == int_state; }
  bool is_bool() const { return is == bool_state; }
  bool is_double() const { return is == double_state; }
  bool is_vector() const { return is == vector_state; }
  bool is_map() const { return is == map_state; }

  // These convert in place when the state differs
  fin_string& to_string();
  long long& to_int();
  bool& to_bool();
  double& to_double();
  finv_vector& to_vector();
  finv_map& to_map();

  template<typename type>
  type &to()
  {
    state tstate = finv_detect_state(type());
    if (is != tstate)
    {
      *this = convert(tstate);
    }
    return *cast_content<type>();
  }

  // These should only be used after type check
  const fin_string& string_value() const;
  const long long& int_value() const;
  const bool& bool_value() const;
  const double& double_value() const;
  const finv_vector& vector_value() const;
  const finv_map& map_value() const;

  fin_variant convert(state to) const;

  fin_variant& operator=(const fin_variant &other);
  fin_variant& operator=(fin_variant &&other) noexcept;

  operator fin_string() const
  {
    return convert(string_state).to_string();
  }

  operator double() const
  {
    return convert(double_state).to_double();
  }

  operator long long() const
  {
    return convert(int_state).to_int();
  }

  operator bool() const
  {
    return convert(bool_state).to_bool();
  }

  bool operator==(const fin_variant &other) const;
  bool operator!=(const fin_variant& other) const
  {
    return !(*this == other);
  }
};

#endif // fin_VARIANT_H
