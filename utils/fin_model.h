#ifndef fin_MODEL_H
#define fin_MODEL_H

#include "fin_lazy_ptr.h"
#include "fin_variant.h"
#include <map>
#include <stdexcept>
#include <type_traits>

class fin_model;

class fin_property_i
{
protected:
  fin_model* parent;
  fin_string name;
  finv_map metadata;
public:
  fin_property_i(fin_model* parent, const fin_string &name, const finv_map& meta = finv_map());
  fin_property_i(const fin_property_i&) = delete;
  virtual ~fin_property_i() = default;

  fin_string prop_name() const { return name; }
  const finv_map& get_meta() const { return metadata; }

  // Expected variant type of this property
  virtual fin_variant::state get_variant_type() const = 0;

  // Non-const access - creates the entry if missing
  fin_variant& access();

  // Const access - nullptr if the entry was never written
  const fin_variant* const_access() const;

  bool is_null() const;
};

template <typename type>
class fin_property : public fin_property_i
{
  fin_variant::state variant_type;
public:
  fin_property(fin_model* parent, const fin_string &name, const finv_map& meta = finv_map())
    : fin_property_i(parent, name, meta)
    , variant_type(finv_detect_state(type()))
  {
  }

  fin_variant::state get_variant_type() const override
  {
    return variant_type;
  }

  // Creates a default value if null, converts if stored with another type
  type &value()
  {
    fin_variant& data = this->access();
    if (data.in_state() != variant_type)
    {
      data = data.convert(variant_type);
    }
    return *data.template cast_content<type>();
  }

  // Unset properties read as the default value
  const type &value() const
  {
    const fin_variant* data = this->const_access();
    if (data == nullptr || data->is_null())
    {
      static const type empty{};
      return empty;
    }
    if (data->in_state() != variant_type)
    {
      return const_cast<fin_variant*>(data)->template to<type>();
    }
    return *data->template cast_content<type>();
  }

  type &operator*() { return value(); }
  type *operator->() { return &value(); }
  const type &operator*() const { return value(); }
  const type *operator->() const { return &value(); }

  fin_property& operator=(const type &new_value)
  {
    value() = new_value;
    return *this;
  }

  // Copies the value, never the binding
  fin_property& operator=(const fin_property &other)
  {
    if (this != &other)
    {
      value() = other.value();
    }
    return *this;
  }

  bool operator==(const type &other) const
  {
    if (is_null()) return false;
    return value() == other;
  }

  template<typename T = type>
  typename std::enable_if<std::is_same<T, long long>::value, bool>::type
  operator==(int other) const
  {
    if (is_null()) return false;
    return value() == static_cast<long long>(other);
  }

  bool operator!=(const type &other) const
  {
    return !(*this == other);
  }

  template<typename T = type>
  typename std::enable_if<std::is_same<T, long long>::value, bool>::type
  operator!=(int other) const
  {
    return !(*this == other);
  }

  operator type&() { return value(); }
  operator const type&() const { return value(); }
};

// Record backed by a variant map. Properties are views into that map, so a
// model is bound to its storage and never copied; use assign() to copy data.
class fin_model : public fin_lazy_ptr<finv_map>
{
  std::map<fin_string, fin_property_i*> props;
public:
  fin_model() = default;
  fin_model(const fin_model&) = delete;
  fin_model& operator=(const fin_model&) = delete;
  virtual ~fin_model() = default;

  void add_prop(fin_property_i* prop, const fin_string &name);
  const std::map<fin_string, fin_property_i*>& get_properties() const { return props; }

  fin_variant& operator[](const fin_string &key)
  {
    return (**this)[key];
  }

  const fin_variant* find(const fin_string &key) const;

  void clear()
  {
    (**this).clear();
  }

  // Replace this model's data with a copy of other's
  void assign(const fin_model &other);

  // Pull data from DB row - reads properties with {"column", "name"} metadata
  void read_row(const finv_map& row);
};

// List of models stored as a vector of maps. Either bound to a vector entry
// of an owning model (see finp_model_list) or owning its own vector.
// References returned by at() stay valid, but add_element()/push_back() may
// move the maps; the next at() re-points the cached model.
template <typename model>
class fin_model_list
{
  fin_model* owner;
  fin_string key;
  fin_lazy_ptr<finv_vector> own;
  mutable std::map<size_t, model> cache;

  finv_vector& storage()
  {
    if (owner != nullptr)
    {
      return (*owner)[key].to_vector();
    }
    return *own;
  }

  const finv_vector& storage() const
  {
    if (owner != nullptr)
    {
      const fin_variant* v = owner->find(key);
      if (v == nullptr || !v->is_vector())
      {
        static const finv_vector empty;
        return empty;
      }
      return v->vector_value();
    }
    const fin_lazy_ptr<finv_vector>& o = own;
    return *o;
  }

public:
  fin_model_list() : owner(nullptr) {}
  fin_model_list(fin_model* owner_model, const fin_string& name) : owner(owner_model), key(name) {}
  fin_model_list(const fin_model_list&) = delete;
  fin_model_list& operator=(const fin_model_list&) = delete;

  size_t size() const
  {
    return storage().size();
  }

  bool empty() const
  {
    return storage().empty();
  }

  // Add an empty element to the list
  void add_element()
  {
    storage().push_back(finv_map());
  }

  // Append a copy of the model's data
  void push_back(const model &m)
  {
    storage().push_back(fin_variant(*m));
  }

  model& at(size_t index)
  {
    finv_vector& vec = storage();
    if (index >= vec.size())
    {
      throw std::out_of_range("fin_model_list index out of range");
    }
    model& m = cache[index];
    m.set(&vec[index].to_map());
    return m;
  }

  const model& at(size_t index) const
  {
    const finv_vector& vec = storage();
    if (index >= vec.size())
    {
      throw std::out_of_range("fin_model_list index out of range");
    }
    model& m = cache[index];
    m.set(&const_cast<fin_variant&>(vec[index]).to_map());
    return m;
  }

  model& operator[](size_t index) { return at(index); }
  const model& operator[](size_t index) const { return at(index); }

  model& back()
  {
    return at(size() - 1);
  }

  void pop_back()
  {
    finv_vector& vec = storage();
    if (!vec.empty())
    {
      cache.erase(vec.size() - 1);
      vec.pop_back();
    }
  }

  void clear()
  {
    storage().clear();
    cache.clear();
  }

  // Pull data from DB row - adds new element and reads its data
  void read_row(const finv_map& row)
  {
    add_element();
    back().read_row(row);
  }
};

// Property macros with optional metadata
#define finp_int(name, ...) fin_property<finv_int> name = fin_property<finv_int>(this, #name, ##__VA_ARGS__)
#define finp_string(name, ...) fin_property<finv_string> name = fin_property<finv_string>(this, #name, ##__VA_ARGS__)
#define finp_bool(name, ...) fin_property<finv_bool> name = fin_property<finv_bool>(this, #name, ##__VA_ARGS__)
#define finp_double(name, ...) fin_property<finv_double> name = fin_property<finv_double>(this, #name, ##__VA_ARGS__)
#define finp_vector(name, ...) fin_property<finv_vector> name = fin_property<finv_vector>(this, #name, ##__VA_ARGS__)
#define finp_map(name, ...) fin_property<finv_map> name = fin_property<finv_map>(this, #name, ##__VA_ARGS__)
#define finp_model_list(name, model_type) \
  fin_model_list<model_type> name = fin_model_list<model_type>(this, #name)

#endif // fin_MODEL_H
