#ifndef fin_LAZY_PTR_H
#define fin_LAZY_PTR_H

/*
 * Lazy pointer with on-demand creation.
 * Holds either an owned object (created on first access or handed over with
 * owned=true) or a borrowed view into storage that lives elsewhere.
 * Not copyable: a view must be re-pointed explicitly with set().
 */

template <typename object_type>
class fin_lazy_ptr
{
  object_type *ptr;
  bool owned;
public:
  fin_lazy_ptr() : ptr(nullptr), owned(false) {}
  explicit fin_lazy_ptr(object_type* p, bool take_ownership = false) : ptr(p), owned(take_ownership) {}
  fin_lazy_ptr(const fin_lazy_ptr &) = delete;
  fin_lazy_ptr &operator=(const fin_lazy_ptr &) = delete;

  virtual ~fin_lazy_ptr()
  {
    reset();
  }

  void reset()
  {
    if (owned)
    {
      delete ptr;
    }
    ptr = nullptr;
    owned = false;
  }

  void set(object_type *p, bool take_ownership = false)
  {
    if (p == ptr)
    {
      return;
    }
    reset();
    ptr = p;
    owned = take_ownership;
  }

  // Non-const access - creates object if null
  virtual object_type &operator*()
  {
    if (ptr == nullptr)
    {
      ptr = new object_type;
      owned = true;
      on_create();
    }
    return *ptr;
  }

  // Const access - null reads as an empty object
  virtual const object_type &operator*() const
  {
    if (ptr == nullptr)
    {
      static const object_type empty{};
      return empty;
    }
    return *ptr;
  }

  object_type* operator->()
  {
    return &**this;
  }

  const object_type* operator->() const
  {
    return &**this;
  }

  // Safe null check - doesn't create
  bool is_null() const { return ptr == nullptr; }
  bool is_owned() const { return owned; }

  object_type* getptr() const { return ptr; }

  virtual void on_create() {}
};

#endif // fin_LAZY_PTR_H
