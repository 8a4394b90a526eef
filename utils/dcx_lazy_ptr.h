#ifndef dcx_LAZY_PTR_H
#define dcx_LAZY_PTR_H

#include <memory>
#include <stdexcept>

/*
 * Lazy pointer with on-demand creation.
 * Holds either an owned object (shared between copies) or a borrowed pointer.
 * Non-const access creates the object if null, const access throws.
 */

class dcx_null_access_exception : public std::exception {
public:
    const char* what() const noexcept override {
        return "Access to null lazy pointer in const context";
    }
};

template <typename object_type>
class dcx_lazy_ptr
{
  std::shared_ptr<object_type> owned;
  object_type *ptr;
public:
  dcx_lazy_ptr() : ptr(nullptr) {}
  dcx_lazy_ptr(object_type* ptr, bool managed=false) : ptr(ptr)
  {
    if (managed)
    {
      owned.reset(ptr);
    }
  }
  dcx_lazy_ptr(const dcx_lazy_ptr &other) = default;
  dcx_lazy_ptr &operator=(const dcx_lazy_ptr &other) = default;
  virtual ~dcx_lazy_ptr() = default;

  void reset()
  {
    owned.reset();
    ptr = nullptr;
  }

  // managed=true transfers ownership of ptr to this lazy pointer
  void set(object_type *ptr, bool managed=false)
  {
    if (ptr == this->ptr)
    {
      return;
    }
    reset();
    this->ptr = ptr;
    if (managed)
    {
      owned.reset(ptr);
    }
  }

  // Non-const access - creates object if null
  virtual object_type &operator*()
  {
    if (ptr == nullptr)
    {
      owned = std::make_shared<object_type>();
      ptr = owned.get();
      on_create();
    }
    return *ptr;
  }

  // Const access - throws exception if null
  virtual const object_type &operator*() const
  {
    if (ptr == nullptr)
    {
      throw dcx_null_access_exception();
    }
    return *ptr;
  }

  object_type* operator->()
  {
    return &*(*this);
  }

  const object_type* operator->() const
  {
    return &*(*this);
  }

  dcx_lazy_ptr &operator=(object_type *ptr)
  {
    set(ptr);
    return *this;
  }

  bool operator==(const dcx_lazy_ptr &other) const
  {
    return ptr == other.ptr;
  }

  // Safe null check - doesn't throw, doesn't create
  bool is_null() const { return ptr == nullptr; }

  // This is nullptr if never accessed
  object_type* getptr() const { return ptr; }

  virtual void on_create() {}
};

#endif // dcx_LAZY_PTR_H
