#ifndef dcx_MODEL_H
#define dcx_MODEL_H

#include "dcx_lazy_ptr.h"
#include "dcx_variant.h"
#include <cstddef>
#include <type_traits>

// Exception for null field access in properties
class dcx_null_field_exception : public std::exception {
    dcx_string field_name;
    mutable dcx_string message;
public:
    dcx_null_field_exception(const dcx_string& name) : field_name(name) {}
    const char* what() const noexcept override {
        message = dcx_string("Access to null field: ") + field_name;
        return message.c_str();
    }
    const dcx_string& get_field_name() const { return field_name; }
};

class dcx_model;

/*
 * A named slot in the variant map of its parent model.
 * Properties live as members of their model: copying a model copies its
 * properties, and each copy binds to the model found at the same offset.
 * Never copy a property on its own.
 */
class dcx_property_i
{
protected:
  dcx_model* parent;
  dcx_string name;
  std::ptrdiff_t offset_in_parent;
public:
  dcx_property_i(dcx_model* parent, const dcx_string &name);
  dcx_property_i(const dcx_property_i& other);
  virtual ~dcx_property_i() = default;

  dcx_string prop_name() const { return name; }
  dcx_model* get_parent() const { return parent; }

  // Get the expected variant type for this property
  virtual dcx_variant::state get_variant_type() const = 0;

  // Non-const access - can create new values
  dcx_variant& access();

  // Const access - throws if the model or the field is null
  const dcx_variant& const_access() const;

  bool is_null() const;

  // Stores an explicit null, serialized as JSON null
  void set_null();
};

template <typename type>
class dcx_property : public dcx_property_i
{
  dcx_variant::state variant_type;
public:
  dcx_property(dcx_model* parent, const dcx_string &name)
    : dcx_property_i(parent, name)
  {
    dcx_variant v = type{};
    variant_type = v.in_state();
  }

  dcx_property(const dcx_property& other)
    : dcx_property_i(other)
    , variant_type(other.variant_type)
  {
  }

  dcx_property& operator=(const dcx_property& other)
  {
    if (this == &other)
    {
      return *this;
    }
    if (other.is_null())
    {
      set_null();
    }
    else
    {
      value() = other.value();
    }
    return *this;
  }

  virtual dcx_variant::state get_variant_type() const override {
    return variant_type;
  }

  // Non-const access - creates default value if null
  type &value()
  {
    dcx_variant& data = this->access();
    if (data.in_state() == dcx_variant::none) {
      data = type{};
    }
    return data.template to<type>();
  }

  // Const access - throws exception if null
  const type &value() const
  {
    const dcx_variant& data = this->const_access();
    if (data.in_state() == dcx_variant::none) {
      throw dcx_null_field_exception(prop_name());
    }
    if (data.in_state() != variant_type) {
      // stored with a convertible type, e.g. an integer read into a double field
      return const_cast<dcx_variant&>(data).template to<type>();
    }
    return *data.template cast_content<type>();
  }

  type &operator*() { return value(); }
  type *operator->() { return &value(); }

  const type &operator*() const { return value(); }
  const type *operator->() const { return &value(); }

  dcx_property& operator=(const type &new_value)
  {
    value() = new_value;
    return *this;
  }

  bool operator==(const type &other) const
  {
    if (is_null()) return false;
    return value() == other;
  }

  // Special int comparison for properties holding long long
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

// Base class for models: properties are views into one variant map
class dcx_model : public dcx_lazy_ptr<dcxv_map>
{
  std::map<dcx_string, dcx_property_i*> props;
public:
  dcx_model();
  virtual ~dcx_model() = default;

  // Deep copy of the data. Properties of derived classes register themselves.
  dcx_model(const dcx_model &other);
  dcx_model& operator=(const dcx_model &other);

  void add_prop(dcx_property_i* prop, const dcx_string &name);

  // Access to properties for introspection
  const std::map<dcx_string, dcx_property_i*>& get_properties() const { return props; }

  dcx_variant& operator[](const dcx_string &key)
  {
    return (**this)[key];
  }

  void clear()
  {
    (**this).clear();
  }

  // Pull values for registered properties out of a structured row.
  // Keys without a property are ignored; a value that cannot be converted
  // to the property type throws std::invalid_argument naming the key.
  void read_map(const dcxv_map& row);

  // Every property as a key, unset ones as null
  dcxv_map to_map() const;
};

// Property macros
#define dcxp_int(name) dcx_property<dcxv_int> name = dcx_property<dcxv_int>(this, #name)
#define dcxp_string(name) dcx_property<dcxv_string> name = dcx_property<dcxv_string>(this, #name)
#define dcxp_bool(name) dcx_property<dcxv_bool> name = dcx_property<dcxv_bool>(this, #name)
#define dcxp_double(name) dcx_property<dcxv_double> name = dcx_property<dcxv_double>(this, #name)
#define dcxp_vector(name) dcx_property<dcxv_vector> name = dcx_property<dcxv_vector>(this, #name)
#define dcxp_map(name) dcx_property<dcxv_map> name = dcx_property<dcxv_map>(this, #name)

#endif // dcx_MODEL_H
