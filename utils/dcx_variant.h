#ifndef dcx_VARIANT_H
#define dcx_VARIANT_H

#include "dcx_string.h"
#include <map>
#include <vector>

class dcx_variant;

typedef std::vector<dcx_variant> dcxv_vector;
typedef std::map<dcx_string, dcx_variant> dcxv_map;

#define dcxv_string dcx_string
#define dcxv_int long long
#define dcxv_bool bool
#define dcxv_double double

/*
 * Tagged value for structured data: what sessions, cache metadata and
 * config files look like once parsed. Scalars convert between each other
 * where the text or number allows it; vectors and maps never convert.
 */
class dcx_variant
{
public:
  enum state { none, string_state, int_state, bool_state, double_state, vector_state, map_state };

private:
  void* content;
  state is;

  void release();
  void adopt(dcx_variant& other);
  void copy_from(const dcx_variant& other);

public:
  dcx_variant();
  dcx_variant(const char* from_string);
  dcx_variant(const dcx_string& from_string);
  dcx_variant(int from_int);
  dcx_variant(long long from_int);
  dcx_variant(bool from_bool);
  dcx_variant(double from_double);
  dcx_variant(const dcxv_vector& from_vector);
  dcx_variant(const dcxv_map& from_map);
  dcx_variant(const dcx_variant& other);
  dcx_variant(dcx_variant&& other) noexcept;
  ~dcx_variant();

  dcx_variant& operator=(const dcx_variant& other);
  dcx_variant& operator=(dcx_variant&& other) noexcept;

  // Unchecked; callers test the state first
  template<typename type>
  type* cast_content() const { return static_cast<type*>(content); }

  // Converts in place when the state differs
  template<typename type>
  type& to()
  {
    state target = dcx_variant(type{}).in_state();
    if (is != target) {
      *this = convert(target);
    }
    return *cast_content<type>();
  }

  state in_state() const { return is; }
  bool is_null() const { return is == none; }
  bool is_string() const { return is == string_state; }
  bool is_int() const { return is == int_state; }
  bool is_bool() const { return is == bool_state; }
  bool is_double() const { return is == double_state; }
  bool is_vector() const { return is == vector_state; }
  bool is_map() const { return is == map_state; }

  const dcx_string& string_value() const { return *cast_content<dcx_string>(); }
  const long long& int_value() const { return *cast_content<long long>(); }
  const bool& bool_value() const { return *cast_content<bool>(); }
  const double& double_value() const { return *cast_content<double>(); }
  const dcxv_vector& vector_value() const { return *cast_content<dcxv_vector>(); }
  const dcxv_map& map_value() const { return *cast_content<dcxv_map>(); }

  bool converts_to(state target) const;

  // Default value of the target state when no conversion applies
  dcx_variant convert(state target) const;

  // Scalars compare after conversion, so 1 == 1.0 == "1"
  bool operator==(const dcx_variant& other) const;
  bool operator!=(const dcx_variant& other) const { return !(*this == other); }
};

#endif // dcx_VARIANT_H
