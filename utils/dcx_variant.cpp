#include "dcx_variant.h"

namespace {

  bool is_bool_text(const dcx_string& text) {
    dcx_string lower = text.lower();
    return lower == "true" || lower == "false" || text.is_integer();
  }

  dcx_variant default_of(dcx_variant::state s) {
    switch (s) {
      case dcx_variant::string_state: return dcx_variant(dcx_string(""));
      case dcx_variant::int_state:    return dcx_variant(0LL);
      case dcx_variant::bool_state:   return dcx_variant(false);
      case dcx_variant::double_state: return dcx_variant(0.0);
      case dcx_variant::vector_state: return dcx_variant(dcxv_vector());
      case dcx_variant::map_state:    return dcx_variant(dcxv_map());
      case dcx_variant::none:         break;
    }
    return dcx_variant();
  }

}

dcx_variant::dcx_variant() : content(nullptr), is(none) {}
dcx_variant::dcx_variant(const char* from_string) : content(new dcx_string(from_string)), is(string_state) {}
dcx_variant::dcx_variant(const dcx_string& from_string) : content(new dcx_string(from_string)), is(string_state) {}
dcx_variant::dcx_variant(int from_int) : content(new long long(from_int)), is(int_state) {}
dcx_variant::dcx_variant(long long from_int) : content(new long long(from_int)), is(int_state) {}
dcx_variant::dcx_variant(bool from_bool) : content(new bool(from_bool)), is(bool_state) {}
dcx_variant::dcx_variant(double from_double) : content(new double(from_double)), is(double_state) {}
dcx_variant::dcx_variant(const dcxv_vector& from_vector) : content(new dcxv_vector(from_vector)), is(vector_state) {}
dcx_variant::dcx_variant(const dcxv_map& from_map) : content(new dcxv_map(from_map)), is(map_state) {}

dcx_variant::dcx_variant(const dcx_variant& other) : content(nullptr), is(none)
{
  copy_from(other);
}

dcx_variant::dcx_variant(dcx_variant&& other) noexcept : content(nullptr), is(none)
{
  adopt(other);
}

dcx_variant::~dcx_variant()
{
  release();
}

dcx_variant& dcx_variant::operator=(const dcx_variant& other)
{
  if (this != &other) {
    // other may live inside our own vector or map
    dcx_variant copy(other);
    release();
    adopt(copy);
  }
  return *this;
}

dcx_variant& dcx_variant::operator=(dcx_variant&& other) noexcept
{
  if (this != &other) {
    release();
    adopt(other);
  }
  return *this;
}

void dcx_variant::release()
{
  switch (is) {
    case string_state: delete cast_content<dcx_string>(); break;
    case int_state:    delete cast_content<long long>(); break;
    case bool_state:   delete cast_content<bool>(); break;
    case double_state: delete cast_content<double>(); break;
    case vector_state: delete cast_content<dcxv_vector>(); break;
    case map_state:    delete cast_content<dcxv_map>(); break;
    case none:         break;
  }
  content = nullptr;
  is = none;
}

void dcx_variant::adopt(dcx_variant& other)
{
  content = other.content;
  is = other.is;
  other.content = nullptr;
  other.is = none;
}

void dcx_variant::copy_from(const dcx_variant& other)
{
  switch (other.is) {
    case string_state: content = new dcx_string(other.string_value()); break;
    case int_state:    content = new long long(other.int_value()); break;
    case bool_state:   content = new bool(other.bool_value()); break;
    case double_state: content = new double(other.double_value()); break;
    case vector_state: content = new dcxv_vector(other.vector_value()); break;
    case map_state:    content = new dcxv_map(other.map_value()); break;
    case none:         content = nullptr; break;
  }
  is = other.is;
}

bool dcx_variant::converts_to(state target) const
{
  if (is == target) {
    return true;
  }
  switch (is) {
    case string_state:
      return (target == bool_state && is_bool_text(string_value())) ||
             (target == int_state && string_value().is_integer()) ||
             (target == double_state && string_value().is_double());
    case bool_state:
      return target == int_state || target == string_state;
    case int_state:
      return target == double_state || target == bool_state || target == string_state;
    case double_state:
      return target == int_state || target == string_state;
    default:
      return false;
  }
}

dcx_variant dcx_variant::convert(state target) const
{
  if (is == target) {
    return *this;
  }

  switch (is) {
    case string_state:
      if (target == int_state) {
        return dcx_variant(string_value().to_int(0));
      }
      if (target == bool_state) {
        return dcx_variant(string_value().lower() == "true" || string_value().to_int(0) != 0);
      }
      if (target == double_state) {
        return dcx_variant(string_value().to_double(0));
      }
      break;
    case bool_state:
      if (target == int_state) {
        return dcx_variant(bool_value() ? 1LL : 0LL);
      }
      if (target == string_state) {
        return dcx_variant(bool_value() ? "true" : "false");
      }
      break;
    case int_state:
      if (target == double_state) {
        return dcx_variant(static_cast<double>(int_value()));
      }
      if (target == bool_state) {
        return dcx_variant(int_value() != 0);
      }
      if (target == string_state) {
        return dcx_variant(dcx_string(int_value()));
      }
      break;
    case double_state:
      if (target == int_state) {
        return dcx_variant(static_cast<long long>(double_value()));
      }
      if (target == string_state) {
        return dcx_variant(dcx_string(double_value()));
      }
      break;
    default:
      break;
  }
  return default_of(target);
}

bool dcx_variant::operator==(const dcx_variant& other) const
{
  if (is == none || other.is == none) {
    return is == other.is;
  }

  switch (is) {
    case string_state:
      return other.converts_to(string_state) &&
             string_value() == other.convert(string_state).string_value();
    case int_state:
      if (other.is_double()) {
        return static_cast<double>(int_value()) == other.double_value();
      }
      return other.converts_to(int_state) && int_value() == other.convert(int_state).int_value();
    case bool_state:
      return other.converts_to(bool_state) && bool_value() == other.convert(bool_state).bool_value();
    case double_state:
      return other.converts_to(double_state) &&
             double_value() == other.convert(double_state).double_value();
    case vector_state:
      return other.is_vector() && vector_value() == other.vector_value();
    case map_state:
      return other.is_map() && map_value() == other.map_value();
    default:
      return false;
  }
}
