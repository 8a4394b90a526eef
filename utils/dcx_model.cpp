#include "dcx_model.h"

dcx_property_i::dcx_property_i(dcx_model *parent, const dcx_string &name)
  : parent(parent), name(name),
    offset_in_parent(reinterpret_cast<char*>(this) - reinterpret_cast<char*>(parent))
{
  parent->add_prop(this, this->name);
}

dcx_property_i::dcx_property_i(const dcx_property_i &other)
  : parent(reinterpret_cast<dcx_model*>(reinterpret_cast<char*>(this) - other.offset_in_parent)),
    name(other.name),
    offset_in_parent(other.offset_in_parent)
{
  parent->add_prop(this, name);
}

dcx_variant &dcx_property_i::access()
{
  return (**parent)[name];
}

const dcx_variant &dcx_property_i::const_access() const
{
  const dcx_model& model = *parent;
  const dcxv_map& data = *model;
  dcxv_map::const_iterator it = data.find(name);
  if (it == data.end()) {
    throw dcx_null_field_exception(name);
  }
  return it->second;
}

bool dcx_property_i::is_null() const
{
  try {
    return const_access().in_state() == dcx_variant::none;
  } catch(const dcx_null_access_exception&) {
    // Parent object itself is null
    return true;
  } catch(const dcx_null_field_exception&) {
    return true;
  }
}

void dcx_property_i::set_null()
{
  access() = dcx_variant();
}


dcx_model::dcx_model()
{
}

dcx_model::dcx_model(const dcx_model &other)
  : dcx_lazy_ptr<dcxv_map>()
  , props()
{
  if (!other.is_null()) {
    **this = *other;
  }
}

dcx_model &dcx_model::operator=(const dcx_model &other)
{
  if (this == &other) {
    return *this;
  }
  if (other.is_null()) {
    reset();
  } else {
    **this = *other;
  }
  return *this;
}

void dcx_model::add_prop(dcx_property_i *prop, const dcx_string &name)
{
  props[name] = prop;
}

void dcx_model::read_map(const dcxv_map& row)
{
  for (const auto& prop_pair : props) {
    dcxv_map::const_iterator it = row.find(prop_pair.first);
    if (it == row.end()) {
      continue;
    }

    const dcx_variant& value = it->second;
    dcx_property_i* prop = prop_pair.second;
    if (value.is_null()) {
      prop->set_null();
      continue;
    }
    if (!value.converts_to(prop->get_variant_type())) {
      throw std::invalid_argument(("Cannot convert value of '" + prop_pair.first + "'").c_str());
    }
    prop->access() = value.convert(prop->get_variant_type());
  }
}

dcxv_map dcx_model::to_map() const
{
  dcxv_map out;
  for (const auto& prop_pair : props) {
    if (prop_pair.second->is_null()) {
      out[prop_pair.first] = dcx_variant();
    } else {
      out[prop_pair.first] = prop_pair.second->const_access();
    }
  }
  return out;
}
