#include "dcx_exclusion_zone.h"
#include "../dcx_compare_exceptions.h"
#include <cmath>

namespace {

  void check_unit_range(const char* field, double value) {
    if (!(value >= 0.0 && value <= 1.0)) {
      throw dcx_invalid_zone_error(field, value);
    }
  }

  double number_or_throw(const dcxv_map& values, const char* key) {
    dcxv_map::const_iterator it = values.find(key);
    if (it == values.end() || it->second.is_null() ||
        !it->second.converts_to(dcx_variant::double_state) || it->second.is_string()) {
      throw dcx_invalid_zone_error(key, dcx_string("missing or not a number"));
    }
    return it->second.convert(dcx_variant::double_state).double_value();
  }

  struct zone_preset {
    const char* key;
    const char* label;
    double x, y, width, height;
  };

  const zone_preset presets[] = {
    {"page_number_bottom", "Page Number (Bottom)", 0.4, 0.95, 0.2, 0.05},
    {"page_number_bottom_right", "Page Number (Bottom Right)", 0.85, 0.95, 0.15, 0.05},
    {"header", "Header", 0.0, 0.0, 1.0, 0.08},
    {"footer", "Footer", 0.0, 0.92, 1.0, 0.08},
    {"slide_number", "Slide Number", 0.9, 0.93, 0.1, 0.07},
  };

}

dcx_exclusion_zone::dcx_exclusion_zone(double x, double y, double width, double height,
                                       const dcx_string& name, side applies, bool enabled)
{
  this->x = x;
  this->y = y;
  this->width = width;
  this->height = height;
  this->name = name;
  this->applies_to = side_to_string(applies);
  this->enabled = enabled;
  validate();
}

dcx_exclusion_zone dcx_exclusion_zone::from_pixels(int px, int py, int pw, int ph,
                                                   int page_width, int page_height,
                                                   const dcx_string& name, side applies)
{
  if (page_width <= 0 || page_height <= 0) {
    throw std::invalid_argument("Page size must be positive");
  }
  return dcx_exclusion_zone(static_cast<double>(px) / page_width,
                            static_cast<double>(py) / page_height,
                            static_cast<double>(pw) / page_width,
                            static_cast<double>(ph) / page_height,
                            name, applies);
}

dcx_exclusion_zone::side dcx_exclusion_zone::target() const
{
  return side_from_string(*applies_to);
}

void dcx_exclusion_zone::set_target(side applies)
{
  applies_to = side_to_string(applies);
}

bool dcx_exclusion_zone::applies_to_side(side s) const
{
  if (!*enabled) {
    return false;
  }
  side t = target();
  return t == both || t == s;
}

cv::Rect dcx_exclusion_zone::to_pixel_rect(int page_width, int page_height) const
{
  return cv::Rect(static_cast<int>(*x * page_width),
                  static_cast<int>(*y * page_height),
                  static_cast<int>(*width * page_width),
                  static_cast<int>(*height * page_height));
}

cv::Vec4i dcx_exclusion_zone::to_rect(int page_width, int page_height) const
{
  cv::Rect r = to_pixel_rect(page_width, page_height);
  return cv::Vec4i(r.x, r.y, r.x + r.width, r.y + r.height);
}

void dcx_exclusion_zone::validate() const
{
  check_unit_range("x", *x);
  check_unit_range("y", *y);
  check_unit_range("width", *width);
  check_unit_range("height", *height);
  side_from_string(*applies_to);
}

dcx_exclusion_zone dcx_exclusion_zone::from_map(const dcxv_map& values)
{
  dcx_string zone_name = "";
  side applies = both;
  bool is_enabled = true;

  dcxv_map::const_iterator it = values.find("name");
  if (it != values.end() && !it->second.is_null()) {
    zone_name = it->second.convert(dcx_variant::string_state).string_value();
  }
  it = values.find("applies_to");
  if (it != values.end() && !it->second.is_null()) {
    applies = side_from_string(it->second.convert(dcx_variant::string_state).string_value());
  }
  it = values.find("enabled");
  if (it != values.end() && !it->second.is_null()) {
    if (!it->second.converts_to(dcx_variant::bool_state)) {
      throw dcx_invalid_zone_error("enabled", dcx_string("not a boolean"));
    }
    is_enabled = it->second.convert(dcx_variant::bool_state).bool_value();
  }

  return dcx_exclusion_zone(number_or_throw(values, "x"), number_or_throw(values, "y"),
                            number_or_throw(values, "width"), number_or_throw(values, "height"),
                            zone_name, applies, is_enabled);
}

dcx_string dcx_exclusion_zone::side_to_string(side s)
{
  switch (s) {
    case left: return "left";
    case right: return "right";
    case both:
    default: return "both";
  }
}

dcx_exclusion_zone::side dcx_exclusion_zone::side_from_string(const dcx_string& text)
{
  dcx_string lower = text.lower();
  if (lower == "left") return left;
  if (lower == "right") return right;
  if (lower == "both") return both;
  throw dcx_invalid_zone_error("applies_to", text);
}

// ============================================================================
// Zone set
// ============================================================================

bool dcx_exclusion_zone_set::remove(size_t index)
{
  if (index >= zones.size()) {
    return false;
  }
  zones.erase(zones.begin() + static_cast<std::ptrdiff_t>(index));
  return true;
}

void dcx_exclusion_zone_set::add(const dcx_exclusion_zone& zone)
{
  zone.validate();
  zones.push_back(zone);
}

std::vector<dcx_exclusion_zone> dcx_exclusion_zone_set::zones_for(dcx_exclusion_zone::side s) const
{
  std::vector<dcx_exclusion_zone> result;
  for (const dcx_exclusion_zone& zone : zones) {
    if (zone.applies_to_side(s)) {
      result.push_back(zone);
    }
  }
  return result;
}

dcxv_map dcx_exclusion_zone_set::to_map() const
{
  dcxv_vector list;
  for (const dcx_exclusion_zone& zone : zones) {
    list.push_back(zone.to_map());
  }
  dcxv_map out;
  out["zones"] = list;
  return out;
}

dcx_exclusion_zone_set dcx_exclusion_zone_set::from_map(const dcxv_map& values)
{
  dcx_exclusion_zone_set set;
  dcxv_map::const_iterator it = values.find("zones");
  if (it == values.end() || it->second.is_null()) {
    return set;
  }
  if (!it->second.is_vector()) {
    throw dcx_invalid_session_error("'zones' must be a list");
  }
  for (const dcx_variant& entry : it->second.vector_value()) {
    if (!entry.is_map()) {
      throw dcx_invalid_session_error("Exclusion zone entry must be an object");
    }
    set.add(dcx_exclusion_zone::from_map(entry.map_value()));
  }
  return set;
}

dcx_exclusion_zone dcx_exclusion_zone_set::preset(const dcx_string& preset_name)
{
  for (const zone_preset& p : presets) {
    if (preset_name == p.key) {
      return dcx_exclusion_zone(p.x, p.y, p.width, p.height, p.label);
    }
  }
  throw std::invalid_argument(("Unknown exclusion zone preset: " + preset_name).c_str());
}

std::vector<dcx_string> dcx_exclusion_zone_set::preset_names()
{
  std::vector<dcx_string> names;
  for (const zone_preset& p : presets) {
    names.push_back(p.key);
  }
  return names;
}
