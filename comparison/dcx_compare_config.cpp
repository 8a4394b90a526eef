#include "dcx_compare_config.h"
#include "../api/json/dcx_json.h"
#include <cstdlib>
#include <iostream>

namespace {

  struct env_binding {
    const char* variable;
    const char* key;
  };

  const env_binding env_bindings[] = {
    {"DCX_PHASH_THRESHOLD", "phash_threshold"},
    {"DCX_POSITION_WEIGHT", "position_weight"},
    {"DCX_HASH_SIZE", "hash_size"},
    {"DCX_PIXEL_THRESHOLD", "pixel_threshold"},
    {"DCX_MIN_REGION_AREA", "min_region_area"},
    {"DCX_MAX_WORKERS", "max_workers"},
    {"DCX_RENDER_DPI", "render_dpi"},
  };

  void require(bool condition, const char* message) {
    if (!condition) {
      throw std::invalid_argument(message);
    }
  }

}

int dcx_compare_config::apply_env()
{
  int applied = 0;
  for (const env_binding& binding : env_bindings) {
    const char* raw = std::getenv(binding.variable);
    if (raw == nullptr) {
      continue;
    }

    dcx_property_i* prop = get_properties().at(binding.key);
    dcx_variant value = dcx_string(raw).trim();
    if (!value.converts_to(prop->get_variant_type())) {
      std::cerr << "[config] Ignoring " << binding.variable << "='" << raw
                << "': not a number" << std::endl;
      continue;
    }
    prop->access() = value.convert(prop->get_variant_type());
    ++applied;
  }
  return applied;
}

bool dcx_compare_config::load_json(const dcx_string& path)
{
  dcxv_map values;
  dcx_json json(&values);
  if (!json.read_file(path)) {
    return false;
  }

  for (const auto& entry : values) {
    if (get_properties().find(entry.first) == get_properties().end()) {
      std::cerr << "[config] Ignoring unknown key '" << entry.first.c_str() << "'" << std::endl;
    }
  }

  try {
    read_map(values);
  } catch (const std::invalid_argument& e) {
    std::cerr << "[config] " << path.c_str() << ": " << e.what() << std::endl;
    return false;
  }
  return true;
}

void dcx_compare_config::validate() const
{
  for (const auto& prop : get_properties()) {
    if (prop.second->is_null()) {
      throw std::invalid_argument(("Configuration value missing: " + prop.first).c_str());
    }
  }

  require(*phash_threshold >= 0, "phash_threshold must not be negative");
  require(*position_weight >= 0.0, "position_weight must not be negative");
  require(*hash_size >= 2, "hash_size must be at least 2");
  require(*pixel_threshold >= 0 && *pixel_threshold <= 255, "pixel_threshold must be within 0-255");
  require(*min_region_area >= 0, "min_region_area must not be negative");
  require(*highlight_r >= 0 && *highlight_r <= 255, "highlight_r must be within 0-255");
  require(*highlight_g >= 0 && *highlight_g <= 255, "highlight_g must be within 0-255");
  require(*highlight_b >= 0 && *highlight_b <= 255, "highlight_b must be within 0-255");
  require(*highlight_alpha >= 0.0 && *highlight_alpha <= 1.0, "highlight_alpha must be within 0-1");
  require(*max_workers >= 1, "max_workers must be at least 1");
  require(*thumbnail_width >= 1 && *thumbnail_height >= 1, "thumbnail size must be positive");
  require(*render_dpi >= 1, "render_dpi must be positive");
}
