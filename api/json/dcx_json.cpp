#include "dcx_json.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>

namespace {

  dcx_variant nlohmann_to_dcx(const nlohmann::json& j_val) {
    if (j_val.is_null()) {
      return dcx_variant();
    }
    if (j_val.is_boolean()) {
      return dcx_variant(j_val.get<bool>());
    }
    if (j_val.is_number_unsigned()) {
      unsigned long long u_val = j_val.get<unsigned long long>();
      if (u_val > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        std::cerr << "[json] Unsigned number " << u_val << " too large, converting to double" << std::endl;
        return dcx_variant(static_cast<double>(u_val));
      }
      return dcx_variant(static_cast<long long>(u_val));
    }
    if (j_val.is_number_integer()) {
      return dcx_variant(j_val.get<long long>());
    }
    if (j_val.is_number_float()) {
      return dcx_variant(j_val.get<double>());
    }
    if (j_val.is_string()) {
      return dcx_variant(dcx_string(j_val.get<std::string>()));
    }
    if (j_val.is_array()) {
      dcxv_vector vec;
      vec.reserve(j_val.size());
      for (const auto& el : j_val) {
        vec.push_back(nlohmann_to_dcx(el));
      }
      return dcx_variant(vec);
    }
    if (j_val.is_object()) {
      dcxv_map map_val;
      for (auto it = j_val.begin(); it != j_val.end(); ++it) {
        map_val[dcx_string(it.key())] = nlohmann_to_dcx(it.value());
      }
      return dcx_variant(map_val);
    }
    // binary and discarded values have no variant form
    std::cerr << "[json] Unsupported JSON value type, using null" << std::endl;
    return dcx_variant();
  }

  nlohmann::json dcx_to_nlohmann(const dcx_variant& var) {
    switch (var.in_state()) {
      case dcx_variant::string_state:
        return var.string_value().to_std_const();
      case dcx_variant::int_state:
        return var.int_value();
      case dcx_variant::bool_state:
        return var.bool_value();
      case dcx_variant::double_state:
        return var.double_value();
      case dcx_variant::vector_state: {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& el : var.vector_value()) {
          arr.push_back(dcx_to_nlohmann(el));
        }
        return arr;
      }
      case dcx_variant::map_state: {
        nlohmann::json obj = nlohmann::json::object();
        for (const auto& pair : var.map_value()) {
          obj[pair.first.to_std_const()] = dcx_to_nlohmann(pair.second);
        }
        return obj;
      }
      case dcx_variant::none:
      default:
        return nullptr;
    }
  }

}

dcx_json::dcx_json(dcxv_map* map_ptr) : data_map(map_ptr) {
  if (!data_map) {
    throw std::invalid_argument("dcx_json requires a map");
  }
}

bool dcx_json::parse(const dcx_string& json_string) {
  data_map->clear();

  try {
    nlohmann::json parsed_json = nlohmann::json::parse(json_string.to_std_const());

    if (!parsed_json.is_object()) {
      std::cerr << "[json] Top level value is not an object" << std::endl;
      return false;
    }
    for (auto it = parsed_json.begin(); it != parsed_json.end(); ++it) {
      (*data_map)[dcx_string(it.key())] = nlohmann_to_dcx(it.value());
    }
    return true;

  } catch (const nlohmann::json::parse_error& e) {
    std::cerr << "[json] Parse error: " << e.what()
              << " at byte " << e.byte << std::endl;
    return false;
  }
}

dcx_string dcx_json::create(int indent) const {
  nlohmann::json j_obj = nlohmann::json::object();
  for (const auto& pair : *data_map) {
    j_obj[pair.first.to_std_const()] = dcx_to_nlohmann(pair.second);
  }

  try {
    return dcx_string(j_obj.dump(indent));
  } catch (const nlohmann::json::type_error& e) {
    // invalid UTF-8 in a string value
    std::cerr << "[json] Dump error: " << e.what() << std::endl;
    return dcx_string("");
  }
}

bool dcx_json::read_file(const dcx_string& path) {
  std::ifstream f(path.c_str(), std::ios::in | std::ios::binary);
  if (!f.is_open()) {
    std::cerr << "[json] Cannot open " << path.c_str() << std::endl;
    return false;
  }
  std::string data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  return parse(dcx_string(data));
}

bool dcx_json::write_file(const dcx_string& path, int indent) const {
  dcx_string text = create(indent);
  if (text.empty()) {
    return false;
  }
  std::ofstream f(path.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
  if (!f.is_open()) {
    std::cerr << "[json] Cannot write " << path.c_str() << std::endl;
    return false;
  }
  f << text.c_str() << "\n";
  return f.good();
}
