#include "dcx_session.h"
#include "dcx_compare_exceptions.h"
#include "../api/json/dcx_json.h"
#include "../utils/dcx_datetime.h"
#include <filesystem>
#include <iostream>

const char* const dcx_session::current_version = "1.0";

namespace {

  // Returns false for a missing or null key
  bool read_string(const dcxv_map& values, const char* key, dcx_string& out) {
    dcxv_map::const_iterator it = values.find(key);
    if (it == values.end() || it->second.is_null()) {
      return false;
    }
    if (!it->second.is_string()) {
      throw dcx_invalid_session_error(dcx_string("'") + key + "' must be a string");
    }
    out = it->second.string_value();
    return true;
  }

  dcx_string read_timestamp(const dcxv_map& values, const char* key) {
    dcx_string text;
    if (!read_string(values, key, text)) {
      return dcx_iso_now();
    }
    if (!dcx_is_iso_timestamp(text)) {
      throw dcx_invalid_session_error(dcx_string("'") + key + "' is not an ISO 8601 timestamp: " + text);
    }
    return text;
  }

}

dcx_session::dcx_session()
  : has_matching(false)
{
  version = current_version;
  left_document_path.set_null();
  right_document_path.set_null();
  dcx_string now = dcx_iso_now();
  created_at = now;
  modified_at = now;
  notes = "";
}

bool dcx_session::has_documents() const
{
  return !left_document_path.is_null() && !right_document_path.is_null() &&
         !(*left_document_path).empty() && !(*right_document_path).empty();
}

void dcx_session::set_matching_result(const dcx_matching_result& result)
{
  matching = result;
  has_matching = true;
}

void dcx_session::clear_matching_result()
{
  matching = dcx_matching_result();
  has_matching = false;
}

void dcx_session::clear_session()
{
  left_document_path.set_null();
  right_document_path.set_null();
  clear_matching_result();
  zones.clear();
  notes = "";
  touch();
}

void dcx_session::touch()
{
  modified_at = dcx_iso_now();
}

dcxv_map dcx_session::to_session_map() const
{
  dcxv_map out = to_map();
  out["matching_result"] = has_matching ? dcx_variant(matching.to_map()) : dcx_variant();
  out["exclusion_zones"] = zones.to_map();
  return out;
}

dcx_session dcx_session::from_session_map(const dcxv_map& values)
{
  dcx_session session;

  dcx_string text;
  if (read_string(values, "version", text)) {
    session.version = text;
  }
  if (read_string(values, "left_document_path", text)) {
    session.left_document_path = text;
  }
  if (read_string(values, "right_document_path", text)) {
    session.right_document_path = text;
  }
  if (read_string(values, "notes", text)) {
    session.notes = text;
  }
  session.created_at = read_timestamp(values, "created_at");
  session.modified_at = read_timestamp(values, "modified_at");

  dcxv_map::const_iterator it = values.find("matching_result");
  if (it != values.end() && !it->second.is_null()) {
    if (!it->second.is_map()) {
      throw dcx_invalid_session_error("'matching_result' must be an object or null");
    }
    session.set_matching_result(dcx_matching_result::from_map(it->second.map_value()));
  }

  it = values.find("exclusion_zones");
  if (it != values.end() && !it->second.is_null()) {
    if (!it->second.is_map()) {
      throw dcx_invalid_session_error("'exclusion_zones' must be an object");
    }
    try {
      session.zones = dcx_exclusion_zone_set::from_map(it->second.map_value());
    } catch (const dcx_invalid_zone_error& e) {
      throw dcx_invalid_session_error(dcx_string("Invalid exclusion zone: ") + e.what());
    }
  }

  return session;
}

bool dcx_session::save(const dcx_string& path)
{
  std::filesystem::path file(path.to_std_const());
  if (file.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(file.parent_path(), ec);
    if (ec) {
      std::cerr << "[session] Cannot create " << file.parent_path().string() << ": " << ec.message() << std::endl;
      return false;
    }
  }

  touch();
  dcxv_map data = to_session_map();
  dcx_json json(&data);
  if (!json.write_file(path, 2)) {
    std::cerr << "[session] Failed to save " << path.c_str() << std::endl;
    return false;
  }
  std::cout << "[session] Saved " << path.c_str() << std::endl;
  return true;
}

dcx_session dcx_session::load(const dcx_string& path)
{
  if (!std::filesystem::exists(path.to_std_const())) {
    throw dcx_invalid_session_error("Session file not found: " + path);
  }

  dcxv_map data;
  dcx_json json(&data);
  if (!json.read_file(path)) {
    throw dcx_invalid_session_error("Session file is not a JSON object: " + path);
  }
  return from_session_map(data);
}
