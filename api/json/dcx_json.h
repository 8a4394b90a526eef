#ifndef DCX_JSON_H
#define DCX_JSON_H

#include "../../utils/dcx_variant.h"

/*
 * JSON text form of a dcxv_map.
 * The map is owned by the caller and must outlive this object.
 */
class dcx_json {
public:
  explicit dcx_json(dcxv_map* map_ptr);

  /**
   * @brief Parses a JSON object into the associated map.
   * @return false if the text is not valid JSON or its top level is not an object.
   * @note The map is cleared first.
   */
  bool parse(const dcx_string& json_string);

  /**
   * @brief Serializes the associated map.
   * @param indent -1 for compact output, otherwise spaces per level.
   */
  dcx_string create(int indent = -1) const;

  // File helpers; errors are reported on std::cerr
  bool read_file(const dcx_string& path);
  bool write_file(const dcx_string& path, int indent = 2) const;

private:
  dcxv_map* data_map;
};

#endif // DCX_JSON_H
