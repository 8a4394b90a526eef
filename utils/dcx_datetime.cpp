#include "dcx_datetime.h"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

dcx_string dcx_iso_timestamp(const std::chrono::system_clock::time_point& tp)
{
  std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::localtime(&time_t_val);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  return oss.str();
}

dcx_string dcx_iso_now()
{
  return dcx_iso_timestamp(std::chrono::system_clock::now());
}

bool dcx_is_iso_timestamp(const dcx_string& text)
{
  // YYYY-MM-DDTHH:MM:SS
  const std::string& s = text.to_std_const();
  const char* pattern = "dddd-dd-ddTdd:dd:dd";
  const size_t length = 19;
  if (s.size() < length) {
    return false;
  }
  for (size_t i = 0; i < length; ++i) {
    if (pattern[i] == 'd') {
      if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
        return false;
      }
    } else if (s[i] != pattern[i]) {
      return false;
    }
  }
  if (s.size() == length) {
    return true;
  }
  if (s[length] != '.' || s.size() == length + 1) {
    return false;
  }
  for (size_t i = length + 1; i < s.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
  }
  return true;
}
