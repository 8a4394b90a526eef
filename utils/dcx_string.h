#ifndef dcx_STRING_H
#define dcx_STRING_H

#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>

// Wrapper around std::string to provide additional functionality
class dcx_string
{
  std::string str;
public:
  static const size_t npos = std::string::npos;
  dcx_string() : str() {}
  dcx_string(const char* s) : str(s) {}
  dcx_string(const char* s, size_t len) : str(s, len) {}
  dcx_string(const std::string& s) : str(s) {}

  // numbers
  dcx_string(int i) : str(std::to_string(i)) {}
  dcx_string(long i) : str(std::to_string(i)) {}
  dcx_string(long long i) : str(std::to_string(i)) {}
  dcx_string(unsigned long i) : str(std::to_string(i)) {}
  dcx_string(double d) : str(std::to_string(d)) {}
  // single char
  dcx_string(char c) : str(1, c) {}

  std::string& to_std() { return str; }
  const std::string& to_std_const() const { return str; }
  const char* c_str() const { return str.c_str(); }

  dcx_string operator+(const dcx_string& s) const { return str + s.str; }
  dcx_string operator+(const char* s) const { return str + s; }
  dcx_string& operator+=(const dcx_string& s) { str += s.str; return *this; }
  bool operator==(const dcx_string& s) const { return str == s.str; }
  bool operator!=(const dcx_string& s) const { return str != s.str; }
  bool operator<(const dcx_string& s) const { return str < s.str; }

  bool empty() const { return str.empty(); }
  size_t size() const { return str.size(); }
  size_t length() const { return str.length(); }
  void clear() { str.clear(); }

  char& operator[](size_t i) { return str[i]; }
  char operator[](size_t i) const { return str[i]; }

  dcx_string substr(size_t pos, size_t len = npos) const { return str.substr(pos, len); }

  long long to_int(long long def = 0) const
  {
    try
    {
      return std::stoll(str);
    }
    catch (const std::invalid_argument&)
    {
      return def;
    }
    catch (const std::out_of_range&)
    {
      return def;
    }
  }

  double to_double(double def = 0) const
  {
    try
    {
      return std::stod(str);
    }
    catch (const std::invalid_argument&)
    {
      return def;
    }
    catch (const std::out_of_range&)
    {
      return def;
    }
  }

  // Whole string must be an integer, "12abc" is not.
  bool is_integer() const
  {
    try
    {
      size_t used = 0;
      std::stoll(str, &used);
      return used == str.size();
    }
    catch (const std::invalid_argument&)
    {
      return false;
    }
    catch (const std::out_of_range&)
    {
      return false;
    }
  }

  bool is_double() const
  {
    try
    {
      size_t used = 0;
      std::stod(str, &used);
      return used == str.size();
    }
    catch (const std::invalid_argument&)
    {
      return false;
    }
    catch (const std::out_of_range&)
    {
      return false;
    }
  }

  size_t find(const dcx_string& s) const { return str.find(s.str); }
  size_t rfind(const dcx_string& s) const { return str.rfind(s.str); }

  bool contains(const dcx_string& s) const { return str.find(s.str) != std::string::npos; }

  dcx_string lower() const
  {
    dcx_string res = *this;
    for (size_t i = 0; i < res.size(); ++i)
    {
      res[i] = static_cast<char>(tolower(static_cast<unsigned char>(res[i])));
    }
    return res;
  }

  dcx_string& replace(const dcx_string& from, const dcx_string& to)
  {
    if (from.empty())
    {
      return *this;
    }
    for (size_t pos = 0; (pos = str.find(from.str, pos)) != std::string::npos; pos += to.size())
    {
      str.replace(pos, from.size(), to.str);
    }
    return *this;
  }

  size_t split(const dcx_string& delim, std::vector<dcx_string>& out) const
  {
    size_t pos = 0;
    size_t lastPos = 0;
    while ((pos = str.find(delim.str, lastPos)) != std::string::npos)
    {
      out.push_back(str.substr(lastPos, pos - lastPos));
      lastPos = pos + delim.size();
    }
    out.push_back(str.substr(lastPos));
    return out.size();
  }

  std::vector<dcx_string> split(const dcx_string& delim) const
  {
    std::vector<dcx_string> out;
    split(delim, out);
    return out;
  }

  dcx_string trim() const
  {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return dcx_string();
    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
  }

  bool starts_with(const dcx_string& prefix) const
  {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix.str) == 0;
  }

  bool ends_with(const dcx_string& suffix) const
  {
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix.str) == 0;
  }

  dcx_string pad_left(size_t total_width, char pad_char = ' ') const
  {
    if (str.size() >= total_width) return *this;
    return std::string(total_width - str.size(), pad_char) + str;
  }

  dcx_string join(const std::vector<dcx_string>& parts) const
  {
    if (parts.empty()) return dcx_string();

    dcx_string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
      result += *this + parts[i];
    }
    return result;
  }
};

// Global operators for const char* + dcx_string
inline dcx_string operator+(const char* lhs, const dcx_string& rhs) {
    return dcx_string(lhs) + rhs;
}

#endif // dcx_STRING_H
