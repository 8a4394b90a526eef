#include "dcx_env.h"
#include <fstream>
#include <cstdlib>

void load_env_file(const dcx_string& filepath) {
  std::ifstream file(filepath.c_str());
  if (!file.is_open()) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    dcx_string dcx_line = dcx_string(line).trim();

    if (dcx_line.empty() || dcx_line.starts_with("#")) {
      continue;
    }

    size_t pos = dcx_line.find("=");
    if (pos == dcx_string::npos) {
      continue;
    }

    dcx_string key = dcx_line.substr(0, pos).trim();
    dcx_string value = dcx_line.substr(pos + 1).trim();
    if (value.size() >= 2 && value[0] == '"' && value[value.size() - 1] == '"') {
      value = value.substr(1, value.size() - 2);
    }

    setenv(key.c_str(), value.c_str(), 1);
  }
}
