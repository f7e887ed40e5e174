#include "fin_env.h"
#include <fstream>
#include <cstdlib>

void load_env_file(const fin_string& filepath) {
  std::ifstream file(filepath.c_str());
  if (!file.is_open()) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    fin_string env_line = fin_string(line).trim();

    if (env_line.empty() || env_line.starts_with("#")) {
      continue;
    }
    if (env_line.starts_with("export ")) {
      env_line = env_line.substr(7).trim();
    }

    size_t pos = env_line.find("=");
    if (pos == fin_string::npos) {
      continue;
    }

    fin_string key = env_line.substr(0, pos).trim();
    fin_string value = env_line.substr(pos + 1).trim();
    if (value.size() >= 2 &&
        ((value.starts_with("\"") && value.ends_with("\"")) ||
         (value.starts_with("'") && value.ends_with("'")))) {
      value = value.substr(1, value.size() - 2);
    }

    setenv(key.c_str(), value.c_str(), 0);
  }
}

fin_string env_string(const fin_string& name, const fin_string& def) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr || *value == '\0') {
    return def;
  }
  return fin_string(value);
}

long long env_int(const fin_string& name, long long def) {
  fin_string value = env_string(name).trim();
  if (!value.is_integer()) {
    return def;
  }
  return value.to_int(def);
}

double env_double(const fin_string& name, double def) {
  fin_string value = env_string(name).trim();
  if (!value.is_double()) {
    return def;
  }
  return value.to_double(def);
}

bool env_bool(const fin_string& name, bool def) {
  fin_string value = env_string(name).trim().lower();
  if (value.empty()) {
    return def;
  }
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  return def;
}
