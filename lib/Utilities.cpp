#include "Utilities.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <limits>

namespace txl {
namespace utl {

bool parseUInt64(const std::string &str, uint64_t &value) {
  // from_chars accepts no sign for unsigned types, so "-1" fails here
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return !str.empty() && ec == std::errc{} && ptr == str.data() + str.size();
}

bool parseUInt32(const std::string &str, uint32_t &value) {
  uint64_t wide = 0;
  if (!parseUInt64(str, wide) || wide > std::numeric_limits<uint32_t>::max()) {
    return false;
  }
  value = static_cast<uint32_t>(wide);
  return true;
}

bool parseUInt16(const std::string &str, uint16_t &value) {
  uint64_t wide = 0;
  if (!parseUInt64(str, wide) || wide > std::numeric_limits<uint16_t>::max()) {
    return false;
  }
  value = static_cast<uint16_t>(wide);
  return true;
}

std::string trim(const std::string &str) {
  const char *ws = " \t\r\n";
  size_t first = str.find_first_not_of(ws);
  if (first == std::string::npos) {
    return "";
  }
  size_t last = str.find_last_not_of(ws);
  return str.substr(first, last - first + 1);
}

std::string toLower(const std::string &str) {
  std::string out(str);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::vector<std::string> split(const std::string &str, char delimiter) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t pos = str.find(delimiter, start);
    if (pos == std::string::npos) {
      parts.push_back(str.substr(start));
      break;
    }
    parts.push_back(str.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

Roe<nlohmann::json> loadJsonFile(const std::string &configPath) {
  if (!std::filesystem::exists(configPath)) {
    return Error(1, "Configuration file not found: " + configPath);
  }

  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    return Error(2, "Failed to open configuration file: " + configPath);
  }

  std::string content((std::istreambuf_iterator<char>(configFile)),
                      std::istreambuf_iterator<char>());
  configFile.close();

  nlohmann::json config;
  try {
    config = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON: " + std::string(e.what()));
  }

  return config;
}

} // namespace utl
} // namespace txl
