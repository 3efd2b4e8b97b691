#include "RunConfig.h"
#include "Utilities.h"

namespace txl {

RunConfig::Roe<void> RunConfig::applyJson(const nlohmann::json &config) {
  if (!config.is_object()) {
    return Error(E_FIELD, "Configuration must be a JSON object");
  }

  if (config.contains("logLevel")) {
    if (!config["logLevel"].is_string()) {
      return Error(E_FIELD, "Configuration field 'logLevel' is not a string");
    }
    auto name = config["logLevel"].get<std::string>();
    if (!logging::parseLevel(name, logLevel)) {
      return Error(E_FIELD, "Unknown log level: " + name);
    }
  }

  if (config.contains("logFile")) {
    if (!config["logFile"].is_string()) {
      return Error(E_FIELD, "Configuration field 'logFile' is not a string");
    }
    logFile = config["logFile"].get<std::string>();
  }

  if (config.contains("outputFormat")) {
    if (!config["outputFormat"].is_string()) {
      return Error(E_FIELD, "Configuration field 'outputFormat' is not a string");
    }
    auto name = config["outputFormat"].get<std::string>();
    if (!parseOutputFormat(name, outputFormat)) {
      return Error(E_FIELD, "Unknown output format: " + name);
    }
  }

  if (config.contains("strict")) {
    if (!config["strict"].is_boolean()) {
      return Error(E_FIELD, "Configuration field 'strict' is not a boolean");
    }
    strict = config["strict"].get<bool>();
  }

  return {};
}

RunConfig::Roe<RunConfig> RunConfig::loadFromFile(const std::string &configPath) {
  auto json = utl::loadJsonFile(configPath);
  if (!json) {
    return Error(E_FILE, json.error().message);
  }

  RunConfig config;
  auto applied = config.applyJson(json.value());
  if (!applied) {
    return applied.error();
  }
  return config;
}

nlohmann::json RunConfig::toJson() const {
  nlohmann::json j;
  j["logLevel"] = logging::levelToString(logLevel);
  j["logFile"] = logFile;
  j["outputFormat"] = outputFormatToString(outputFormat);
  j["strict"] = strict;
  return j;
}

} // namespace txl
