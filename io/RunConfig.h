#ifndef TXLEDGER_RUN_CONFIG_H
#define TXLEDGER_RUN_CONFIG_H

#include "Logger.h"
#include "ResultOrError.hpp"
#include "SummaryWriter.h"

#include <string>
#include <nlohmann/json.hpp>

namespace txl {

/**
 * Settings of one processing run. Filled from an optional JSON file, then
 * overridden by command line flags.
 *
 * {
 *   "logLevel": "info",
 *   "logFile": "txledger.log",
 *   "outputFormat": "csv",
 *   "strict": false
 * }
 */
struct RunConfig {
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_FILE = 1;
  constexpr static int32_t E_FIELD = 2;

  logging::Level logLevel{ logging::Level::INFO };
  std::string logFile;
  OutputFormat outputFormat{ OutputFormat::CSV };
  // Exit with a failure status if any transaction was rejected
  bool strict{ false };

  /** Apply the keys present in `config`; unknown keys are ignored. */
  Roe<void> applyJson(const nlohmann::json &config);

  static Roe<RunConfig> loadFromFile(const std::string &configPath);

  nlohmann::json toJson() const;
};

} // namespace txl

#endif // TXLEDGER_RUN_CONFIG_H
