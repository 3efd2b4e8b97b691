#include "AccountEngine.h"
#include "Logger.h"
#include "RunConfig.h"
#include "SummaryWriter.h"
#include "TransactionReader.h"

#include <CLI/CLI.hpp>

#include <fstream>
#include <iostream>
#include <string>

namespace {

constexpr int EXIT_IO_FAILURE = 1;
constexpr int EXIT_REJECTED = 2;

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"txledger - Replay a transaction log and print the resulting client accounts"};

  std::string inputPath;
  app.add_option("file", inputPath, "CSV file with columns type, client, tx, amount")
      ->required()
      ->check(CLI::ExistingFile);

  std::string outputPath;
  app.add_option("-o,--output", outputPath, "Write the account table to a file instead of stdout");

  std::string configPath;
  app.add_option("-c,--config", configPath, "JSON configuration file")
      ->check(CLI::ExistingFile);

  std::string format;
  app.add_option("-f,--format", format, "Output format: csv or json")
      ->check(CLI::IsMember({"csv", "json"}));

  std::string logLevelName;
  app.add_option("--log-level", logLevelName, "Log level: debug, info, warning, error");

  std::string logFile;
  app.add_option("--log-file", logFile, "Also write log messages to this file");

  bool debug = false;
  app.add_flag("--debug", debug, "Enable debug logging");

  bool strict = false;
  app.add_flag("--strict", strict, "Exit with status 2 if any transaction was rejected");

  CLI11_PARSE(app, argc, argv);

  txl::RunConfig config;
  if (!configPath.empty()) {
    auto loaded = txl::RunConfig::loadFromFile(configPath);
    if (!loaded) {
      std::cerr << "Error: " << loaded.error().message << "\n";
      return EXIT_IO_FAILURE;
    }
    config = loaded.value();
  }

  if (!format.empty() && !txl::parseOutputFormat(format, config.outputFormat)) {
    std::cerr << "Error: Unknown output format: " << format << "\n";
    return EXIT_IO_FAILURE;
  }
  if (!logLevelName.empty() && !txl::logging::parseLevel(logLevelName, config.logLevel)) {
    std::cerr << "Error: Unknown log level: " << logLevelName << "\n";
    return EXIT_IO_FAILURE;
  }
  if (debug) {
    config.logLevel = txl::logging::Level::DEBUG;
  }
  if (!logFile.empty()) {
    config.logFile = logFile;
  }
  config.strict = config.strict || strict;

  auto rootLogger = txl::logging::getRootLogger();
  rootLogger.setLevel(config.logLevel);
  if (!config.logFile.empty()) {
    try {
      rootLogger.addFileHandler(config.logFile, config.logLevel);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << "\n";
      return EXIT_IO_FAILURE;
    }
  }

  auto logger = txl::logging::getLogger("txledger");
  logger.debug << "Configuration: " << config.toJson().dump();

  std::ifstream input(inputPath);
  if (!input.is_open()) {
    logger.error << "Failed to open input file: " << inputPath;
    return EXIT_IO_FAILURE;
  }

  txl::TransactionReader reader(input);
  auto header = reader.readHeader();
  if (!header) {
    logger.error << header.error().message;
    return EXIT_IO_FAILURE;
  }

  txl::AccountEngine engine;
  while (auto transaction = reader.next()) {
    // A rejected transaction never stops the run
    auto result = engine.apply(*transaction);
    if (!result) {
      logger.warning << "Transaction failed: " << *transaction << ": " << result.error().message;
    }
  }

  if (input.bad()) {
    logger.error << "Failed while reading input file: " << inputPath;
    return EXIT_IO_FAILURE;
  }

  const auto &stats = engine.getStats();
  logger.info << "Processed " << stats.processed << " transactions (" << stats.applied
              << " applied, " << stats.ignored << " ignored, " << stats.rejected
              << " rejected) for " << engine.getAccountCount() << " clients; skipped "
              << reader.getStats().rowsSkipped << " invalid rows";

  auto rows = engine.summaries();
  if (outputPath.empty()) {
    txl::writeSummary(std::cout, rows, config.outputFormat);
    std::cout.flush();
  } else {
    std::ofstream output(outputPath);
    if (!output.is_open()) {
      logger.error << "Failed to open output file: " << outputPath;
      return EXIT_IO_FAILURE;
    }
    txl::writeSummary(output, rows, config.outputFormat);
    if (!output) {
      logger.error << "Failed to write output file: " << outputPath;
      return EXIT_IO_FAILURE;
    }
  }

  if (config.strict && stats.rejected > 0) {
    return EXIT_REJECTED;
  }
  return 0;
}
