#ifndef TXLEDGER_MODULE_H
#define TXLEDGER_MODULE_H

#include "Logger.h"

#include <string>

namespace txl {

/**
 * Base class for components that need logging functionality.
 * Provides a common interface for logger management across components.
 */
class Module {
public:
  /**
   * Constructor
   * @param name Hierarchical name for the module's logger (e.g.,
   * "txledger.engine")
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Move this module's logger under another logger, so that its output
   * carries the target's name as prefix and honours the target's level.
   * @param targetLoggerName Name of the new parent logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  /**
   * Get the logger instance for this module.
   *
   * @return Reference to the logger instance
   */
  logging::Logger &log() const;

private:
  mutable logging::Logger logger_;
};

} // namespace txl

#endif // TXLEDGER_MODULE_H
