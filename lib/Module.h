#ifndef POW_LEDGER_MODULE_H
#define POW_LEDGER_MODULE_H

#include "Logger.h"

#include <string>

namespace pl {

/**
 * Base class for components that log under their own named logger.
 */
class Module {
public:
  /**
   * @param name Dotted logger name (e.g. "ledger.pool")
   */
  explicit Module(const std::string &name);
  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  const std::string &getLoggerName() const { return loggerName_; }

  logging::Logger &log() const { return logger_; }

private:
  std::string loggerName_;
  mutable logging::Logger logger_;
};

} // namespace pl

#endif // POW_LEDGER_MODULE_H
