#ifndef POW_LEDGER_LOGGER_H
#define POW_LEDGER_LOGGER_H

#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace pl {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

/**
 * Parse a level name ("debug", "info", "warning", "error", "critical").
 * @param name Case-insensitive level name
 * @param level Output parameter for the parsed level
 * @return true if the name was recognized
 */
bool parseLevel(const std::string &name, Level &level);

const char *levelToString(Level level);

class Handler {
public:
  virtual ~Handler() = default;
  virtual void emit(Level level, const std::string &formatted) = 0;

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

protected:
  Level level_{ Level::DEBUG };
};

// Writes to stderr so that stdout stays free for command output
class ConsoleHandler : public Handler {
public:
  void emit(Level level, const std::string &formatted) override;
};

class FileHandler : public Handler {
public:
  explicit FileHandler(const std::string &filename);
  void emit(Level level, const std::string &formatted) override;

private:
  std::ofstream file_;
};

class Logger;
class LogStream;

/**
 * Node in the logger tree. A node named "ledger.block" is a child of
 * "ledger", which is a child of the root (empty name). Records are handled
 * by the node's own handlers and then propagated to the parent.
 */
class LoggerNode {
public:
  LoggerNode(const std::string &fullName, std::shared_ptr<LoggerNode> parent);

  void setLevel(Level level);
  Level getLevel() const;

  void addHandler(std::shared_ptr<Handler> handler);
  void clearHandlers();

  void setPropagate(bool propagate);

  const std::string &getFullName() const { return fullName_; }
  std::shared_ptr<LoggerNode> getParent() const { return parent_; }

  void log(Level level, const std::string &message);

private:
  void handle(Level level, const std::string &formatted);

  std::string fullName_;
  std::shared_ptr<LoggerNode> parent_;
  Level level_{ Level::DEBUG };
  bool propagate_{ true };
  std::vector<std::shared_ptr<Handler>> handlers_;
  mutable std::mutex mutex_;
};

class LogProxy {
public:
  LogProxy(Logger *logger, Level level) : logger_(logger), level_(level) {}

  template <typename T> LogStream operator<<(const T &value);

private:
  Logger *logger_;
  Level level_;
};

// Collects one record and emits it on destruction
class LogStream {
public:
  LogStream(Logger *logger, Level level);
  ~LogStream();

  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;
  LogStream(LogStream &&other) noexcept;

  template <typename T> LogStream &operator<<(const T &value) {
    stream_ << value;
    return *this;
  }

private:
  Logger *logger_;
  Level level_;
  std::ostringstream stream_;
};

/**
 * Lightweight handle to a LoggerNode with stream-style members:
 *   log.info << "Mined block " << index;
 */
class Logger {
public:
  explicit Logger(std::shared_ptr<LoggerNode> node);

  Logger(const Logger &other);
  Logger &operator=(const Logger &other);

  LogProxy debug;
  LogProxy info;
  LogProxy warning;
  LogProxy error;
  LogProxy critical;

  void setLevel(Level level) { node_->setLevel(level); }
  Level getLevel() const { return node_->getLevel(); }

  void addHandler(std::shared_ptr<Handler> handler) {
    node_->addHandler(std::move(handler));
  }
  void addFileHandler(const std::string &filename, Level level = Level::DEBUG);
  void clearHandlers() { node_->clearHandlers(); }
  void setPropagate(bool propagate) { node_->setPropagate(propagate); }

  const std::string &getFullName() const { return node_->getFullName(); }

  bool operator==(const Logger &other) const { return node_ == other.node_; }
  bool operator!=(const Logger &other) const { return node_ != other.node_; }

private:
  friend class LogStream;

  void log(Level level, const std::string &message) {
    node_->log(level, message);
  }

  std::shared_ptr<LoggerNode> node_;
};

template <typename T> LogStream LogProxy::operator<<(const T &value) {
  LogStream stream(logger_, level_);
  stream << value;
  return stream;
}

// Returns the logger for a dotted name, creating it and its ancestors
Logger getLogger(const std::string &name);
Logger getRootLogger();

} // namespace logging
} // namespace pl

#endif // POW_LEDGER_LOGGER_H
