#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace pl {
namespace logging {

namespace {

std::mutex &registryMutex() {
  static std::mutex mutex;
  return mutex;
}

std::unordered_map<std::string, std::shared_ptr<LoggerNode>> &registry() {
  static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> nodes;
  return nodes;
}

std::string currentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm local{};
  localtime_r(&time, &local);

  std::ostringstream ss;
  ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

std::string trimLeadingDot(const std::string &name) {
  if (!name.empty() && name[0] == '.') {
    return name.substr(1);
  }
  return name;
}

// Caller holds registryMutex()
std::shared_ptr<LoggerNode> getOrCreateNode(const std::string &name) {
  auto &nodes = registry();
  auto it = nodes.find(name);
  if (it != nodes.end()) {
    return it->second;
  }

  std::shared_ptr<LoggerNode> parent;
  if (!name.empty()) {
    auto lastDot = name.rfind('.');
    parent = getOrCreateNode(lastDot == std::string::npos
                                 ? std::string()
                                 : name.substr(0, lastDot));
  }

  auto node = std::make_shared<LoggerNode>(name, parent);
  if (name.empty()) {
    node->addHandler(std::make_shared<ConsoleHandler>());
  }
  nodes[name] = node;
  return node;
}

} // namespace

bool parseLevel(const std::string &name, Level &level) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug") {
    level = Level::DEBUG;
  } else if (lower == "info") {
    level = Level::INFO;
  } else if (lower == "warning" || lower == "warn") {
    level = Level::WARNING;
  } else if (lower == "error") {
    level = Level::ERROR;
  } else if (lower == "critical") {
    level = Level::CRITICAL;
  } else {
    return false;
  }
  return true;
}

const char *levelToString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARNING:
    return "WARNING";
  case Level::ERROR:
    return "ERROR";
  case Level::CRITICAL:
    return "CRITICAL";
  }
  return "UNKNOWN";
}

// ---------------- Handlers ----------------

void ConsoleHandler::emit(Level level, const std::string &formatted) {
  if (level < level_) {
    return;
  }
  std::cerr << formatted << std::endl;
}

FileHandler::FileHandler(const std::string &filename) {
  file_.open(filename, std::ios::app);
  if (!file_.is_open()) {
    throw std::runtime_error("Failed to open log file: " + filename);
  }
}

void FileHandler::emit(Level level, const std::string &formatted) {
  if (level < level_) {
    return;
  }
  file_ << formatted << std::endl;
}

// ---------------- LoggerNode ----------------

LoggerNode::LoggerNode(const std::string &fullName,
                       std::shared_ptr<LoggerNode> parent)
    : fullName_(fullName), parent_(std::move(parent)) {}

void LoggerNode::setLevel(Level level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

Level LoggerNode::getLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

void LoggerNode::addHandler(std::shared_ptr<Handler> handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_.push_back(std::move(handler));
}

void LoggerNode::clearHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_.clear();
}

void LoggerNode::setPropagate(bool propagate) {
  std::lock_guard<std::mutex> lock(mutex_);
  propagate_ = propagate;
}

void LoggerNode::log(Level level, const std::string &message) {
  if (level < getLevel()) {
    return;
  }

  std::ostringstream ss;
  ss << "[" << currentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!fullName_.empty()) {
    ss << "[" << fullName_ << "] ";
  }
  ss << message;
  const std::string formatted = ss.str();

  // Walk up the tree; each ancestor filters by its own level
  LoggerNode *node = this;
  while (node) {
    if (node == this || level >= node->getLevel()) {
      node->handle(level, formatted);
    }
    bool propagate = false;
    {
      std::lock_guard<std::mutex> lock(node->mutex_);
      propagate = node->propagate_;
    }
    node = propagate ? node->parent_.get() : nullptr;
  }
}

void LoggerNode::handle(Level level, const std::string &formatted) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &handler : handlers_) {
    handler->emit(level, formatted);
  }
}

// ---------------- LogStream ----------------

LogStream::LogStream(Logger *logger, Level level)
    : logger_(logger), level_(level) {}

LogStream::LogStream(LogStream &&other) noexcept
    : logger_(other.logger_), level_(other.level_),
      stream_(std::move(other.stream_)) {
  other.logger_ = nullptr;
}

LogStream::~LogStream() {
  if (logger_) {
    logger_->log(level_, stream_.str());
  }
}

// ---------------- Logger ----------------

Logger::Logger(std::shared_ptr<LoggerNode> node)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), node_(std::move(node)) {}

Logger::Logger(const Logger &other) : Logger(other.node_) {}

Logger &Logger::operator=(const Logger &other) {
  node_ = other.node_;
  return *this;
}

void Logger::addFileHandler(const std::string &filename, Level level) {
  auto handler = std::make_shared<FileHandler>(filename);
  handler->setLevel(level);
  node_->addHandler(handler);
}

Logger getLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(registryMutex());
  return Logger(getOrCreateNode(trimLeadingDot(name)));
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace pl
