#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace txl {
namespace logging {

static std::string trimLeadingDot(const std::string &name) {
  if (!name.empty() && name[0] == '.') {
    return name.substr(1);
  }
  return name;
}

static std::recursive_mutex &getRegistryMutex() {
  static std::recursive_mutex mutex;
  return mutex;
}

static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> &getLoggerRegistry() {
  static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> registry;
  return registry;
}

static std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm{};
  localtime_r(&time, &tm);
  std::stringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

std::string levelToString(Level level) {
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
  default:
    return "UNKNOWN";
  }
}

bool parseLevel(const std::string &name, Level &level) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "debug" || lower == "trace") {
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

// ConsoleHandler implementation
void ConsoleHandler::emit(Level level, const std::string &loggerName,
                          const std::string &message) {
  if (level < level_) {
    return;
  }
  std::cerr << message << std::endl;
}

// FileHandler implementation
FileHandler::FileHandler(const std::string &filename) : filename_(filename) {
  file_.open(filename_, std::ios::app);
  if (!file_.is_open()) {
    throw std::runtime_error("Failed to open log file: " + filename_);
  }
}

FileHandler::~FileHandler() {
  if (file_.is_open()) {
    file_.close();
  }
}

void FileHandler::emit(Level level, const std::string &loggerName,
                       const std::string &message) {
  if (level < level_) {
    return;
  }
  if (file_.is_open()) {
    file_ << message << std::endl;
    file_.flush();
  }
}

// LogProxy implementation
LogProxy::LogProxy(Logger *logger, Level level)
    : logger_(logger), level_(level) {}

// LogStream implementation
LogStream::LogStream(Logger *logger, Level level)
    : logger_(logger), level_(level), moved_(false) {}

LogStream::~LogStream() {
  if (!moved_ && logger_) {
    logger_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : logger_(other.logger_), level_(other.level_),
      stream_(std::move(other.stream_)), moved_(false) {
  other.moved_ = true;
}

LogStream &LogStream::operator=(LogStream &&other) noexcept {
  if (this != &other) {
    logger_ = other.logger_;
    level_ = other.level_;
    stream_ = std::move(other.stream_);
    moved_ = false;
    other.moved_ = true;
  }
  return *this;
}

// ========== LoggerNode Implementation ==========

LoggerNode::LoggerNode(const std::string &name) : name_(name) {}

void LoggerNode::setLevel(Level level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
  hasLevel_ = true;
}

Level LoggerNode::getEffectiveLevel() const {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (hasLevel_) {
      return level_;
    }
  }
  auto parentNode = getParent();
  return parentNode ? parentNode->getEffectiveLevel() : level_;
}

std::string LoggerNode::getFullName() const {
  std::vector<std::string> parts;

  auto current = const_cast<LoggerNode *>(this)->shared_from_this();
  while (current && !current->getName().empty()) {
    parts.push_back(current->getName());
    current = current->getParent();
  }

  std::string fullName;
  for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
    if (!fullName.empty()) {
      fullName += ".";
    }
    fullName += *it;
  }
  return fullName;
}

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(spHandler);
}

void LoggerNode::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  addHandler(spHandler);
}

void LoggerNode::log(Level level, const std::string &message) {
  if (level < getEffectiveLevel()) {
    return;
  }

  std::string originName = getFullName();
  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!originName.empty()) {
    ss << "[" << originName << "] ";
  }
  ss << message;
  const std::string formatted = ss.str();

  // Walk up the tree, emitting to every handler on the way
  auto node = shared_from_this();
  while (node) {
    node->emitToHandlers(level, originName, formatted);
    if (!node->getPropagate()) {
      break;
    }
    node = node->getParent();
  }
}

void LoggerNode::emitToHandlers(Level level, const std::string &originName,
                                const std::string &formatted) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &spHandler : spHandlers_) {
    spHandler->emit(level, originName, formatted);
  }
}

void LoggerNode::addChild(std::shared_ptr<LoggerNode> child) {
  std::lock_guard<std::mutex> lock(mutex_);
  children_.push_back(child);
}

void LoggerNode::removeChild(LoggerNode *child) {
  std::lock_guard<std::mutex> lock(mutex_);
  children_.erase(
      std::remove_if(children_.begin(), children_.end(),
                     [child](const std::weak_ptr<LoggerNode> &weak) {
                       auto ptr = weak.lock();
                       return !ptr || ptr.get() == child;
                     }),
      children_.end());
}

// ========== Logger Implementation ==========

Logger::Logger(std::shared_ptr<LoggerNode> node)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(node) {}

Logger::Logger(const Logger &other) : Logger(other.spNode_) {}

std::string Logger::getParentName() const {
  auto parentNode = spNode_->getParent();
  return parentNode ? parentNode->getFullName() : "";
}

void Logger::redirectTo(const std::string &targetLoggerName) {
  auto targetNode = getLogger(targetLoggerName).spNode_;

  if (targetNode == spNode_) {
    throw std::invalid_argument("Cannot redirect logger to itself");
  }

  for (auto ancestor = targetNode; ancestor; ancestor = ancestor->getParent()) {
    if (ancestor == spNode_) {
      throw std::invalid_argument("Cannot create circular parent relationship");
    }
  }

  auto oldParent = spNode_->getParent();
  if (oldParent) {
    oldParent->removeChild(spNode_.get());
  }
  spNode_->setParent(targetNode);
  targetNode->addChild(spNode_);
}

// ========== Global logger management ==========

Logger getLogger(const std::string &name) {
  std::string trimmedName = trimLeadingDot(name);
  std::lock_guard<std::recursive_mutex> lock(getRegistryMutex());
  auto &registry = getLoggerRegistry();

  auto it = registry.find(trimmedName);
  if (it != registry.end()) {
    return Logger(it->second);
  }

  if (trimmedName.empty()) {
    // Root logger owns the only default handler
    auto root = std::make_shared<LoggerNode>("");
    root->setLevel(Level::INFO);
    root->addHandler(std::make_shared<ConsoleHandler>());
    registry[""] = root;
    return Logger(root);
  }

  std::string nodeName = trimmedName;
  std::string parentPath;
  auto lastDot = trimmedName.rfind('.');
  if (lastDot != std::string::npos) {
    parentPath = trimmedName.substr(0, lastDot);
    nodeName = trimmedName.substr(lastDot + 1);
  }

  auto node = std::make_shared<LoggerNode>(nodeName);
  registry[trimmedName] = node;

  auto parent = getLogger(parentPath);
  node->setParent(parent.spNode_);
  parent.spNode_->addChild(node);

  return Logger(node);
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace txl
