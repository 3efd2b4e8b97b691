#ifndef TXLEDGER_LOGGER_H
#define TXLEDGER_LOGGER_H

#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace txl {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

std::string levelToString(Level level);

/**
 * Parse a level name ("debug", "INFO", "warn", ...), case-insensitive.
 * @return true if the name is known, false otherwise (level untouched)
 */
bool parseLevel(const std::string &name, Level &level);

class Handler {
public:
  virtual ~Handler() = default;
  virtual void emit(Level level, const std::string &loggerName,
                    const std::string &message) = 0;

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

protected:
  Level level_ = Level::DEBUG;
};

// Writes to stderr; stdout is reserved for program output.
class ConsoleHandler : public Handler {
public:
  void emit(Level level, const std::string &loggerName,
            const std::string &message) override;
};

class FileHandler : public Handler {
public:
  explicit FileHandler(const std::string &filename);
  ~FileHandler() override;
  void emit(Level level, const std::string &loggerName,
            const std::string &message) override;

private:
  std::ofstream file_;
  std::string filename_;
};

class Logger;
class LogStream;
class LoggerNode;

class LogProxy {
public:
  LogProxy(Logger *logger, Level level);

  template <typename T> LogStream operator<<(const T &value);

private:
  Logger *logger_;
  Level level_;
};

// Accumulates one message and hands it to the logger when destroyed
class LogStream {
public:
  LogStream(Logger *logger, Level level);
  ~LogStream();

  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;

  LogStream(LogStream &&other) noexcept;
  LogStream &operator=(LogStream &&other) noexcept;

  template <typename T> LogStream &operator<<(const T &value) {
    stream_ << value;
    return *this;
  }

private:
  Logger *logger_;
  Level level_;
  std::ostringstream stream_;
  bool moved_;
};

// LoggerNode - one node of the logger tree, shared by all Logger handles
class LoggerNode : public std::enable_shared_from_this<LoggerNode> {
public:
  explicit LoggerNode(const std::string &name);
  ~LoggerNode() = default;

  // A node without its own level inherits the level of its parent
  void setLevel(Level level);
  Level getEffectiveLevel() const;

  void addHandler(std::shared_ptr<Handler> spHandler);
  void addFileHandler(const std::string &filename, Level level);

  void setPropagate(bool propagate) { propagate_ = propagate; }
  bool getPropagate() const { return propagate_; }

  void setParent(std::weak_ptr<LoggerNode> parent) { parent_ = parent; }
  std::shared_ptr<LoggerNode> getParent() const { return parent_.lock(); }
  void addChild(std::shared_ptr<LoggerNode> child);
  void removeChild(LoggerNode *child);

  void log(Level level, const std::string &message);

  const std::string &getName() const { return name_; }
  std::string getFullName() const;

private:
  void emitToHandlers(Level level, const std::string &originName,
                      const std::string &formatted);

  std::string name_;
  std::weak_ptr<LoggerNode> parent_;
  bool hasLevel_{ false };
  Level level_{ Level::INFO };
  bool propagate_{ true };
  std::vector<std::weak_ptr<LoggerNode>> children_;
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  mutable std::mutex mutex_;
};

// Logger - lightweight handle to a LoggerNode
class Logger {
public:
  explicit Logger(std::shared_ptr<LoggerNode> node);
  Logger(const Logger &other);
  Logger &operator=(const Logger &) = delete;
  ~Logger() = default;

  LogProxy debug;
  LogProxy info;
  LogProxy warning;
  LogProxy error;
  LogProxy critical;

  void setLevel(Level level) { spNode_->setLevel(level); }
  Level getLevel() const { return spNode_->getEffectiveLevel(); }
  bool isEnabledFor(Level level) const { return level >= getLevel(); }

  void addHandler(std::shared_ptr<Handler> spHandler) { spNode_->addHandler(spHandler); }
  void addFileHandler(const std::string &filename, Level level = Level::DEBUG) {
    spNode_->addFileHandler(filename, level);
  }

  void setPropagate(bool propagate) { spNode_->setPropagate(propagate); }
  bool getPropagate() const { return spNode_->getPropagate(); }

  // Re-parent this logger (and its subtree) under another logger
  void redirectTo(const std::string &targetLoggerName);

  const std::string &getName() const { return spNode_->getName(); }
  std::string getFullName() const { return spNode_->getFullName(); }
  std::string getParentName() const;

  bool operator==(const Logger &other) const { return spNode_ == other.spNode_; }
  bool operator!=(const Logger &other) const { return spNode_ != other.spNode_; }

private:
  friend class LogStream;
  friend Logger getLogger(const std::string &name);

  void log(Level level, const std::string &message) { spNode_->log(level, message); }

  std::shared_ptr<LoggerNode> spNode_;
};

template <typename T> LogStream LogProxy::operator<<(const T &value) {
  LogStream stream(logger_, level_);
  stream << value;
  return stream;
}

// Loggers are created on first use; "a.b.c" is a child of "a.b"
Logger getLogger(const std::string &name);
Logger getRootLogger();

} // namespace logging
} // namespace txl

#endif // TXLEDGER_LOGGER_H
