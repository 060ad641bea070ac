#ifndef LOGGER_HPP_
#define LOGGER_HPP_

#include <iostream>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace settlement {
namespace observability {

/**
 * Log levels for structured logging.
 */
enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
  FATAL
};

/**
 * Parse a level name such as "debug" or "WARN". Unknown names map to INFO.
 */
LogLevel parseLogLevel(const std::string& name);

const char* logLevelName(LogLevel level);

/**
 * Structured logger writing one JSON object per line.
 * Thread-safe. Every line may carry a component and a correlation id so a
 * settlement can be traced from the ledger query through to posting.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  bool isEnabled(LogLevel level) const;

  // Default: std::cout. The stream must outlive the logger or be reset.
  void setOutputStream(std::ostream& stream);

  /**
   * Attach `key` to every line written from now on (e.g. network, merchant).
   * An empty value removes the key.
   */
  void setContextField(const std::string& key, const std::string& value);

  /**
   * Write one line at `level`. `component` is usually the calling function.
   */
  void write(LogLevel level, const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "",
             const nlohmann::json& fields = nlohmann::json::object());

  // Key/value line, written when the builder goes out of scope
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "",
               const std::string& correlation_id = "");

    ~LogBuilder();

    LogBuilder& correlation(const std::string& correlation_id);

    template <typename T>
    LogBuilder& field(const std::string& key, const T& value) {
      fields_[key] = value;
      return *this;
    }

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    std::string correlation_id_;
    nlohmann::json fields_ = nlohmann::json::object();
  };

 private:
  Logger();
  ~Logger() = default;

  std::string getCurrentTimestamp() const;
  std::string getThreadId() const;

  LogLevel min_level_;
  std::ostream* output_stream_;
  nlohmann::json context_ = nlohmann::json::object();
  mutable std::mutex mutex_;
};

// Convenience macros for logging
#define SETTLEMENT_LOG_AT(level, msg) \
  settlement::observability::Logger::getInstance().write(level, msg, __func__)
#define SETTLEMENT_LOG_DEBUG(msg) SETTLEMENT_LOG_AT(settlement::observability::LogLevel::DEBUG, msg)
#define SETTLEMENT_LOG_INFO(msg) SETTLEMENT_LOG_AT(settlement::observability::LogLevel::INFO, msg)
#define SETTLEMENT_LOG_WARN(msg) SETTLEMENT_LOG_AT(settlement::observability::LogLevel::WARN, msg)
#define SETTLEMENT_LOG_ERROR(msg) SETTLEMENT_LOG_AT(settlement::observability::LogLevel::ERROR, msg)
#define SETTLEMENT_LOG_FATAL(msg) SETTLEMENT_LOG_AT(settlement::observability::LogLevel::FATAL, msg)

// Structured logging helper
#define SETTLEMENT_LOG_BUILDER(level, msg) \
  settlement::observability::Logger::LogBuilder(level, msg, __func__)

}  // namespace observability
}  // namespace settlement

#endif  // LOGGER_HPP_
