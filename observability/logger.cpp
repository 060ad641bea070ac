#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace settlement {
namespace observability {

LogLevel parseLogLevel(const std::string& name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "DEBUG") return LogLevel::DEBUG;
  if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
  if (upper == "ERROR") return LogLevel::ERROR;
  if (upper == "FATAL") return LogLevel::FATAL;
  return LogLevel::INFO;
}

const char* logLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARN: return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::FATAL: return "FATAL";
  }
  return "UNKNOWN";
}

Logger& Logger::getInstance() {
  static Logger instance;
  return instance;
}

Logger::Logger() : min_level_(LogLevel::INFO), output_stream_(&std::cout) {}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  min_level_ = level;
}

LogLevel Logger::getLogLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return min_level_;
}

bool Logger::isEnabled(LogLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level >= min_level_;
}

void Logger::setOutputStream(std::ostream& stream) {
  std::lock_guard<std::mutex> lock(mutex_);
  output_stream_ = &stream;
}

void Logger::setContextField(const std::string& key, const std::string& value) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (value.empty()) {
    context_.erase(key);
  } else {
    context_[key] = value;
  }
}

Logger::LogBuilder::LogBuilder(LogLevel level, const std::string& message,
                               const std::string& component,
                               const std::string& correlation_id)
    : level_(level), message_(message), component_(component),
      correlation_id_(correlation_id) {}

Logger::LogBuilder::~LogBuilder() {
  Logger::getInstance().write(level_, message_, component_, correlation_id_, fields_);
}

Logger::LogBuilder& Logger::LogBuilder::correlation(const std::string& correlation_id) {
  correlation_id_ = correlation_id;
  return *this;
}

void Logger::write(LogLevel level, const std::string& message,
                   const std::string& component, const std::string& correlation_id,
                   const nlohmann::json& fields) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (level < min_level_) return;

  // Context first so call-site fields win on a key clash
  nlohmann::json entry = context_;
  entry.update(fields);
  entry["timestamp"] = getCurrentTimestamp();
  entry["level"] = logLevelName(level);
  entry["thread"] = getThreadId();
  entry["message"] = message;
  if (!component.empty()) {
    entry["component"] = component;
  }
  if (!correlation_id.empty()) {
    entry["correlation_id"] = correlation_id;
  }

  // Memos and wallet errors are untrusted text; replace invalid UTF-8
  *output_stream_ << entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
                  << '\n';
  output_stream_->flush();
}

std::string Logger::getCurrentTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(
      now.time_since_epoch()) % 1000000;

  std::tm utc{};
  gmtime_r(&time_t, &utc);

  std::ostringstream ss;
  ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
     << "." << std::setfill('0') << std::setw(6) << microseconds.count() << "Z";
  return ss.str();
}

std::string Logger::getThreadId() const {
  std::ostringstream ss;
  ss << std::this_thread::get_id();
  return ss.str();
}

}  // namespace observability
}  // namespace settlement
