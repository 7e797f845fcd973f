#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace sttmon {
namespace utils {

bool Logger::initialized_ = false;
LogLevel Logger::level_ = LogLevel::INFO;
std::mutex Logger::mutex_;

void Logger::initialize(LogLevel level) {
  setLevel(level);
  if (!initialized_) {
    initialized_ = true;
    debug("Logger initialized");
  }
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

LogLevel Logger::getLevel() {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

LogLevel Logger::parseLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "DEBUG") {
    return LogLevel::DEBUG;
  }
  if (upper == "WARN" || upper == "WARNING") {
    return LogLevel::WARN;
  }
  if (upper == "ERROR") {
    return LogLevel::ERROR;
  }
  return LogLevel::INFO;
}

void Logger::info(const std::string &message) {
  write(LogLevel::INFO, "INFO", message);
}

void Logger::warn(const std::string &message) {
  write(LogLevel::WARN, "WARN", message);
}

void Logger::error(const std::string &message) {
  write(LogLevel::ERROR, "ERROR", message);
}

void Logger::debug(const std::string &message) {
  write(LogLevel::DEBUG, "DEBUG", message);
}

void Logger::write(LogLevel level, const char *tag, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (static_cast<int>(level) < static_cast<int>(level_)) {
    return;
  }

  auto now = std::chrono::system_clock::now();
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()) % 1000;
  std::tm local{};
  localtime_r(&seconds, &local);

  std::ostringstream line;
  line << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0')
       << std::setw(3) << millis.count() << " [" << tag << "] " << message;

  if (level == LogLevel::ERROR) {
    std::cerr << line.str() << std::endl;
  } else {
    std::cout << line.str() << std::endl;
  }
}

} // namespace utils
} // namespace sttmon
