/*
Copyright (c) [2023-2024] [Sparq Network]

This software is distributed under the MIT License.
See the LICENSE.txt file in the project root for more information.
*/

#include "logger.h"
#include "utils.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

Logger::~Logger() {
  std::lock_guard lock(this->logMutex_);
  if (this->logFile_.is_open()) this->logFile_.close();
}

void Logger::write(LogType type, const std::string& logSrc, const std::string& func, const std::string& message) {
  auto now = std::chrono::system_clock::now();
  std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
  std::tm tmBuf{};
  localtime_r(&nowTime, &tmBuf);
  std::ostringstream line;
  line << "[" << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S") << " "
       << logTypeToString(type) << "] " << logSrc << "::" << func << " - " << message;

  {
    std::lock_guard lock(this->logMutex_);
    if (!this->logFile_.is_open() && !this->logFilePath_.empty()) {
      this->logFile_.open(this->logFilePath_, std::ios::out | std::ios::app);
    }
    if (this->logFile_.is_open()) this->logFile_ << line.str() << std::endl;
  }
  Utils::safePrint(line.str());
}

void Logger::logToDebug(LogType type, const std::string& logSrc, std::string&& func, std::string&& message) noexcept {
  Logger& logger = getInstance();
  if (type == LogType::NONE || type < logger.logLevel_.load()) return;
  try {
    logger.write(type, logSrc, func, message);
  } catch (const std::exception& e) {
    std::cerr << "Logger failed to write message from " << logSrc << ": " << e.what() << std::endl;
  }
}

void Logger::setLogFile(const std::string& path) {
  Logger& logger = getInstance();
  std::lock_guard lock(logger.logMutex_);
  if (logger.logFile_.is_open()) logger.logFile_.close();
  logger.logFilePath_ = path;
}

void Logger::setLogLevel(LogType level) {
  getInstance().logLevel_ = level;
}

LogType Logger::getLogLevel() {
  return getInstance().logLevel_.load();
}

std::string Logger::logTypeToString(LogType type) {
  switch (type) {
    case LogType::DEBUG: return "DEBUG";
    case LogType::INFO: return "INFO";
    case LogType::WARNING: return "WARNING";
    case LogType::ERROR: return "ERROR";
    case LogType::NONE: return "NONE";
  }
  return "NONE";
}

LogType Logger::logTypeFromString(const std::string& name) {
  if (name == "DEBUG") return LogType::DEBUG;
  if (name == "INFO") return LogType::INFO;
  if (name == "WARNING") return LogType::WARNING;
  if (name == "ERROR") return LogType::ERROR;
  if (name == "NONE") return LogType::NONE;
  throw DynamicException("Logger: unknown log level ", name);
}
