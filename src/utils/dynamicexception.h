#ifndef DYNAMIC_EXCEPTION_H
#define DYNAMIC_EXCEPTION_H

#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>
#include <string>

/**
 * Exception class that builds its message from an arbitrary list of
 * streamable parts and records when it was thrown.
 */
class DynamicException : public std::exception {
  private:
    std::string message_;   ///< The full exception message.
    std::string timestamp_; ///< Local time at which the exception was created.

    /// Stamp the exception with the current local time.
    void setTimestamp() {
      auto now = std::chrono::system_clock::now();
      std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
      std::tm tmBuf{};
      localtime_r(&nowTime, &tmBuf);
      std::ostringstream oss;
      oss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
      this->timestamp_ = oss.str();
    }

    template<typename... Args> static std::string buildMessage(const Args&... args) {
      std::ostringstream stream;
      (stream << ... << args);
      return stream.str();
    }

  public:
    /**
     * Constructor.
     * @param args The parts of the message, concatenated in order.
     */
    template<typename... Args> explicit DynamicException(const Args&... args)
      : message_(buildMessage(args...)) { this->setTimestamp(); }

    /// Getter for the exception message.
    const char* what() const noexcept override { return this->message_.c_str(); }

    /// Getter for the timestamp.
    const std::string& getTimestamp() const { return this->timestamp_; }
};

#endif // DYNAMIC_EXCEPTION_H
