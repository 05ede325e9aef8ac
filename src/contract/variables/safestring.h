#ifndef SAFESTRING_H
#define SAFESTRING_H

#include <string>

#include "safevariable.h"

/// Safe wrapper for a std::string.
class SafeString : public SafeVariable<std::string> {
  public:
    using SafeVariable<std::string>::SafeVariable;
    using SafeVariable<std::string>::operator=;

    SafeString& operator+=(const std::string& other) {
      this->markAsUsed(); this->value_ += other; return *this;
    }

    std::size_t size() const { return this->value_.size(); }
    bool empty() const { return this->value_.empty(); }
};

#endif // SAFESTRING_H
