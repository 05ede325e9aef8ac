#ifndef SAFEUINT256_H
#define SAFEUINT256_H

#include "../../utils/utils.h"
#include "safevariable.h"

/// Safe wrapper for a uint256_t. Overflow and underflow throw std::overflow_error.
class SafeUint256_t : public SafeVariable<uint256_t> {
  public:
    using SafeVariable<uint256_t>::SafeVariable;
    using SafeVariable<uint256_t>::operator=;

    SafeUint256_t& operator+=(const uint256_t& other) {
      this->markAsUsed(); this->value_ += other; return *this;
    }

    SafeUint256_t& operator-=(const uint256_t& other) {
      this->markAsUsed(); this->value_ -= other; return *this;
    }

    SafeUint256_t& operator++() { return *this += 1; }

    bool operator<(const uint256_t& other) const { return this->value_ < other; }
    bool operator<=(const uint256_t& other) const { return this->value_ <= other; }
    bool operator>(const uint256_t& other) const { return this->value_ > other; }
    bool operator>=(const uint256_t& other) const { return this->value_ >= other; }
};

#endif // SAFEUINT256_H
