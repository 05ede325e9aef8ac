#ifndef SAFEHASH_H
#define SAFEHASH_H

#include <functional>
#include <string>
#include <string_view>

#include "strings.h"

/**
 * Hasher for the unordered containers used across the project.
 * Covers the key types std::hash does not know about.
 */
struct SafeHash {
  size_t operator()(const uint256_t& i) const {
    return boost::multiprecision::hash_value(i);
  }

  size_t operator()(const std::string& str) const {
    return std::hash<std::string>()(str);
  }

  template <std::size_t N> size_t operator()(const FixedBytes<N>& bytes) const {
    return std::hash<std::string_view>()(
      std::string_view(reinterpret_cast<const char*>(bytes.raw()), bytes.size())
    );
  }
};

#endif  // SAFEHASH_H
