#ifndef UTILS_H
#define UTILS_H

#include <array>
#include <cstdint>
#include <iostream>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>
#include <nlohmann/json.hpp>

#include "dynamicexception.h"
#include "logger.h"

/// Typedef for uint256_t. Arithmetic overflow throws std::overflow_error.
using uint256_t = boost::multiprecision::number<boost::multiprecision::cpp_int_backend<
  256, 256, boost::multiprecision::unsigned_magnitude, boost::multiprecision::cpp_int_check_type::checked, void
>>;

/// Typedef for json, keeping insertion order of object keys.
using json = nlohmann::ordered_json;

/// Typedef for a raw byte vector.
using Bytes = std::vector<uint8_t>;

/// Typedef for a fixed size raw byte array.
template <std::size_t N> using BytesArr = std::array<uint8_t, N>;

/// Typedef for a read-only view over raw bytes.
using BytesArrView = std::span<const uint8_t>;

/// Namespace for utility functions.
namespace Utils {
  /// Whether safePrint() and the Logger echo their messages to stdout.
  extern bool logToCout;

  /**
   * Print a string to stdout, if logToCout is set. Thread-safe.
   * @param str The string to print.
   */
  void safePrint(std::string_view str);

  /// The highest value a uint256_t can hold (2^256 - 1).
  uint256_t maxUint256();

  /**
   * Convert a uint256_t to a 32-byte big-endian byte vector.
   * @param i The integer to convert.
   * @return The converted bytes.
   */
  Bytes uint256ToBytes(const uint256_t& i);

  /**
   * Convert up to 32 big-endian bytes to a uint256_t.
   * @param b The bytes to convert.
   * @return The converted integer.
   * @throw DynamicException if more than 32 bytes are given.
   */
  uint256_t bytesToUint256(const BytesArrView b);

  /**
   * Append a byte container to the end of a byte vector.
   * @param vec The vector to append to.
   * @param bytes The bytes to append.
   */
  template <typename T> void appendBytes(Bytes& vec, const T& bytes) {
    vec.insert(vec.end(), bytes.cbegin(), bytes.cend());
  }

  /**
   * Parse a plain decimal integer ("10", "010"). Leading zeroes are ignored,
   * hex or octal prefixes are not recognized.
   * @param str The string to parse.
   * @return The parsed integer.
   * @throw DynamicException if the string has anything but decimal digits or
   *        does not fit in 256 bits.
   */
  uint256_t parseUint256(std::string_view str);

  /**
   * Parse a native currency amount into wei.
   * Accepts a decimal number optionally followed by a unit ("wei", "gwei" or
   * "ether"), e.g. "0.0025 ether", "30 gwei", "1000". A bare number is wei.
   * @param amount The amount to parse.
   * @return The amount in wei.
   * @throw DynamicException on malformed input, unknown units, fractions
   *        finer than one wei, or amounts that do not fit in 256 bits.
   */
  uint256_t parseNativeAmount(std::string_view amount);

  /**
   * Format an amount of wei as a decimal ether string ("0.0025 ether").
   * @param wei The amount in wei.
   * @return The formatted amount.
   */
  std::string formatNativeAmount(const uint256_t& wei);
};

#endif  // UTILS_H
