#ifndef HEX_H
#define HEX_H

#include <ostream>
#include <string>
#include <string_view>

#include "utils.h"

/**
 * Abstraction of a hex string.
 * A "strict" hex string carries the "0x" prefix, a non-strict one does not.
 * The string is always stored in lowercase.
 */
class Hex {
  private:
    std::string hex_;     ///< Internal string data.
    bool strict_ = false; ///< If true, hex_ includes the "0x" prefix.

  public:
    /// Default constructor (empty, non-strict).
    Hex() = default;

    /**
     * Constructor.
     * @param value The hex string, with or without the "0x" prefix.
     * @param strict If true, the stored string gets the "0x" prefix.
     * @throw DynamicException if the string is not valid hex.
     */
    explicit Hex(std::string_view value, bool strict = false);

    /**
     * Check if a string is valid hex.
     * @param hex The string to check.
     * @param strict If true, the "0x" prefix is required.
     * @return `true` if the string is valid, `false` otherwise.
     */
    static bool isValid(std::string_view hex, bool strict = false);

    /**
     * Build a Hex object from raw bytes.
     * @param bytes The bytes to convert.
     * @param strict If true, the result gets the "0x" prefix.
     */
    static Hex fromBytes(const BytesArrView bytes, bool strict = false);

    /**
     * Convert a hex string to raw bytes. Odd-length strings are left-padded.
     * @param hex The string to convert, with or without the "0x" prefix.
     * @throw DynamicException if the string is not valid hex.
     */
    static Bytes toBytes(std::string_view hex);

    /// Getter for the stored string.
    const std::string& get() const { return this->hex_; }

    /// Getter for the stored string without the prefix.
    std::string_view getNoPrefix() const {
      return this->strict_ ? std::string_view(this->hex_).substr(2) : std::string_view(this->hex_);
    }

    /// Getter for the strict flag.
    bool isStrict() const { return this->strict_; }

    /// Interpret the string as a big-endian unsigned integer.
    uint256_t getUint() const;

    /// Equality operator.
    bool operator==(const Hex& other) const { return this->hex_ == other.hex_; }

    /// Stream the stored string.
    friend std::ostream& operator<<(std::ostream& out, const Hex& hex) { return out << hex.hex_; }
};

#endif  // HEX_H
