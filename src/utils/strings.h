#ifndef STRINGS_H
#define STRINGS_H

#include <algorithm>
#include <array>
#include <string>
#include <string_view>

#include "hex.h"
#include "utils.h"

/**
 * Abstraction of a fixed-size byte string.
 * Used as the base for Address.
 * @tparam N The size of the string, in bytes.
 */
template <std::size_t N> class FixedBytes {
  protected:
    BytesArr<N> data_ = {}; ///< Internal data, zero-initialized.

  public:
    /// Default constructor (all zeroes).
    constexpr FixedBytes() = default;

    /**
     * Constructor from a view of exactly N bytes.
     * @throw DynamicException on size mismatch.
     */
    explicit FixedBytes(const BytesArrView bytes) {
      if (bytes.size() != N) throw DynamicException(
        "FixedBytes: invalid size - expected ", N, " bytes, got ", bytes.size()
      );
      std::copy(bytes.begin(), bytes.end(), this->data_.begin());
    }

    /// Constructor from a fixed array.
    explicit FixedBytes(const BytesArr<N>& bytes) : data_(bytes) {}

    /// Getter for the raw data.
    const uint8_t* raw() const { return this->data_.data(); }

    /// Size of the string, in bytes.
    static constexpr std::size_t size() { return N; }

    /// Iterators.
    auto cbegin() const { return this->data_.cbegin(); }
    auto cend() const { return this->data_.cend(); }

    /// Read-only view over the data.
    BytesArrView view() const { return BytesArrView(this->data_.data(), N); }

    /**
     * Hex representation of the data.
     * @param strict If true, the result gets the "0x" prefix.
     */
    Hex hex(bool strict = false) const { return Hex::fromBytes(this->view(), strict); }

    /// `false` if every byte is zero.
    explicit operator bool() const {
      return std::any_of(this->data_.cbegin(), this->data_.cend(), [](uint8_t b) { return b != 0x00; });
    }

    bool operator==(const FixedBytes& other) const { return this->data_ == other.data_; }
    bool operator!=(const FixedBytes& other) const { return this->data_ != other.data_; }
    bool operator<(const FixedBytes& other) const { return this->data_ < other.data_; }
};

/// Abstraction of a 20-byte account or contract address.
class Address : public FixedBytes<20> {
  public:
    using FixedBytes<20>::FixedBytes;

    /// Default constructor (the zero address).
    Address() = default;

    /**
     * Constructor from a hex string, with or without the "0x" prefix.
     * @param hex The address as a 40-digit hex string.
     * @throw DynamicException if the string is not a valid address.
     */
    explicit Address(std::string_view hex);

    /**
     * Check if a string is a valid hex address (40 hex digits, optional "0x").
     * @param hex The string to check.
     * @return `true` if valid, `false` otherwise.
     */
    static bool isValid(std::string_view hex);

    /// Stream the strict hex representation.
    friend std::ostream& operator<<(std::ostream& out, const Address& address) {
      return out << address.hex(true);
    }
};

#endif  // STRINGS_H
