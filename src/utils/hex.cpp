#include "hex.h"

#include <algorithm>
#include <cctype>

namespace {
  int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  }

  bool hasPrefix(std::string_view hex) {
    return hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X');
  }
}

Hex::Hex(std::string_view value, bool strict) : strict_(strict) {
  if (!Hex::isValid(value)) throw DynamicException("Hex: invalid hex string \"", value, "\"");
  std::string_view digits = hasPrefix(value) ? value.substr(2) : value;
  this->hex_.reserve(digits.size() + 2);
  if (strict) this->hex_ = "0x";
  for (const auto& c : digits) {
    this->hex_ += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
}

bool Hex::isValid(std::string_view hex, bool strict) {
  if (hasPrefix(hex)) {
    hex = hex.substr(2);
  } else if (strict) {
    return false;
  }
  return std::all_of(hex.cbegin(), hex.cend(), [](char c) { return hexValue(c) != -1; });
}

Hex Hex::fromBytes(const BytesArrView bytes, bool strict) {
  static const char digits[] = "0123456789abcdef";
  std::string str;
  str.reserve(bytes.size() * 2);
  for (const auto& b : bytes) {
    str += digits[b >> 4];
    str += digits[b & 0x0F];
  }
  return Hex(str, strict);
}

Bytes Hex::toBytes(std::string_view hex) {
  if (!Hex::isValid(hex)) throw DynamicException("Hex::toBytes: invalid hex string \"", hex, "\"");
  if (hasPrefix(hex)) hex = hex.substr(2);
  Bytes ret;
  ret.reserve((hex.size() + 1) / 2);
  std::size_t i = 0;
  if (hex.size() % 2 != 0) {
    ret.push_back(static_cast<uint8_t>(hexValue(hex[0])));
    i = 1;
  }
  for (; i < hex.size(); i += 2) {
    ret.push_back(static_cast<uint8_t>((hexValue(hex[i]) << 4) | hexValue(hex[i + 1])));
  }
  return ret;
}

uint256_t Hex::getUint() const {
  Bytes b = Hex::toBytes(this->hex_);
  if (b.size() > 32) throw DynamicException("Hex::getUint: value too large for uint256_t");
  return Utils::bytesToUint256(b);
}
