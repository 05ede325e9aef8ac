#include "strings.h"

Address::Address(std::string_view hex) {
  if (!Address::isValid(hex)) throw DynamicException("Address: invalid address \"", hex, "\"");
  Bytes bytes = Hex::toBytes(hex);
  std::copy(bytes.cbegin(), bytes.cend(), this->data_.begin());
}

bool Address::isValid(std::string_view hex) {
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) hex = hex.substr(2);
  return hex.size() == 40 && Hex::isValid(hex);
}
