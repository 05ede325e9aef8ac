#include "utils.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <mutex>

#include <boost/algorithm/string.hpp>

std::mutex log_lock;

bool Utils::logToCout = false;

void Utils::safePrint(std::string_view str) {
  if (!Utils::logToCout) return;
  std::lock_guard lock(log_lock);
  std::cout << str << std::endl;
}

uint256_t Utils::maxUint256() {
  return std::numeric_limits<uint256_t>::max();
}

Bytes Utils::uint256ToBytes(const uint256_t& i) {
  Bytes ret(32, 0x00);
  Bytes tmp;
  tmp.reserve(32);
  boost::multiprecision::export_bits(i, std::back_inserter(tmp), 8);
  // export_bits drops leading zeroes, so right-align the result.
  std::copy(tmp.cbegin(), tmp.cend(), ret.end() - tmp.size());
  return ret;
}

uint256_t Utils::bytesToUint256(const BytesArrView b) {
  if (b.size() > 32) throw DynamicException(
    "Utils::bytesToUint256: invalid bytes size - expected at most 32, got ", b.size()
  );
  uint256_t ret;
  if (b.empty()) return ret;
  boost::multiprecision::import_bits(ret, b.begin(), b.end(), 8);
  return ret;
}

uint256_t Utils::parseUint256(std::string_view str) {
  if (str.empty()) throw DynamicException("Utils::parseUint256: empty string");
  for (const auto& c : str) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw DynamicException("Utils::parseUint256: \"", str, "\" is not a decimal integer");
    }
  }
  // cpp_int reads a leading zero as octal.
  std::string_view digits = str.substr(std::min(str.find_first_not_of('0'), str.size()));
  if (digits.empty()) return 0;
  try {
    return uint256_t(std::string(digits));
  } catch (const std::exception& e) {
    throw DynamicException("Utils::parseUint256: \"", str, "\" does not fit in 256 bits: ", e.what());
  }
}

uint256_t Utils::parseNativeAmount(std::string_view amount) {
  std::string str(amount);
  boost::algorithm::trim(str);
  if (str.empty()) throw DynamicException("Utils::parseNativeAmount: empty amount");

  std::vector<std::string> parts;
  boost::split(parts, str, boost::is_any_of(" \t"), boost::token_compress_on);
  if (parts.size() > 2) throw DynamicException("Utils::parseNativeAmount: malformed amount \"", str, "\"");

  unsigned decimals = 0;
  if (parts.size() == 2) {
    std::string unit = boost::algorithm::to_lower_copy(parts[1]);
    if (unit == "wei") decimals = 0;
    else if (unit == "gwei") decimals = 9;
    else if (unit == "ether" || unit == "eth") decimals = 18;
    else throw DynamicException("Utils::parseNativeAmount: unknown unit \"", parts[1], "\"");
  }

  std::string integral = parts[0];
  std::string fraction;
  auto dot = integral.find('.');
  if (dot != std::string::npos) {
    fraction = integral.substr(dot + 1);
    integral = integral.substr(0, dot);
  }
  if (integral.empty() && fraction.empty()) {
    throw DynamicException("Utils::parseNativeAmount: malformed amount \"", str, "\"");
  }
  for (const auto& c : integral + fraction) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw DynamicException("Utils::parseNativeAmount: malformed amount \"", str, "\"");
    }
  }
  // Trailing zeroes in the fraction carry no precision.
  while (!fraction.empty() && fraction.back() == '0') fraction.pop_back();
  if (fraction.size() > decimals) {
    throw DynamicException("Utils::parseNativeAmount: \"", str, "\" is more precise than one wei");
  }
  fraction.append(decimals - fraction.size(), '0');

  const std::string digits = integral + fraction;
  if (digits.empty()) return 0;
  try {
    return Utils::parseUint256(digits);
  } catch (const std::exception& e) {
    throw DynamicException("Utils::parseNativeAmount: \"", str, "\" does not fit in 256 bits: ", e.what());
  }
}

std::string Utils::formatNativeAmount(const uint256_t& wei) {
  static const uint256_t oneEther("1000000000000000000");
  std::string integral = uint256_t(wei / oneEther).str();
  std::string fraction = uint256_t(wei % oneEther).str();
  if (fraction == "0") return integral + " ether";
  fraction.insert(0, 18 - fraction.size(), '0');
  while (fraction.back() == '0') fraction.pop_back();
  return integral + "." + fraction + " ether";
}
