#include <catch2/catch.hpp>

#include "../../src/utils/safehash.h"
#include "../../src/utils/strings.h"
#include "../../src/utils/utils.h"

#include <unordered_set>

namespace TUtils {
  TEST_CASE("Utils Namespace", "[utils]") {
    SECTION("uint256ToBytes and bytesToUint256") {
      uint256_t value("2500000000000000");
      Bytes bytes = Utils::uint256ToBytes(value);
      REQUIRE(bytes.size() == 32);
      REQUIRE(Hex::fromBytes(bytes).get() == "0000000000000000000000000000000000000000000000000008e1bc9bf04000");
      REQUIRE(Utils::bytesToUint256(bytes) == value);
      REQUIRE(Utils::uint256ToBytes(0) == Bytes(32, 0x00));
      REQUIRE_THROWS(Utils::bytesToUint256(Bytes(33, 0x01)));
    }

    SECTION("maxUint256") {
      REQUIRE(Utils::maxUint256() == uint256_t("115792089237316195423570985008687907853269984665640564039457584007913129639935"));
      REQUIRE_THROWS(uint256_t(Utils::maxUint256() + 1));
    }

    SECTION("parseUint256") {
      REQUIRE(Utils::parseUint256("10") == uint256_t(10));
      REQUIRE(Utils::parseUint256("010") == uint256_t(10));
      REQUIRE(Utils::parseUint256("0") == uint256_t(0));
      REQUIRE(Utils::parseUint256("0000") == uint256_t(0));
      REQUIRE(Utils::parseUint256("115792089237316195423570985008687907853269984665640564039457584007913129639935") == Utils::maxUint256());
      REQUIRE_THROWS_AS(Utils::parseUint256("0x10"), DynamicException);
      REQUIRE_THROWS_AS(Utils::parseUint256(""), DynamicException);
      REQUIRE_THROWS_AS(Utils::parseUint256(" 10"), DynamicException);
      REQUIRE_THROWS_AS(Utils::parseUint256("-1"), DynamicException);
      REQUIRE_THROWS_AS(Utils::parseUint256("115792089237316195423570985008687907853269984665640564039457584007913129639936"), DynamicException);
    }

    SECTION("parseNativeAmount") {
      REQUIRE(Utils::parseNativeAmount("0.0025 ether") == uint256_t("2500000000000000"));
      REQUIRE(Utils::parseNativeAmount("0.05 ether") == uint256_t("50000000000000000"));
      REQUIRE(Utils::parseNativeAmount("1 ETH") == uint256_t("1000000000000000000"));
      REQUIRE(Utils::parseNativeAmount("30 gwei") == uint256_t("30000000000"));
      REQUIRE(Utils::parseNativeAmount("1.5 gwei") == uint256_t("1500000000"));
      REQUIRE(Utils::parseNativeAmount("1000") == uint256_t(1000));
      REQUIRE(Utils::parseNativeAmount("  42 wei ") == uint256_t(42));
      REQUIRE(Utils::parseNativeAmount("0") == uint256_t(0));
      REQUIRE(Utils::parseNativeAmount(".5 ether") == uint256_t("500000000000000000"));
      REQUIRE(Utils::parseNativeAmount("1.000 wei") == uint256_t(1));
    }

    SECTION("parseNativeAmount (invalid)") {
      REQUIRE_THROWS(Utils::parseNativeAmount(""));
      REQUIRE_THROWS(Utils::parseNativeAmount("abc"));
      REQUIRE_THROWS(Utils::parseNativeAmount("1 dollar"));
      REQUIRE_THROWS(Utils::parseNativeAmount("1.5 wei"));
      REQUIRE_THROWS(Utils::parseNativeAmount("0.0000000001 gwei"));
      REQUIRE_THROWS(Utils::parseNativeAmount("1 ether extra"));
      REQUIRE_THROWS(Utils::parseNativeAmount("-1 ether"));
      REQUIRE_THROWS(Utils::parseNativeAmount("."));
      REQUIRE_THROWS(Utils::parseNativeAmount(std::string(80, '9')));
    }

    SECTION("formatNativeAmount") {
      REQUIRE(Utils::formatNativeAmount(uint256_t("2500000000000000")) == "0.0025 ether");
      REQUIRE(Utils::formatNativeAmount(uint256_t("1000000000000000000000")) == "1000 ether");
      REQUIRE(Utils::formatNativeAmount(uint256_t(0)) == "0 ether");
      REQUIRE(Utils::formatNativeAmount(uint256_t(1)) == "0.000000000000000001 ether");
    }
  }

  TEST_CASE("Address Class", "[utils][address]") {
    SECTION("Address String Constructor") {
      Address addr(std::string_view("0x00dead00665771855a34155f5e7405489df2c3c6"));
      REQUIRE(addr.hex(true).get() == "0x00dead00665771855a34155f5e7405489df2c3c6");
      REQUIRE(Address(std::string_view("00DEAD00665771855A34155F5E7405489DF2C3C6")) == addr);
      REQUIRE(bool(addr));
    }

    SECTION("Address Default Constructor") {
      Address zero;
      REQUIRE(!zero);
      REQUIRE(zero.hex().get() == std::string(40, '0'));
    }

    SECTION("Address isValid") {
      REQUIRE(Address::isValid("0x00dead00665771855a34155f5e7405489df2c3c6"));
      REQUIRE(Address::isValid("00dead00665771855a34155f5e7405489df2c3c6"));
      REQUIRE(!Address::isValid("0x00dead00665771855a34155f5e7405489df2c3"));
      REQUIRE(!Address::isValid("0x00dead00665771855a34155f5e7405489df2c3zz"));
      REQUIRE_THROWS(Address(std::string_view("0x1234")));
    }

    SECTION("Address Hashing") {
      std::unordered_set<Address, SafeHash> set;
      set.insert(Address(std::string_view("0x00dead00665771855a34155f5e7405489df2c3c6")));
      set.insert(Address(std::string_view("0x00dead00665771855a34155f5e7405489df2c3c6")));
      set.insert(Address());
      REQUIRE(set.size() == 2);
    }
  }
}
