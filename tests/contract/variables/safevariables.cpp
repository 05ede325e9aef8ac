#include <catch2/catch.hpp>

#include "../../../src/contract/variables/safeaddress.h"
#include "../../../src/contract/variables/safestring.h"
#include "../../../src/contract/variables/safeuint256.h"
#include "../../../src/contract/variables/safeunorderedmap.h"

// Variables without an owner never register themselves, so the frame
// protocol (checkpoint/commit/revert) is driven by hand here, the same way
// ContractHost drives it.
namespace TSafeVariables {
  TEST_CASE("SafeUint256_t Class", "[contract][variables][safeuint256_t]") {
    SECTION("SafeUint256_t Constructor and arithmetic") {
      SafeUint256_t value(uint256_t(10));
      REQUIRE(value == uint256_t(10));
      value += 5;
      ++value;
      value -= 6;
      REQUIRE(value.get() == uint256_t(10));
      REQUIRE(value < uint256_t(11));
      REQUIRE(value >= uint256_t(10));
      REQUIRE_THROWS(value -= 11);
      SafeUint256_t max(Utils::maxUint256());
      REQUIRE_THROWS(++max);
    }

    SECTION("SafeUint256_t revert") {
      SafeUint256_t value(uint256_t(1));
      value.checkpoint(1);
      REQUIRE(value.checkpointDepth() == 1);
      value = uint256_t(100);
      value.revert();
      REQUIRE(value.get() == uint256_t(1));
      REQUIRE(value.checkpointDepth() == 0);
    }

    SECTION("SafeUint256_t commit at top level") {
      SafeUint256_t value(uint256_t(1));
      value.checkpoint(1);
      value = uint256_t(100);
      REQUIRE(!value.commit(1));
      REQUIRE(value.get() == uint256_t(100));
      REQUIRE(value.checkpointDepth() == 0);
    }

    SECTION("SafeUint256_t nested commit then outer revert") {
      SafeUint256_t value(uint256_t(1));
      // Frame 2 changes the value and succeeds, frame 1 fails afterwards.
      value.checkpoint(2);
      value = uint256_t(2);
      REQUIRE(value.commit(2));
      REQUIRE(value.checkpointDepth() == 1);
      value.revert();
      REQUIRE(value.get() == uint256_t(1));
    }

    SECTION("SafeUint256_t nested revert keeps outer changes") {
      SafeUint256_t value(uint256_t(1));
      value.checkpoint(1);
      value = uint256_t(2);
      value.checkpoint(2);
      value = uint256_t(3);
      value.revert();
      REQUIRE(value.get() == uint256_t(2));
      REQUIRE(value.checkpointDepth() == 1);
      REQUIRE(!value.commit(1));
      REQUIRE(value.get() == uint256_t(2));
    }

    SECTION("SafeUint256_t nested commit into a frame with its own checkpoint") {
      SafeUint256_t value(uint256_t(1));
      value.checkpoint(1);
      value = uint256_t(2);
      value.checkpoint(2);
      value = uint256_t(3);
      // The enclosing frame already saved the original value.
      REQUIRE(!value.commit(2));
      REQUIRE(value.get() == uint256_t(3));
      value.revert();
      REQUIRE(value.get() == uint256_t(1));
    }
  }

  TEST_CASE("SafeAddress and SafeString Classes", "[contract][variables][safeaddress][safestring]") {
    SECTION("SafeAddress revert") {
      const Address first(std::string_view("0x00dead00665771855a34155f5e7405489df2c3c6"));
      const Address second(std::string_view("0x1234567890123456789012345678901234567890"));
      SafeAddress address(first);
      address.checkpoint(1);
      address = second;
      REQUIRE(address.get() == second);
      address.revert();
      REQUIRE(address.get() == first);
    }

    SECTION("SafeString append and revert") {
      SafeString str(std::string("https://"));
      REQUIRE(str.size() == 8);
      str.checkpoint(1);
      str += "example.com/";
      REQUIRE(str.get() == "https://example.com/");
      str.revert();
      REQUIRE(str.get() == "https://");
      REQUIRE(!str.empty());
      REQUIRE(SafeString().empty());
    }
  }

  TEST_CASE("SafeUnorderedMap Class", "[contract][variables][safeunorderedmap]") {
    SECTION("SafeUnorderedMap revert restores changed and removes added keys") {
      SafeUnorderedMap<uint256_t, Address> map;
      const Address owner(std::string_view("0x00dead00665771855a34155f5e7405489df2c3c6"));
      const Address other(std::string_view("0x1234567890123456789012345678901234567890"));
      map[0] = owner;
      map[1] = owner;

      map.checkpoint(1);
      map[1] = other;
      map[2] = other;
      map.erase(0);
      REQUIRE(map.size() == 2);
      REQUIRE(!map.contains(0));
      map.revert();

      REQUIRE(map.size() == 2);
      REQUIRE(map.find(0)->second == owner);
      REQUIRE(map.find(1)->second == owner);
      REQUIRE(!map.contains(2));
    }

    SECTION("SafeUnorderedMap erase of a missing key") {
      SafeUnorderedMap<Address, uint256_t> map;
      REQUIRE(map.erase(Address()) == 0);
      REQUIRE(map.empty());
    }

    SECTION("SafeUnorderedMap nested commit then outer revert") {
      SafeUnorderedMap<Address, uint256_t> balances;
      const Address account(std::string_view("0x00dead00665771855a34155f5e7405489df2c3c6"));
      balances[account] = 1;

      balances.checkpoint(1);
      balances[account] += 1;
      balances.checkpoint(2);
      balances[account] += 1;
      balances[Address()] = 5;
      REQUIRE(!balances.commit(2));
      REQUIRE(balances.find(account)->second == uint256_t(3));
      balances.revert();

      REQUIRE(balances.find(account)->second == uint256_t(1));
      REQUIRE(!balances.contains(Address()));
      REQUIRE(balances.checkpointDepth() == 0);
    }

    SECTION("SafeUnorderedMap commit hands originals to the enclosing frame") {
      SafeUnorderedMap<uint256_t, std::string> uris;
      uris[7] = "a";
      uris.checkpoint(2);
      uris[7] = "b";
      REQUIRE(uris.commit(2));
      REQUIRE(uris.checkpointDepth() == 1);
      uris.checkpoint(2);
      uris[7] = "c";
      REQUIRE(!uris.commit(2));
      uris.revert();
      REQUIRE(uris.find(7)->second == "a");
    }
  }
}
