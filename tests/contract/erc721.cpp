#include <catch2/catch.hpp>

#include "../../src/contract/templates/erc721.h"
#include "../sdktestsuite.hpp"

/// ERC721 with a public mint, for testing the registry on its own.
class TestERC721 : public ERC721 {
  private:
    const std::string base_;

    void registerContractFunctions() override {
      this->registerMemberFunction("mint", &TestERC721::mint, FunctionTypes::NonPayable, this);
    }

    std::string baseURI_() const override { return this->base_; }

  public:
    TestERC721(const std::string& base,
      ContractHost& host, const Address& address, const Address& creator, const uint64_t& chainId
    ) : ERC721("TestERC721", "Test Token", "TST", host, address, creator, chainId), base_(base)
    {
      this->registerContractFunctions();
    }

    void mint(const Address& to, const uint256_t& tokenId) { this->mint_(to, tokenId); }
};

namespace TERC721 {
  TEST_CASE("ERC721 Class", "[contract][erc721]") {
    SECTION("ERC721 Constructor") {
      SDKTestSuite sdk = SDKTestSuite::createNewEnvironment("testERC721Constructor");
      Address erc721 = sdk.deployContract<ERC721>(std::string("My Token"), std::string("MTK"));
      REQUIRE(sdk.callViewFunction<std::string>(erc721, "name") == "My Token");
      REQUIRE(sdk.callViewFunction<std::string>(erc721, "symbol") == "MTK");
      REQUIRE(sdk.callViewFunction<uint256_t>(erc721, "balanceOf", sdk.getChainOwnerAccount()) == uint256_t(0));
      REQUIRE(!sdk.callViewFunction<bool>(erc721, "exists", uint256_t(0)));
      REQUIRE(sdk.getHost().getContract<ERC721>(erc721).getContractName() == "ERC721");
    }

    SECTION("ERC721 mint") {
      SDKTestSuite sdk = SDKTestSuite::createNewEnvironment("testERC721Mint");
      Address erc721 = sdk.deployContract<TestERC721>(std::string("ipfs://tokens/"));
      const Address& owner = sdk.getTestAccounts()[0];
      sdk.callFunction<void>(owner, erc721, 0, "mint", owner, uint256_t(42));

      REQUIRE(sdk.callViewFunction<Address>(erc721, "ownerOf", uint256_t(42)) == owner);
      REQUIRE(sdk.callViewFunction<uint256_t>(erc721, "balanceOf", owner) == uint256_t(1));
      REQUIRE(sdk.callViewFunction<bool>(erc721, "exists", uint256_t(42)));
      REQUIRE(sdk.callViewFunction<std::string>(erc721, "tokenURI", uint256_t(42)) == "ipfs://tokens/42");

      auto transfers = sdk.getEvents(erc721, "Transfer");
      REQUIRE(transfers.size() == 1);
      REQUIRE(transfers[0].params["from"].get<std::string>() == Address().hex(true).get());
      REQUIRE(transfers[0].params["to"].get<std::string>() == owner.hex(true).get());
      REQUIRE(transfers[0].params["tokenId"].get<std::string>() == "42");
    }

    SECTION("ERC721 mint errors") {
      SDKTestSuite sdk = SDKTestSuite::createNewEnvironment("testERC721MintErrors");
      Address erc721 = sdk.deployContract<TestERC721>(std::string(""));
      const Address& owner = sdk.getTestAccounts()[0];
      const Address& other = sdk.getTestAccounts()[1];
      sdk.callFunction<void>(owner, erc721, 0, "mint", owner, uint256_t(1));

      REQUIRE(SDKTestSuite::errorOf([&]() {
        sdk.callFunction<void>(owner, erc721, 0, "mint", Address(), uint256_t(2));
      }) == ContractError::InvalidReceiver);
      REQUIRE(SDKTestSuite::errorOf([&]() {
        sdk.callFunction<void>(owner, erc721, 0, "mint", other, uint256_t(1));
      }) == ContractError::TokenAlreadyMinted);

      // The failed mint left no trace.
      REQUIRE(sdk.callViewFunction<Address>(erc721, "ownerOf", uint256_t(1)) == owner);
      REQUIRE(sdk.callViewFunction<uint256_t>(erc721, "balanceOf", owner) == uint256_t(1));
      REQUIRE(sdk.callViewFunction<uint256_t>(erc721, "balanceOf", other) == uint256_t(0));
      REQUIRE(sdk.getEvents(erc721, "Transfer").size() == 1);
      // No base URI, no token URI.
      REQUIRE(sdk.callViewFunction<std::string>(erc721, "tokenURI", uint256_t(1)) == "");
    }

    SECTION("ERC721 queries on missing tokens") {
      SDKTestSuite sdk = SDKTestSuite::createNewEnvironment("testERC721Missing");
      Address erc721 = sdk.deployContract<TestERC721>(std::string("ipfs://tokens/"));
      REQUIRE(SDKTestSuite::errorOf([&]() {
        sdk.callViewFunction<Address>(erc721, "ownerOf", uint256_t(7));
      }) == ContractError::NoSuchToken);
      REQUIRE(SDKTestSuite::errorOf([&]() {
        sdk.callViewFunction<std::string>(erc721, "tokenURI", uint256_t(7));
      }) == ContractError::NoSuchToken);
      REQUIRE(SDKTestSuite::errorOf([&]() {
        sdk.callViewFunction<Address>(erc721, "getApproved", uint256_t(7));
      }) == ContractError::NoSuchToken);
      REQUIRE(SDKTestSuite::errorOf([&]() {
        sdk.callViewFunction<uint256_t>(erc721, "balanceOf", Address());
      }) == ContractError::InvalidOwner);
    }

    SECTION("ERC721 approve and transferFrom") {
      SDKTestSuite sdk = SDKTestSuite::createNewEnvironment("testERC721Approve");
      Address erc721 = sdk.deployContract<TestERC721>(std::string(""));
      const Address& owner = sdk.getTestAccounts()[0];
      const Address& spender = sdk.getTestAccounts()[1];
      const Address& receiver = sdk.getTestAccounts()[2];
      sdk.callFunction<void>(owner, erc721, 0, "mint", owner, uint256_t(0));

      REQUIRE(SDKTestSuite::errorOf([&]() {
        sdk.callFunction<void>(spender, erc721, 0, "transferFrom", owner, receiver, uint256_t(0));
      }) == ContractError::InsufficientApproval);
      REQUIRE(SDKTestSuite::errorOf([&]() {
        sdk.callFunction<void>(spender, erc721, 0, "approve", spender, uint256_t(0));
      }) == ContractError::InvalidApprover);

      sdk.callFunction<void>(owner, erc721, 0, "approve", spender, uint256_t(0));
      REQUIRE(sdk.callViewFunction<Address>(erc721, "getApproved", uint256_t(0)) == spender);
      REQUIRE(sdk.getEvents(erc721, "Approval").size() == 1);

      sdk.callFunction<void>(spender, erc721, 0, "transferFrom", owner, receiver, uint256_t(0));
      REQUIRE(sdk.callViewFunction<Address>(erc721, "ownerOf", uint256_t(0)) == receiver);
      REQUIRE(sdk.callViewFunction<Address>(erc721, "getApproved", uint256_t(0)) == Address());
      REQUIRE(sdk.callViewFunction<uint256_t>(erc721, "balanceOf", owner) == uint256_t(0));
      REQUIRE(sdk.callViewFunction<uint256_t>(erc721, "balanceOf", receiver) == uint256_t(1));

      // The approval was consumed.
      REQUIRE(SDKTestSuite::errorOf([&]() {
        sdk.callFunction<void>(spender, erc721, 0, "transferFrom", receiver, owner, uint256_t(0));
      }) == ContractError::InsufficientApproval);
    }

    SECTION("ERC721 transferFrom errors") {
      SDKTestSuite sdk = SDKTestSuite::createNewEnvironment("testERC721TransferErrors");
      Address erc721 = sdk.deployContract<TestERC721>(std::string(""));
      const Address& owner = sdk.getTestAccounts()[0];
      const Address& other = sdk.getTestAccounts()[1];
      sdk.callFunction<void>(owner, erc721, 0, "mint", owner, uint256_t(0));

      REQUIRE(SDKTestSuite::errorOf([&]() {
        sdk.callFunction<void>(owner, erc721, 0, "transferFrom", owner, Address(), uint256_t(0));
      }) == ContractError::InvalidReceiver);
      REQUIRE(SDKTestSuite::errorOf([&]() {
        sdk.callFunction<void>(owner, erc721, 0, "transferFrom", other, owner, uint256_t(0));
      }) == ContractError::IncorrectOwner);
      REQUIRE(SDKTestSuite::errorOf([&]() {
        sdk.callFunction<void>(owner, erc721, 0, "transferFrom", owner, other, uint256_t(5));
      }) == ContractError::NoSuchToken);

      REQUIRE(sdk.callViewFunction<Address>(erc721, "ownerOf", uint256_t(0)) == owner);
      REQUIRE(sdk.callViewFunction<uint256_t>(erc721, "balanceOf", owner) == uint256_t(1));
      REQUIRE(sdk.callViewFunction<uint256_t>(erc721, "balanceOf", other) == uint256_t(0));
    }

    SECTION("ERC721 setApprovalForAll") {
      SDKTestSuite sdk = SDKTestSuite::createNewEnvironment("testERC721ApprovalForAll");
      Address erc721 = sdk.deployContract<TestERC721>(std::string(""));
      const Address& owner = sdk.getTestAccounts()[0];
      const Address& operatorAddress = sdk.getTestAccounts()[1];
      const Address& approved = sdk.getTestAccounts()[2];
      sdk.callFunction<void>(owner, erc721, 0, "mint", owner, uint256_t(0));
      sdk.callFunction<void>(owner, erc721, 0, "mint", owner, uint256_t(1));

      REQUIRE(SDKTestSuite::errorOf([&]() {
        sdk.callFunction<void>(owner, erc721, 0, "setApprovalForAll", Address(), true);
      }) == ContractError::InvalidOperator);

      sdk.callFunction<void>(owner, erc721, 0, "setApprovalForAll", operatorAddress, true);
      REQUIRE(sdk.callViewFunction<bool>(erc721, "isApprovedForAll", owner, operatorAddress));
      REQUIRE(!sdk.callViewFunction<bool>(erc721, "isApprovedForAll", operatorAddress, owner));

      // An operator can approve others and transfer.
      sdk.callFunction<void>(operatorAddress, erc721, 0, "approve", approved, uint256_t(1));
      REQUIRE(sdk.callViewFunction<Address>(erc721, "getApproved", uint256_t(1)) == approved);
      sdk.callFunction<void>(operatorAddress, erc721, 0, "transferFrom", owner, operatorAddress, uint256_t(0));
      REQUIRE(sdk.callViewFunction<Address>(erc721, "ownerOf", uint256_t(0)) == operatorAddress);

      sdk.callFunction<void>(owner, erc721, 0, "setApprovalForAll", operatorAddress, false);
      REQUIRE(!sdk.callViewFunction<bool>(erc721, "isApprovedForAll", owner, operatorAddress));
      REQUIRE(SDKTestSuite::errorOf([&]() {
        sdk.callFunction<void>(operatorAddress, erc721, 0, "transferFrom", owner, operatorAddress, uint256_t(1));
      }) == ContractError::InsufficientApproval);
      REQUIRE(sdk.getEvents(erc721, "ApprovalForAll").size() == 2);
    }

    SECTION("ERC721 supportsInterface") {
      SDKTestSuite sdk = SDKTestSuite::createNewEnvironment("testERC721Interfaces");
      Address erc721 = sdk.deployContract<ERC721>(std::string("My Token"), std::string("MTK"));
      REQUIRE(sdk.callViewFunction<bool>(erc721, "supportsInterface", uint32_t(0x01ffc9a7)));
      REQUIRE(sdk.callViewFunction<bool>(erc721, "supportsInterface", uint32_t(0x80ac58cd)));
      REQUIRE(sdk.callViewFunction<bool>(erc721, "supportsInterface", uint32_t(0x5b5e139f)));
      REQUIRE(!sdk.callViewFunction<bool>(erc721, "supportsInterface", uint32_t(0x49064906)));
      REQUIRE(!sdk.callViewFunction<bool>(erc721, "supportsInterface", uint32_t(0xffffffff)));
    }
  }
}
