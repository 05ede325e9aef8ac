#include <catch2/catch.hpp>

#include "../../src/utils/options.h"

#include <filesystem>
#include <fstream>

namespace TOptions {
  TEST_CASE("Option Class", "[utils][options]") {
    SECTION("Options from File (default)") {
      const std::string rootPath = "optionClassFromFileDefault";
      if (std::filesystem::exists(rootPath)) std::filesystem::remove_all(rootPath);

      Options options = Options::fromFile(rootPath);
      REQUIRE(std::filesystem::exists(rootPath + "/options.json"));
      REQUIRE(options.getRootPath() == rootPath);
      REQUIRE(options.getChainID() == 8453);
      REQUIRE(options.getLogLevel() == LogType::INFO);
      REQUIRE(options.getDeployer() == Address(std::string_view("0x00dead00665771855a34155f5e7405489df2c3c6")));
      REQUIRE(options.getSeries() == Options::defaultSeries());
      REQUIRE(options.getSeries().baseURI == "https://fc-nfts.kasra.codes/tokens/");
      REQUIRE(options.getSeries().name == "Generic Farcaster NFT");
      REQUIRE(options.getSeries().symbol == "GNFT");
      REQUIRE(options.getSeries().mintPrice == uint256_t("2500000000000000"));
      REQUIRE(options.getSeries().paymentRecipient == Address());
      REQUIRE(options.getSeries().maxSupply == uint256_t(0));
      REQUIRE(options.getGenesisBalances().size() == 1);
      REQUIRE(options.getGenesisBalances()[0].second == uint256_t("1000000000000000000000"));

      // Loading again reads the file that was just written.
      Options reloaded = Options::fromFile(rootPath);
      REQUIRE(reloaded.toJson() == options.toJson());
    }

    SECTION("Options from File (custom)") {
      const std::string rootPath = "optionClassFromFileCustom";
      if (std::filesystem::exists(rootPath)) std::filesystem::remove_all(rootPath);

      SeriesOptions series{
        "https://example.com/tokens/", "My NFT", "MNFT",
        Utils::parseNativeAmount("0.05 ether"),
        Address(std::string_view("0x1234567890123456789012345678901234567890")),
        uint256_t(5000)
      };
      std::vector<std::pair<Address, uint256_t>> genesisBalances {
        std::make_pair(Address(std::string_view("0x00dead00665771855a34155f5e7405489df2c3c6")), uint256_t("1000000000000000000000")),
        std::make_pair(Address(std::string_view("0x1234567890123456789012345678901234567890")), uint256_t(1))
      };
      Options options(rootPath, "SeriesMint/cpp/linux_x86-64/0.1.0", 2, 84532, LogType::DEBUG,
        Address(std::string_view("0x00dead00665771855a34155f5e7405489df2c3c6")), series, genesisBalances
      );

      Options optionsFromFile(Options::fromFile(rootPath));
      REQUIRE(optionsFromFile.getRootPath() == options.getRootPath());
      REQUIRE(optionsFromFile.getWeb3ClientVersion() == options.getWeb3ClientVersion());
      REQUIRE(optionsFromFile.getVersion() == options.getVersion());
      REQUIRE(optionsFromFile.getChainID() == options.getChainID());
      REQUIRE(optionsFromFile.getLogLevel() == options.getLogLevel());
      REQUIRE(optionsFromFile.getDeployer() == options.getDeployer());
      REQUIRE(optionsFromFile.getSeries() == options.getSeries());
      REQUIRE(optionsFromFile.getGenesisBalances() == options.getGenesisBalances());
    }

    SECTION("Options from File (human readable amounts)") {
      const std::string rootPath = "optionClassFromFileAmounts";
      if (std::filesystem::exists(rootPath)) std::filesystem::remove_all(rootPath);
      std::filesystem::create_directories(rootPath);
      json options = Options::fromFile(rootPath).toJson();
      options["series"]["mintPrice"] = "30 gwei";
      options["genesis"]["balances"][0]["balance"] = "2 ether";
      std::ofstream o(rootPath + "/options.json");
      o << options.dump(2);
      o.close();

      Options loaded = Options::fromFile(rootPath);
      REQUIRE(loaded.getSeries().mintPrice == uint256_t("30000000000"));
      REQUIRE(loaded.getGenesisBalances()[0].second == uint256_t("2000000000000000000"));
    }

    SECTION("Options from File (maxSupply is decimal)") {
      const std::string rootPath = "optionClassFromFileMaxSupply";
      if (std::filesystem::exists(rootPath)) std::filesystem::remove_all(rootPath);
      json options = Options::fromFile(rootPath).toJson();
      auto writeMaxSupply = [&](const std::string& maxSupply) {
        options["series"]["maxSupply"] = maxSupply;
        std::ofstream o(rootPath + "/options.json");
        o << options.dump(2);
        o.close();
      };

      writeMaxSupply("010");
      REQUIRE(Options::fromFile(rootPath).getSeries().maxSupply == uint256_t(10));
      writeMaxSupply("0x10");
      REQUIRE_THROWS_AS(Options::fromFile(rootPath), DynamicException);
      writeMaxSupply("10 ether");
      REQUIRE_THROWS_AS(Options::fromFile(rootPath), DynamicException);
      writeMaxSupply("000");
      REQUIRE(Options::fromFile(rootPath).getSeries().maxSupply == uint256_t(0));
    }

    SECTION("Options from File (malformed)") {
      const std::string rootPath = "optionClassFromFileMalformed";
      if (std::filesystem::exists(rootPath)) std::filesystem::remove_all(rootPath);
      std::filesystem::create_directories(rootPath);
      std::ofstream o(rootPath + "/options.json");
      o << "{ \"rootPath\": \"optionClassFromFileMalformed\", \"series\": {} }";
      o.close();
      REQUIRE_THROWS_AS(Options::fromFile(rootPath), DynamicException);
    }
  }
}
