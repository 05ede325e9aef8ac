#include "options.h"

/**
 * Example JSON file
 *  {
 *    "rootPath": "seriesmint",
 *    "web3clientVersion": "SeriesMint/cpp/linux_x86-64/0.1.0",
 *    "version": 1,
 *    "chainID": 8453,
 *    "logLevel": "INFO",
 *    "deployer": "0x00dead00665771855a34155f5e7405489df2c3c6",
 *    "series": {
 *      "baseURI": "https://fc-nfts.kasra.codes/tokens/",
 *      "name": "Generic Farcaster NFT",
 *      "symbol": "GNFT",
 *      "mintPrice": "0.0025 ether",
 *      "paymentRecipient": "",
 *      "maxSupply": "0"
 *    },
 *    "genesis": {
 *      "balances": [
 *        { "address": "0x00dead00665771855a34155f5e7405489df2c3c6", "balance": "1000000000000000000000" }
 *      ]
 *    }
 *  }
 */

Options::Options(
  const std::string& rootPath, const std::string& web3clientVersion,
  const uint64_t& version, const uint64_t& chainID, const LogType& logLevel,
  const Address& deployer, const SeriesOptions& series,
  const std::vector<std::pair<Address, uint256_t>>& genesisBalances
) : rootPath_(rootPath), web3clientVersion_(web3clientVersion),
  version_(version), chainID_(chainID), logLevel_(logLevel),
  deployer_(deployer), series_(series), genesisBalances_(genesisBalances)
{
  std::filesystem::create_directories(rootPath);
  std::ofstream o(rootPath + "/options.json");
  if (!o.is_open()) throw DynamicException("Options: could not write ", rootPath, "/options.json");
  o << this->toJson().dump(2) << std::endl;
  o.close();
}

json Options::toJson() const {
  json options = json::object({
    {"rootPath", this->rootPath_},
    {"web3clientVersion", this->web3clientVersion_},
    {"version", this->version_},
    {"chainID", this->chainID_},
    {"logLevel", Logger::logTypeToString(this->logLevel_)},
    {"deployer", this->deployer_.hex(true).get()},
    {"series", json::object({
      {"baseURI", this->series_.baseURI},
      {"name", this->series_.name},
      {"symbol", this->series_.symbol},
      {"mintPrice", this->series_.mintPrice.str()},
      {"paymentRecipient", (this->series_.paymentRecipient) ? this->series_.paymentRecipient.hex(true).get() : ""},
      {"maxSupply", this->series_.maxSupply.str()}
    })},
    {"genesis", json::object({
      {"balances", json::array()}
    })}
  });

  for (const auto& [address, balance] : this->genesisBalances_) {
    options["genesis"]["balances"].push_back(json::object({
      {"address", address.hex(true).get()},
      {"balance", balance.str()}
    }));
  }
  return options;
}

SeriesOptions Options::defaultSeries() {
  return SeriesOptions{
    "https://fc-nfts.kasra.codes/tokens/",
    "Generic Farcaster NFT",
    "GNFT",
    Utils::parseNativeAmount("0.0025 ether"),
    Address(),
    0
  };
}

Options Options::fromFile(const std::string& rootPath) {
  if (!std::filesystem::exists(rootPath + "/options.json")) {
    /// Defaults for local usage:
    /// Deployer: 0x00dead00665771855a34155f5e7405489df2c3c6, funded with 1000 ether.
    /// Chain ID: 8453.
    const Address deployer(std::string_view("0x00dead00665771855a34155f5e7405489df2c3c6"));
    std::vector<std::pair<Address, uint256_t>> genesisBalances {
      std::make_pair(deployer, uint256_t("1000000000000000000000"))
    };
    Logger::logToDebug(LogType::INFO, Log::options, __func__,
      "No options.json found in " + rootPath + ", writing defaults"
    );
    return Options(rootPath, "SeriesMint/cpp/linux_x86-64/0.1.0", 1, 8453, LogType::INFO,
      deployer, Options::defaultSeries(), genesisBalances
    );
  }

  try {
    std::ifstream i(rootPath + "/options.json");
    json options;
    i >> options;
    i.close();

    const json& series = options.at("series");
    const std::string recipient = series.at("paymentRecipient").get<std::string>();
    SeriesOptions seriesOptions{
      series.at("baseURI").get<std::string>(),
      series.at("name").get<std::string>(),
      series.at("symbol").get<std::string>(),
      Utils::parseNativeAmount(series.at("mintPrice").get<std::string>()),
      recipient.empty() ? Address() : Address(recipient),
      Utils::parseUint256(series.at("maxSupply").get<std::string>())
    };

    std::vector<std::pair<Address, uint256_t>> genesisBalances;
    for (const auto& balance : options.at("genesis").at("balances")) {
      genesisBalances.emplace_back(
        Address(balance.at("address").get<std::string>()),
        Utils::parseNativeAmount(balance.at("balance").get<std::string>())
      );
    }

    return Options(
      options.at("rootPath").get<std::string>(),
      options.at("web3clientVersion").get<std::string>(),
      options.at("version").get<uint64_t>(),
      options.at("chainID").get<uint64_t>(),
      Logger::logTypeFromString(options.value("logLevel", std::string("INFO"))),
      Address(options.at("deployer").get<std::string>()),
      seriesOptions,
      genesisBalances
    );
  } catch (const std::exception& e) {
    Logger::logToDebug(LogType::ERROR, Log::options, __func__,
      "Could not load " + rootPath + "/options.json: " + e.what()
    );
    throw DynamicException("Could not load options from ", rootPath, ": ", e.what());
  }
}
