#include "seriesmanager.h"

namespace po = boost::program_options;

namespace SeriesMint {
  po::options_description makeOptionsDescription() {
    po::options_description desc("seriesmintd - deploy and mint a priced ERC721 token series on a local contract host");
    // clang-format off
    desc.add_options()
      ("help,h", "Display help message.")
      ("root-path", po::value<std::string>()->default_value("seriesmint"), "Directory holding options.json and debug.txt.")
      ("base-uri", po::value<std::string>(), "Base URI for the token metadata.")
      ("name", po::value<std::string>(), "Token name.")
      ("symbol", po::value<std::string>(), "Token symbol.")
      ("price", po::value<std::string>(), "Mint price, e.g. \"0.0025 ether\", \"30 gwei\" or a plain wei amount.")
      ("recipient", po::value<std::string>(), "Payment recipient address (empty for the deployer).")
      ("max-supply", po::value<std::string>(), "Supply cap as a decimal integer (0 for unlimited).")
      ("chain-id", po::value<uint64_t>(), "Chain ID.")
      ("mint", po::value<uint64_t>()->default_value(0), "Number of tokens to mint from the deployer after deploying.")
      ("verbose,v", "Echo log messages to stdout.");
    // clang-format on
    return desc;
  }

  Overrides parseOverrides(const po::variables_map& vm) {
    Overrides overrides;
    if (vm.count("base-uri")) overrides.baseURI = vm["base-uri"].as<std::string>();
    if (vm.count("name")) overrides.name = vm["name"].as<std::string>();
    if (vm.count("symbol")) overrides.symbol = vm["symbol"].as<std::string>();
    if (vm.count("price")) overrides.price = vm["price"].as<std::string>();
    if (vm.count("recipient")) overrides.recipient = vm["recipient"].as<std::string>();
    if (vm.count("max-supply")) overrides.maxSupply = vm["max-supply"].as<std::string>();
    if (vm.count("chain-id")) overrides.chainID = vm["chain-id"].as<uint64_t>();
    return overrides;
  }

  Options applyOverrides(const Options& loaded, const Overrides& overrides) {
    SeriesOptions series = loaded.getSeries();
    if (overrides.baseURI) series.baseURI = *overrides.baseURI;
    if (overrides.name) series.name = *overrides.name;
    if (overrides.symbol) series.symbol = *overrides.symbol;
    if (overrides.price) series.mintPrice = Utils::parseNativeAmount(*overrides.price);
    if (overrides.recipient) {
      series.paymentRecipient = overrides.recipient->empty() ? Address() : Address(*overrides.recipient);
    }
    if (overrides.maxSupply) series.maxSupply = Utils::parseUint256(*overrides.maxSupply);
    const uint64_t chainID = overrides.chainID.value_or(loaded.getChainID());

    if (series == loaded.getSeries() && chainID == loaded.getChainID()) return loaded;
    Logger::logToDebug(LogType::INFO, Log::seriesmintd, __func__,
      "Writing command line overrides to " + loaded.getRootPath() + "/options.json"
    );
    return Options(
      loaded.getRootPath(), loaded.getWeb3ClientVersion(), loaded.getVersion(), chainID,
      loaded.getLogLevel(), loaded.getDeployer(), series, loaded.getGenesisBalances()
    );
  }

  Manager::Manager(const Options& options) : options_(options), host_(options.getChainID()) {
    for (const auto& [address, balance] : this->options_.getGenesisBalances()) {
      this->host_.addBalance(address, balance);
    }
  }

  const Address& Manager::deploy() {
    if (this->series_) throw DynamicException("Series already deployed at ", this->series_.hex(true));
    const SeriesOptions& params = this->options_.getSeries();
    this->series_ = this->host_.deployContract<ERC721Series>(this->options_.getDeployer(),
      params.baseURI, params.name, params.symbol, params.mintPrice, params.paymentRecipient, params.maxSupply
    );
    return this->series_;
  }

  std::vector<std::pair<uint256_t, std::string>> Manager::mint(uint64_t count) {
    std::vector<std::pair<uint256_t, std::string>> minted;
    for (uint64_t i = 0; i < count; i++) {
      const uint256_t price = this->host_.callViewFunction<uint256_t>(this->series_, "mintPrice");
      const uint256_t tokenId = this->host_.callFunction<uint256_t>(
        this->options_.getDeployer(), this->series_, price, "mint"
      );
      minted.emplace_back(tokenId, this->host_.callViewFunction<std::string>(this->series_, "tokenURI", tokenId));
    }
    return minted;
  }

  json Manager::summary() const {
    const auto [available, remaining] =
      this->host_.callViewFunction<std::tuple<bool, uint256_t>>(this->series_, "mintingAvailable");
    return json::object({
      {"address", this->series_.hex(true).get()},
      {"name", this->host_.callViewFunction<std::string>(this->series_, "name")},
      {"symbol", this->host_.callViewFunction<std::string>(this->series_, "symbol")},
      {"baseURI", this->host_.callViewFunction<std::string>(this->series_, "baseURI")},
      {"mintPrice", Utils::formatNativeAmount(this->host_.callViewFunction<uint256_t>(this->series_, "mintPrice"))},
      {"paymentRecipient", this->host_.callViewFunction<Address>(this->series_, "paymentRecipient").hex(true).get()},
      {"creator", this->host_.callViewFunction<Address>(this->series_, "creator").hex(true).get()},
      {"maxSupply", this->host_.callViewFunction<uint256_t>(this->series_, "maxSupply").str()},
      {"totalSupply", this->host_.callViewFunction<uint256_t>(this->series_, "totalSupply").str()},
      {"mintingAvailable", json::object({{"available", available}, {"remaining", remaining.str()}})}
    });
  }
};
