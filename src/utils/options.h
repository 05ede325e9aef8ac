#ifndef OPTIONS_H
#define OPTIONS_H

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "strings.h"
#include "utils.h"

/// Deployment parameters of a token series.
struct SeriesOptions {
  std::string baseURI;      ///< Metadata base URI.
  std::string name;         ///< Token name.
  std::string symbol;       ///< Token symbol.
  uint256_t mintPrice;      ///< Price of one mint, in wei.
  Address paymentRecipient; ///< Recipient of mint proceeds. Zero means the deployer.
  uint256_t maxSupply;      ///< Supply cap. Zero means unlimited.

  bool operator==(const SeriesOptions& other) const = default;
};

/**
 * Class for the tool options, backed by `<rootPath>/options.json`.
 * Constructing an Options object (re)writes that file.
 */
class Options {
  private:
    const std::string rootPath_;          ///< Path to the data directory.
    const std::string web3clientVersion_; ///< Client version string.
    const uint64_t version_;              ///< Options file version.
    const uint64_t chainID_;              ///< Chain ID the series is deployed to.
    const LogType logLevel_;              ///< Minimum log level.
    const Address deployer_;              ///< Identity deploying (and creating) the series.
    const SeriesOptions series_;          ///< Series deployment parameters.
    const std::vector<std::pair<Address, uint256_t>> genesisBalances_; ///< Initial native balances.

  public:
    /**
     * Constructor. Writes the options to `<rootPath>/options.json`.
     * @param rootPath Path to the data directory.
     * @param web3clientVersion Client version string.
     * @param version Options file version.
     * @param chainID Chain ID.
     * @param logLevel Minimum log level.
     * @param deployer Identity deploying the series.
     * @param series Series deployment parameters.
     * @param genesisBalances Initial native balances.
     */
    Options(
      const std::string& rootPath, const std::string& web3clientVersion,
      const uint64_t& version, const uint64_t& chainID, const LogType& logLevel,
      const Address& deployer, const SeriesOptions& series,
      const std::vector<std::pair<Address, uint256_t>>& genesisBalances
    );

    /// Getters.
    const std::string& getRootPath() const { return this->rootPath_; }
    const std::string& getWeb3ClientVersion() const { return this->web3clientVersion_; }
    const uint64_t& getVersion() const { return this->version_; }
    const uint64_t& getChainID() const { return this->chainID_; }
    const LogType& getLogLevel() const { return this->logLevel_; }
    const Address& getDeployer() const { return this->deployer_; }
    const SeriesOptions& getSeries() const { return this->series_; }
    const std::vector<std::pair<Address, uint256_t>>& getGenesisBalances() const { return this->genesisBalances_; }

    /// Serialize the options to json (the contents of options.json).
    json toJson() const;

    /// Default series parameters.
    static SeriesOptions defaultSeries();

    /**
     * Load the options from `<rootPath>/options.json`.
     * If the file does not exist, it is created with default values.
     * @param rootPath Path to the data directory.
     * @return The loaded options.
     * @throw DynamicException if the file cannot be read or is malformed.
     */
    static Options fromFile(const std::string& rootPath);
};

#endif // OPTIONS_H
