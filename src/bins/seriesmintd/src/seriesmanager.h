#ifndef SERIESMANAGER_H
#define SERIESMANAGER_H

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>

#include "../../../contract/templates/erc721series.h"
#include "../../../core/contracthost.h"
#include "../../../utils/options.h"

namespace SeriesMint {
  /// Series parameters given on the command line. Unset fields keep the value from options.json.
  struct Overrides {
    std::optional<std::string> baseURI;
    std::optional<std::string> name;
    std::optional<std::string> symbol;
    std::optional<std::string> price;     ///< Native amount, e.g. "0.0025 ether".
    std::optional<std::string> recipient; ///< Empty means the deployer.
    std::optional<std::string> maxSupply; ///< Decimal integer.
    std::optional<uint64_t> chainID;
  };

  /// Command line options of seriesmintd.
  boost::program_options::options_description makeOptionsDescription();

  /// Extract the series overrides from parsed command line options.
  Overrides parseOverrides(const boost::program_options::variables_map& vm);

  /**
   * Apply command line overrides over the options loaded from options.json.
   * options.json is rewritten only if something changed.
   * @param loaded The options loaded from file.
   * @param overrides The overrides to apply.
   * @return The resulting options.
   * @throw DynamicException on a malformed amount, address or supply cap.
   */
  Options applyOverrides(const Options& loaded, const Overrides& overrides);

  /**
   * Local deployment of a series: a contract host funded with the genesis
   * balances, where the deployer creates the series and mints from it.
   */
  class Manager {
    private:
      const Options options_;
      ContractHost host_;
      Address series_;

    public:
      explicit Manager(const Options& options);

      Manager(const Manager& other) = delete;
      Manager& operator=(const Manager& other) = delete;

      /// Deploy the series from the deployer. Throws if it was already deployed.
      const Address& deploy();

      /**
       * Mint tokens from the deployer at the current price.
       * @param count Number of tokens to mint.
       * @return The minted ids with their token URIs.
       */
      std::vector<std::pair<uint256_t, std::string>> mint(uint64_t count);

      /// JSON summary of the state of the series.
      json summary() const;

      const ContractHost& getHost() const { return this->host_; }
      const Address& getSeries() const { return this->series_; }
  };
};

#endif  // SERIESMANAGER_H
