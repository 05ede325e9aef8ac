#ifndef ERC721SERIES_H
#define ERC721SERIES_H

#include <string>
#include <tuple>

// ERC721Series derives from base ERC721
#include "erc721.h"
#include "../reentrancyguard.h"
#include "../variables/safeaddress.h"
#include "../variables/safestring.h"
#include "../variables/safeuint256.h"

/// Mutable configuration of a series, changed only by its admins.
struct SeriesConfig {
  uint256_t mintPriceWei;       ///< Exact price of one mint, in wei (may be zero).
  Address paymentRecipient;     ///< Receives the mint proceeds. Never the zero address.
  std::string metadataBaseURI;  ///< Prefix of every token URI.

  bool operator==(const SeriesConfig& other) const = default;
};

/// Limits of a series, fixed at construction.
struct SeriesLimits {
  Address creator;              ///< Identity that deployed the series.
  uint256_t maxSupply;          ///< Inclusive cap on minted tokens. Zero means unlimited.
  uint256_t maxPerAcquisition;  ///< Tokens issued per mint (always 1).

  bool operator==(const SeriesLimits& other) const = default;
};

/**
 * ERC721Series
 * A single priced, sequentially numbered token series.
 * Anyone can mint the next token id by paying exactly the mint price, which
 * is forwarded in full to the payment recipient within the same call.
 * The creator and the current payment recipient administer the series.
 */
class ERC721Series : public ERC721 {
  private:
    const SeriesLimits limits_;         ///< Creator, supply cap and per-call amount.
    SafeUint256_t mintPriceWei_;        ///< Price of one mint, in wei.
    SafeAddress paymentRecipient_;      ///< Recipient of the proceeds (and admin).
    SafeString tokenBaseURI_;           ///< Base URI for the token metadata.
    SafeUint256_t nextId_;              ///< Next token id, also the number of tokens minted.
    bool minting_ = false;              ///< Reentrancy flag for mint().

    void registerContractFunctions() override;

    /// @throw ContractException(Unauthorized) if the caller is neither the creator nor the current recipient.
    void onlyAdmin_() const;

    std::string baseURI_() const override { return this->tokenBaseURI_.get(); }

    /// ERC-4906: event BatchMetadataUpdate(uint256 _fromTokenId, uint256 _toTokenId);
    void BatchMetadataUpdate(const uint256_t& fromTokenId, const uint256_t& toTokenId);

    void MintPriceUpdated(const uint256_t& previousPrice, const uint256_t& newPrice);

    void PaymentRecipientUpdated(const Address& previousRecipient, const Address& newRecipient);

  public:
    /// Number of tokens issued by each mint() call.
    static constexpr uint64_t maxPerAcquisitionValue = 1;

    /**
     * Constructor to be used when creating a new contract.
     * @param baseURI The base URI for the token metadata.
     * @param erc721name The name of the token.
     * @param erc721symbol The symbol of the token.
     * @param mintPrice The price of one mint, in wei.
     * @param paymentRecipient The recipient of the proceeds. The zero address
     *                         means the creator.
     * @param maxSupply The supply cap. Zero means unlimited.
     * @param host Reference to the contract host.
     * @param address The address where the contract will be deployed.
     * @param creator The address of the creator of the contract.
     * @param chainId The chain where the contract will be deployed.
     * @throw ContractException(InvalidRecipient) if no recipient can be determined.
     */
    ERC721Series(
      const std::string& baseURI, const std::string& erc721name, const std::string& erc721symbol,
      const uint256_t& mintPrice, const Address& paymentRecipient, const uint256_t& maxSupply,
      ContractHost& host, const Address& address, const Address& creator, const uint64_t& chainId
    );

    /**
     * Mint the next token to the caller. Payable: the attached value must be
     * exactly the mint price and is forwarded to the payment recipient.
     * @return The minted token id.
     * @throw ContractException(ReentrantCall) if called while a mint is running.
     * @throw ContractException(SupplyExceeded) if the supply cap is reached.
     * @throw ContractException(IncorrectPayment) if the value differs from the price.
     * @throw ContractException(PaymentForwardingFailed) if the recipient does not take the payment.
     */
    uint256_t mint();

    /// Change the base URI. Admin only. Emits BatchMetadataUpdate for every token.
    void setBaseURI(const std::string& baseURI);

    /// Change the mint price. Admin only.
    void setMintPrice(const uint256_t& mintPrice);

    /**
     * Change the payment recipient. Admin only.
     * The previous recipient loses its admin rights and the new one gains them.
     * @throw ContractException(InvalidRecipient) if `recipient` is the zero address.
     */
    void setPaymentRecipient(const Address& recipient);

    /**
     * Whether minting is still possible, and how many tokens remain.
     * Uncapped series report (true, 2^256 - 1 - totalSupply()).
     */
    std::tuple<bool, uint256_t> mintingAvailable() const;

    /// Number of tokens minted so far.
    uint256_t totalSupply() const { return this->nextId_.get(); }

    uint256_t maxSupply() const { return this->limits_.maxSupply; }

    uint256_t maxPerAcquisition() const { return this->limits_.maxPerAcquisition; }

    uint256_t mintPrice() const { return this->mintPriceWei_.get(); }

    Address paymentRecipient() const { return this->paymentRecipient_.get(); }

    std::string baseURI() const { return this->tokenBaseURI_.get(); }

    Address creator() const { return this->limits_.creator; }

    /// Current price, recipient and base URI.
    SeriesConfig seriesConfig() const;

    /// Creator, supply cap and per-call amount.
    SeriesLimits seriesLimits() const { return this->limits_; }

    /// Adds ERC-4906 (0x49064906) to the ERC721 interfaces.
    bool supportsInterface(const uint32_t& interfaceId) const override;
};

#endif // ERC721SERIES_H
