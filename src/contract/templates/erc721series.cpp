#include "erc721series.h"

ERC721Series::ERC721Series(
  const std::string& baseURI, const std::string& erc721name, const std::string& erc721symbol,
  const uint256_t& mintPrice, const Address& paymentRecipient, const uint256_t& maxSupply,
  ContractHost& host, const Address& address, const Address& creator, const uint64_t& chainId
) : ERC721("ERC721Series", erc721name, erc721symbol, host, address, creator, chainId),
  limits_{creator, maxSupply, ERC721Series::maxPerAcquisitionValue},
  mintPriceWei_(this, mintPrice),
  paymentRecipient_(this, (paymentRecipient) ? paymentRecipient : creator),
  tokenBaseURI_(this, baseURI),
  nextId_(this)
{
  if (!this->paymentRecipient_.get()) throw ContractException(
    ContractError::InvalidRecipient, "payment recipient cannot be the zero address"
  );
  this->registerContractFunctions();
}

void ERC721Series::registerContractFunctions() {
  this->registerMemberFunction("mint", &ERC721Series::mint, FunctionTypes::Payable, this);
  this->registerMemberFunction("setBaseURI", &ERC721Series::setBaseURI, FunctionTypes::NonPayable, this);
  this->registerMemberFunction("setMintPrice", &ERC721Series::setMintPrice, FunctionTypes::NonPayable, this);
  this->registerMemberFunction("setPaymentRecipient", &ERC721Series::setPaymentRecipient, FunctionTypes::NonPayable, this);
  this->registerMemberFunction("mintingAvailable", &ERC721Series::mintingAvailable, FunctionTypes::View, this);
  this->registerMemberFunction("totalSupply", &ERC721Series::totalSupply, FunctionTypes::View, this);
  this->registerMemberFunction("maxSupply", &ERC721Series::maxSupply, FunctionTypes::View, this);
  this->registerMemberFunction("maxPerAcquisition", &ERC721Series::maxPerAcquisition, FunctionTypes::View, this);
  this->registerMemberFunction("mintPrice", &ERC721Series::mintPrice, FunctionTypes::View, this);
  this->registerMemberFunction("paymentRecipient", &ERC721Series::paymentRecipient, FunctionTypes::View, this);
  this->registerMemberFunction("baseURI", &ERC721Series::baseURI, FunctionTypes::View, this);
  this->registerMemberFunction("creator", &ERC721Series::creator, FunctionTypes::View, this);
  this->registerMemberFunction("seriesConfig", &ERC721Series::seriesConfig, FunctionTypes::View, this);
  this->registerMemberFunction("seriesLimits", &ERC721Series::seriesLimits, FunctionTypes::View, this);
}

void ERC721Series::onlyAdmin_() const {
  const Address caller = this->getCaller();
  if (caller == this->limits_.creator || caller == this->paymentRecipient_.get()) return;
  throw ContractException(ContractError::Unauthorized,
    caller.hex(true), " is neither the creator nor the payment recipient"
  );
}

void ERC721Series::BatchMetadataUpdate(const uint256_t& fromTokenId, const uint256_t& toTokenId) {
  this->emitEvent(__func__, json::object({
    {"fromTokenId", fromTokenId.str()}, {"toTokenId", toTokenId.str()}
  }));
}

void ERC721Series::MintPriceUpdated(const uint256_t& previousPrice, const uint256_t& newPrice) {
  this->emitEvent(__func__, json::object({
    {"previousPrice", previousPrice.str()}, {"newPrice", newPrice.str()}
  }));
}

void ERC721Series::PaymentRecipientUpdated(const Address& previousRecipient, const Address& newRecipient) {
  this->emitEvent(__func__, json::object({
    {"previousRecipient", previousRecipient.hex(true).get()}, {"newRecipient", newRecipient.hex(true).get()}
  }));
}

uint256_t ERC721Series::mint() {
  ReentrancyGuard guard(this->minting_);
  if (this->limits_.maxSupply != 0 && this->nextId_ >= this->limits_.maxSupply) {
    throw ContractException(ContractError::SupplyExceeded,
      "all ", this->limits_.maxSupply, " tokens have been minted"
    );
  }
  const uint256_t value = this->getValue();
  if (value != this->mintPriceWei_.get()) {
    throw ContractException(ContractError::IncorrectPayment,
      "sent ", value, " wei, price is ", this->mintPriceWei_.get(), " wei"
    );
  }

  // State changes go before the payment, which runs untrusted code.
  const uint256_t tokenId = this->nextId_.get();
  ++this->nextId_;
  this->mint_(this->getCaller(), tokenId);

  const Address recipient = this->paymentRecipient_.get();
  if (!this->sendNative(recipient, value)) {
    throw ContractException(ContractError::PaymentForwardingFailed,
      recipient.hex(true), " did not accept ", value, " wei"
    );
  }
  Logger::logToDebug(LogType::DEBUG, Log::erc721Series, __func__,
    "Minted token " + tokenId.str() + " to " + this->getCaller().hex(true).get()
  );
  return tokenId;
}

void ERC721Series::setBaseURI(const std::string& baseURI) {
  this->onlyAdmin_();
  this->tokenBaseURI_ = baseURI;
  this->BatchMetadataUpdate(0, Utils::maxUint256());
}

void ERC721Series::setMintPrice(const uint256_t& mintPrice) {
  this->onlyAdmin_();
  const uint256_t previousPrice = this->mintPriceWei_.get();
  this->mintPriceWei_ = mintPrice;
  this->MintPriceUpdated(previousPrice, mintPrice);
}

void ERC721Series::setPaymentRecipient(const Address& recipient) {
  this->onlyAdmin_();
  if (!recipient) throw ContractException(
    ContractError::InvalidRecipient, "payment recipient cannot be the zero address"
  );
  const Address previousRecipient = this->paymentRecipient_.get();
  this->paymentRecipient_ = recipient;
  this->PaymentRecipientUpdated(previousRecipient, recipient);
}

std::tuple<bool, uint256_t> ERC721Series::mintingAvailable() const {
  const uint256_t& minted = this->nextId_.get();
  if (this->limits_.maxSupply == 0) return std::make_tuple(true, uint256_t(Utils::maxUint256() - minted));
  if (minted >= this->limits_.maxSupply) return std::make_tuple(false, uint256_t(0));
  return std::make_tuple(true, uint256_t(this->limits_.maxSupply - minted));
}

SeriesConfig ERC721Series::seriesConfig() const {
  return SeriesConfig{this->mintPriceWei_.get(), this->paymentRecipient_.get(), this->tokenBaseURI_.get()};
}

bool ERC721Series::supportsInterface(const uint32_t& interfaceId) const {
  return interfaceId == 0x49064906 || ERC721::supportsInterface(interfaceId);
}
