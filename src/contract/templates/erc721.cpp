#include "erc721.h"

ERC721::ERC721(
  const std::string& erc721name, const std::string& erc721symbol,
  ContractHost& host, const Address& address, const Address& creator, const uint64_t& chainId
) : ERC721("ERC721", erc721name, erc721symbol, host, address, creator, chainId) {}

ERC721::ERC721(
  const std::string& derivedTypeName,
  const std::string& erc721name, const std::string& erc721symbol,
  ContractHost& host, const Address& address, const Address& creator, const uint64_t& chainId
) : DynamicContract(derivedTypeName, host, address, creator, chainId),
  name_(this, erc721name), symbol_(this, erc721symbol), owners_(this),
  balances_(this), tokenApprovals_(this), operatorAddressApprovals_(this)
{
  this->registerContractFunctions();
}

void ERC721::registerContractFunctions() {
  this->registerMemberFunction("name", &ERC721::name, FunctionTypes::View, this);
  this->registerMemberFunction("symbol", &ERC721::symbol, FunctionTypes::View, this);
  this->registerMemberFunction("balanceOf", &ERC721::balanceOf, FunctionTypes::View, this);
  this->registerMemberFunction("ownerOf", &ERC721::ownerOf, FunctionTypes::View, this);
  this->registerMemberFunction("exists", &ERC721::exists, FunctionTypes::View, this);
  this->registerMemberFunction("approve", &ERC721::approve, FunctionTypes::NonPayable, this);
  this->registerMemberFunction("getApproved", &ERC721::getApproved, FunctionTypes::View, this);
  this->registerMemberFunction("setApprovalForAll", &ERC721::setApprovalForAll, FunctionTypes::NonPayable, this);
  this->registerMemberFunction("isApprovedForAll", &ERC721::isApprovedForAll, FunctionTypes::View, this);
  this->registerMemberFunction("transferFrom", &ERC721::transferFrom, FunctionTypes::NonPayable, this);
  this->registerMemberFunction("tokenURI", &ERC721::tokenURI, FunctionTypes::View, this);
  this->registerMemberFunction("supportsInterface", &ERC721::supportsInterface, FunctionTypes::View, this);
}

Address ERC721::ownerOf_(const uint256_t& tokenId) const {
  auto it = this->owners_.find(tokenId);
  if (it == this->owners_.end()) return Address();
  return it->second;
}

Address ERC721::getApproved_(const uint256_t& tokenId) const {
  auto it = this->tokenApprovals_.find(tokenId);
  if (it == this->tokenApprovals_.end()) return Address();
  return it->second;
}

bool ERC721::isAuthorized_(const Address& owner, const Address& spender, const uint256_t& tokenId) const {
  if (!spender) return false;
  return (owner == spender || this->isApprovedForAll(owner, spender) || this->getApproved_(tokenId) == spender);
}

void ERC721::checkAuthorized_(const Address& owner, const Address& spender, const uint256_t& tokenId) const {
  if (this->isAuthorized_(owner, spender, tokenId)) return;
  if (!owner) throw ContractException(ContractError::NoSuchToken, "token ", tokenId, " does not exist");
  throw ContractException(ContractError::InsufficientApproval,
    spender.hex(true), " is not allowed to operate on token ", tokenId
  );
}

Address ERC721::update_(const Address& to, const uint256_t& tokenId, const Address& auth) {
  Address from = this->ownerOf_(tokenId);
  if (auth) this->checkAuthorized_(from, auth, tokenId);

  if (from) {
    // Clear the approval, no need to re-authorize or emit the Approval event.
    this->approve_(Address(), tokenId, Address(), false);
    this->balances_[from] -= 1;
  }
  if (to) {
    this->balances_[to] += 1;
    this->owners_[tokenId] = to;
  } else {
    this->owners_.erase(tokenId);
  }

  this->Transfer(from, to, tokenId);
  return from;
}

void ERC721::mint_(const Address& to, const uint256_t& tokenId) {
  if (!to) throw ContractException(ContractError::InvalidReceiver, "cannot mint to the zero address");
  Address previousOwner = this->update_(to, tokenId, Address());
  if (previousOwner) throw ContractException(ContractError::TokenAlreadyMinted, "token ", tokenId, " already exists");
}

void ERC721::approve_(const Address& to, const uint256_t& tokenId, const Address& auth, bool emitApproval) {
  if (emitApproval || auth) {
    Address owner = this->requireOwned_(tokenId);
    if (auth && owner != auth && !this->isApprovedForAll(owner, auth)) {
      throw ContractException(ContractError::InvalidApprover,
        auth.hex(true), " cannot approve for token ", tokenId
      );
    }
    if (emitApproval) this->Approval(owner, to, tokenId);
  }
  if (to) {
    this->tokenApprovals_[tokenId] = to;
  } else {
    this->tokenApprovals_.erase(tokenId);
  }
}

void ERC721::setApprovalForAll_(const Address& owner, const Address& operatorAddress, bool approved) {
  if (!operatorAddress) throw ContractException(ContractError::InvalidOperator, "operator is the zero address");
  this->operatorAddressApprovals_[owner][operatorAddress] = approved;
  this->ApprovalForAll(owner, operatorAddress, approved);
}

Address ERC721::requireOwned_(const uint256_t& tokenId) const {
  Address owner = this->ownerOf_(tokenId);
  if (!owner) throw ContractException(ContractError::NoSuchToken, "token ", tokenId, " does not exist");
  return owner;
}

void ERC721::Transfer(const Address& from, const Address& to, const uint256_t& tokenId) {
  this->emitEvent(__func__, json::object({
    {"from", from.hex(true).get()}, {"to", to.hex(true).get()}, {"tokenId", tokenId.str()}
  }));
}

void ERC721::Approval(const Address& owner, const Address& approved, const uint256_t& tokenId) {
  this->emitEvent(__func__, json::object({
    {"owner", owner.hex(true).get()}, {"approved", approved.hex(true).get()}, {"tokenId", tokenId.str()}
  }));
}

void ERC721::ApprovalForAll(const Address& owner, const Address& operatorAddress, bool approved) {
  this->emitEvent(__func__, json::object({
    {"owner", owner.hex(true).get()}, {"operator", operatorAddress.hex(true).get()}, {"approved", approved}
  }));
}

std::string ERC721::name() const { return this->name_.get(); }

std::string ERC721::symbol() const { return this->symbol_.get(); }

uint256_t ERC721::balanceOf(const Address& owner) const {
  if (!owner) throw ContractException(ContractError::InvalidOwner, "zero address is not a valid owner");
  auto it = this->balances_.find(owner);
  if (it == this->balances_.end()) return 0;
  return it->second;
}

Address ERC721::ownerOf(const uint256_t& tokenId) const { return this->requireOwned_(tokenId); }

bool ERC721::exists(const uint256_t& tokenId) const { return bool(this->ownerOf_(tokenId)); }

void ERC721::approve(const Address& to, const uint256_t& tokenId) {
  this->approve_(to, tokenId, this->getCaller());
}

Address ERC721::getApproved(const uint256_t& tokenId) const {
  this->requireOwned_(tokenId);
  return this->getApproved_(tokenId);
}

void ERC721::setApprovalForAll(const Address& operatorAddress, const bool& approved) {
  this->setApprovalForAll_(this->getCaller(), operatorAddress, approved);
}

bool ERC721::isApprovedForAll(const Address& owner, const Address& operatorAddress) const {
  auto it = this->operatorAddressApprovals_.find(owner);
  if (it == this->operatorAddressApprovals_.end()) return false;
  auto approval = it->second.find(operatorAddress);
  if (approval == it->second.end()) return false;
  return approval->second;
}

void ERC721::transferFrom(const Address& from, const Address& to, const uint256_t& tokenId) {
  if (!to) throw ContractException(ContractError::InvalidReceiver, "cannot transfer to the zero address");
  // Setting an "auth" argument enables the ownership/approval checks in update_().
  Address previousOwner = this->update_(to, tokenId, this->getCaller());
  if (previousOwner != from) throw ContractException(ContractError::IncorrectOwner,
    from.hex(true), " is not the owner of token ", tokenId
  );
}

std::string ERC721::tokenURI(const uint256_t& tokenId) const {
  this->requireOwned_(tokenId);
  std::string baseURI = this->baseURI_();
  if (baseURI.empty()) return "";
  return baseURI + tokenId.str();
}

bool ERC721::supportsInterface(const uint32_t& interfaceId) const {
  return interfaceId == 0x01ffc9a7   // ERC165
    || interfaceId == 0x80ac58cd     // ERC721
    || interfaceId == 0x5b5e139f;    // ERC721Metadata
}
