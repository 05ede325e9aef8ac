#ifndef ERC721_H
#define ERC721_H

#include <string>
#include <unordered_map>

#include "../dynamiccontract.h"
#include "../variables/safestring.h"
#include "../variables/safeunorderedmap.h"

/**
 * Template for an ERC721 token.
 * Based on OpenZeppelin's ERC721 v5 (no safe transfers, as there are no
 * receiver hooks for native contracts).
 */
class ERC721 : public DynamicContract {
  protected:
    /// Solidity: string internal _name;
    SafeString name_;

    /// Solidity: string internal _symbol;
    SafeString symbol_;

    /// Solidity: mapping(uint256 tokenId => address) internal _owners;
    SafeUnorderedMap<uint256_t, Address> owners_;

    /// Solidity: mapping(address owner => uint256) internal _balances;
    SafeUnorderedMap<Address, uint256_t> balances_;

    /// Solidity: mapping(uint256 tokenId => address) internal _tokenApprovals;
    SafeUnorderedMap<uint256_t, Address> tokenApprovals_;

    /// Solidity: mapping(address owner => mapping(address operator => bool)) internal _operatorApprovals;
    SafeUnorderedMap<Address, std::unordered_map<Address, bool, SafeHash>> operatorAddressApprovals_;

    void registerContractFunctions() override;

    /// Owner of a token, or the zero address if it does not exist.
    Address ownerOf_(const uint256_t& tokenId) const;

    /// Approved address of a token, without checking it exists.
    Address getApproved_(const uint256_t& tokenId) const;

    /**
     * Whether `spender` can operate on `tokenId` on behalf of `owner`.
     * Assumes `owner` is the actual owner of the token.
     */
    bool isAuthorized_(const Address& owner, const Address& spender, const uint256_t& tokenId) const;

    /**
     * Check that `spender` can operate on `tokenId` on behalf of `owner`.
     * @throw ContractException(NoSuchToken) if `owner` is the zero address.
     * @throw ContractException(InsufficientApproval) if not authorized.
     */
    void checkAuthorized_(const Address& owner, const Address& spender, const uint256_t& tokenId) const;

    /**
     * Transfer `tokenId` from its current owner to `to`, or mint (if the
     * current owner is zero) or burn (if `to` is zero) it.
     * If `auth` is non-zero, checks that it is the owner or is approved.
     * Emits a Transfer event.
     * @return The owner before the update.
     */
    Address update_(const Address& to, const uint256_t& tokenId, const Address& auth);

    /**
     * Mint `tokenId` to `to`.
     * @throw ContractException(InvalidReceiver) if `to` is the zero address.
     * @throw ContractException(TokenAlreadyMinted) if the token exists.
     */
    void mint_(const Address& to, const uint256_t& tokenId);

    /**
     * Approve `to` to operate on `tokenId`. If `auth` is non-zero, it must be
     * the owner or an operator of the owner.
     */
    void approve_(const Address& to, const uint256_t& tokenId, const Address& auth, bool emitApproval = true);

    /// Set or unset `operatorAddress` as an operator for every token of `owner`.
    void setApprovalForAll_(const Address& owner, const Address& operatorAddress, bool approved);

    /**
     * Owner of a token, failing if it does not exist.
     * @throw ContractException(NoSuchToken) if the token does not exist.
     */
    Address requireOwned_(const uint256_t& tokenId) const;

    /// Base URI for tokenURI(). Empty by default.
    virtual std::string baseURI_() const { return ""; }

    /// Solidity: event Transfer(address indexed from, address indexed to, uint256 indexed tokenId);
    void Transfer(const Address& from, const Address& to, const uint256_t& tokenId);

    /// Solidity: event Approval(address indexed owner, address indexed approved, uint256 indexed tokenId);
    void Approval(const Address& owner, const Address& approved, const uint256_t& tokenId);

    /// Solidity: event ApprovalForAll(address indexed owner, address indexed operator, bool approved);
    void ApprovalForAll(const Address& owner, const Address& operatorAddress, bool approved);

    /**
     * Constructor for derived types.
     * @param derivedTypeName The name of the derived contract type.
     * @param erc721name The name of the token.
     * @param erc721symbol The symbol of the token.
     * @param host Reference to the contract host.
     * @param address The address where the contract will be deployed.
     * @param creator The address of the creator of the contract.
     * @param chainId The chain where the contract will be deployed.
     */
    ERC721(
      const std::string& derivedTypeName,
      const std::string& erc721name, const std::string& erc721symbol,
      ContractHost& host, const Address& address, const Address& creator, const uint64_t& chainId
    );

  public:
    /**
     * Constructor to be used when creating a new contract.
     * @param erc721name The name of the token.
     * @param erc721symbol The symbol of the token.
     * @param host Reference to the contract host.
     * @param address The address where the contract will be deployed.
     * @param creator The address of the creator of the contract.
     * @param chainId The chain where the contract will be deployed.
     */
    ERC721(
      const std::string& erc721name, const std::string& erc721symbol,
      ContractHost& host, const Address& address, const Address& creator, const uint64_t& chainId
    );

    /// Solidity: function name() public view virtual returns (string memory)
    std::string name() const;

    /// Solidity: function symbol() public view virtual returns (string memory)
    std::string symbol() const;

    /**
     * Solidity: function balanceOf(address owner) public view virtual returns (uint256)
     * @throw ContractException(InvalidOwner) if `owner` is the zero address.
     */
    uint256_t balanceOf(const Address& owner) const;

    /// Solidity: function ownerOf(uint256 tokenId) public view virtual returns (address)
    Address ownerOf(const uint256_t& tokenId) const;

    /// Whether a token exists.
    bool exists(const uint256_t& tokenId) const;

    /// Solidity: function approve(address to, uint256 tokenId) public virtual
    void approve(const Address& to, const uint256_t& tokenId);

    /// Solidity: function getApproved(uint256 tokenId) public view virtual returns (address)
    Address getApproved(const uint256_t& tokenId) const;

    /// Solidity: function setApprovalForAll(address operator, bool approved) public virtual
    void setApprovalForAll(const Address& operatorAddress, const bool& approved);

    /// Solidity: function isApprovedForAll(address owner, address operator) public view virtual returns (bool)
    bool isApprovedForAll(const Address& owner, const Address& operatorAddress) const;

    /// Solidity: function transferFrom(address from, address to, uint256 tokenId) public virtual
    void transferFrom(const Address& from, const Address& to, const uint256_t& tokenId);

    /**
     * Solidity: function tokenURI(uint256 tokenId) public view virtual returns (string memory)
     * @return The base URI followed by the decimal token id, or an empty
     *         string if there is no base URI.
     */
    virtual std::string tokenURI(const uint256_t& tokenId) const;

    /// Solidity: function supportsInterface(bytes4 interfaceId) public view virtual returns (bool)
    virtual bool supportsInterface(const uint32_t& interfaceId) const;
};

#endif // ERC721_H
