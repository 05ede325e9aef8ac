#ifndef CONTRACT_H
#define CONTRACT_H

#include <any>
#include <string>
#include <unordered_map>
#include <vector>

#include "../utils/safehash.h"
#include "../utils/strings.h"
#include "../utils/utils.h"
#include "contracterrors.h"
#include "event.h"

// Forward declarations.
class ContractHost;
class SafeBase;

/// Enum for the types of contract functions.
enum class FunctionTypes { View, NonPayable, Payable };

/// A contract function registered by name.
struct RegisteredFunction {
  FunctionTypes type; ///< Whether the function is read-only and whether it accepts value.
  std::any functor;   ///< `std::function<R(const Args&...)>` wrapping the member function.
};

/**
 * Base class for all contracts.
 * Holds the contract identity, the function registry used by the host to
 * dispatch calls, and access to the context of the call being executed.
 */
class BaseContract {
  private:
    const std::string contractName_;  ///< Name of the contract type (e.g. "ERC721Series").
    const Address contractAddress_;   ///< Address where the contract is deployed.
    const Address contractCreator_;   ///< Address of the creator of the contract.
    const uint64_t contractChainId_;  ///< Chain where the contract is deployed.
    std::unordered_map<std::string, RegisteredFunction, SafeHash> functions_; ///< Registered functions, by name.

  protected:
    ContractHost& host_; ///< Host the contract is deployed in.

    /**
     * Register a function so the host can dispatch calls to it.
     * @param name The function name.
     * @param type The function type.
     * @param functor The type-erased `std::function` to invoke.
     * A function registered again under the same name replaces the old one.
     */
    void registerFunction(const std::string& name, const FunctionTypes& type, std::any functor);

    /**
     * Emit an event. It is discarded if the current call is reverted.
     * @param name The event name.
     * @param params The named event parameters.
     */
    void emitEvent(const std::string& name, json params);

    /**
     * Send native currency from this contract to another address.
     * If the receiver is a contract, its `receive` function is executed.
     * @param to The receiver.
     * @param value The amount to send, in wei.
     * @return `true` on success, `false` if the transfer was rejected or
     *         could not be completed. A failed transfer has no effects.
     */
    bool sendNative(const Address& to, const uint256_t& value);

  public:
    /**
     * Constructor.
     * @param contractName The name of the contract type.
     * @param host The host the contract is deployed in.
     * @param address The address where the contract is deployed.
     * @param creator The address of the creator of the contract.
     * @param chainId The chain where the contract is deployed.
     */
    BaseContract(const std::string& contractName, ContractHost& host,
      const Address& address, const Address& creator, const uint64_t& chainId
    ) : contractName_(contractName), contractAddress_(address),
      contractCreator_(creator), contractChainId_(chainId), host_(host) {}

    BaseContract(const BaseContract&) = delete;
    BaseContract& operator=(const BaseContract&) = delete;

    virtual ~BaseContract() = default;

    /// Getters.
    const std::string& getContractName() const { return this->contractName_; }
    const Address& getContractAddress() const { return this->contractAddress_; }
    const Address& getContractCreator() const { return this->contractCreator_; }
    const uint64_t& getContractChainId() const { return this->contractChainId_; }

    /// Address that called the function being executed (zero outside of a call).
    Address getCaller() const;

    /// Value attached to the call being executed (zero outside of a call).
    uint256_t getValue() const;

    /**
     * Look up a registered function.
     * @param name The function name.
     * @throw DynamicException if no such function is registered.
     */
    const RegisteredFunction& getFunction(const std::string& name) const;

    /// Whether a function with the given name is registered.
    bool hasFunction(const std::string& name) const { return this->functions_.contains(name); }

    /// Register a safe variable as used in the current call frame.
    void registerVariableUse(SafeBase& variable);
};

#endif // CONTRACT_H
