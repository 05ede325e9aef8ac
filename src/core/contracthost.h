/*
Copyright (c) [2023-2024] [Sparq Network]

This software is distributed under the MIT License.
See the LICENSE.txt file in the project root for more information.
*/

#ifndef CONTRACTHOST_H
#define CONTRACTHOST_H

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../contract/contract.h"
#include "../contract/event.h"
#include "../contract/variables/safebase.h"
#include "../utils/logger.h"
#include "../utils/safehash.h"
#include "../utils/strings.h"
#include "../utils/utils.h"

/**
 * In-process execution environment for native contracts.
 *
 * Holds the native balances of every account, the deployed contracts and the
 * event log, and executes contract calls as nested call frames. A frame that
 * throws rolls back every balance change, contract variable and event it
 * produced (including those of its committed sub-frames) and the exception
 * reaches the caller, who may observe it and carry on.
 *
 * The host is not thread-safe, calls are expected to be serialized by the
 * caller the same way transactions are serialized in a block.
 */
class ContractHost {
  private:
    /// Context of a call being executed.
    struct CallFrame {
      Address caller;                     ///< Address that made the call.
      Address contract;                   ///< Contract being called.
      uint256_t value;                    ///< Value attached to the call.
      std::size_t balanceJournalMark;     ///< Size of the balance journal when the frame started.
      std::size_t eventMark;              ///< Number of pending events when the frame started.
      std::vector<SafeBase*> usedVars;    ///< Variables with a checkpoint owned by this frame.
    };

    const uint64_t chainId_;          ///< Chain ID given to deployed contracts.
    uint64_t contractCount_ = 0;      ///< Number of contracts deployed so far.
    std::unordered_map<Address, uint256_t, SafeHash> balances_; ///< Native balances.
    std::unordered_map<Address, std::unique_ptr<BaseContract>, SafeHash> contracts_; ///< Deployed contracts.
    std::vector<CallFrame> frames_;   ///< Call stack, innermost frame last.
    std::vector<std::pair<Address, uint256_t>> balanceJournal_; ///< Previous balances changed during the current call.
    std::vector<Event> pendingEvents_; ///< Events emitted during the current call.
    std::vector<Event> events_;       ///< Events of committed calls.

    /// Derive the address of the next contract to be deployed.
    Address nextContractAddress_();

    /// Set a balance, keeping the previous one in the journal if a call is running.
    void setBalance_(const Address& address, const uint256_t& balance);

    /**
     * Move native currency between two accounts.
     * @throw DynamicException if `from` does not have enough balance.
     */
    void transferNative_(const Address& from, const Address& to, const uint256_t& value);

    /**
     * Open a frame for a call and move the attached value.
     * @throw DynamicException if the call depth limit is reached or the
     *        caller cannot afford the value. No frame is left open then.
     */
    void pushFrame_(const Address& from, const Address& to, const uint256_t& value);

    /// Close the innermost frame, keeping its effects.
    void commitFrame_();

    /// Close the innermost frame, undoing its effects.
    void revertFrame_();

    /// Find a deployed contract, throwing if there is none at the address.
    BaseContract& findContract_(const Address& address) const;

    /// Find a registered function and check it accepts the given value.
    const RegisteredFunction& findFunction_(
      const BaseContract& contract, const std::string& func, const uint256_t& value
    ) const;

    /// Extract the typed functor from a registered function.
    template <typename R, typename... Args>
    static const std::function<R(const Args&...)>& functorOf_(
      const RegisteredFunction& fn, const BaseContract& contract, const std::string& func
    ) {
      const auto* functor = std::any_cast<std::function<R(const Args&...)>>(&fn.functor);
      if (functor == nullptr) throw DynamicException(
        contract.getContractName(), " at ", contract.getContractAddress().hex(true),
        ": signature mismatch when calling \"", func, "\""
      );
      return *functor;
    }

  public:
    /// Maximum number of nested call frames.
    static constexpr uint64_t maxCallDepth = 1024;

    /**
     * Constructor.
     * @param chainId The chain ID given to deployed contracts.
     */
    explicit ContractHost(const uint64_t& chainId) : chainId_(chainId) {}

    ContractHost(const ContractHost&) = delete;
    ContractHost& operator=(const ContractHost&) = delete;

    /// Getter for the chain ID.
    const uint64_t& getChainId() const { return this->chainId_; }

    /**
     * Credit an account with native currency (genesis/faucet).
     * @param address The account to credit.
     * @param amount The amount to credit, in wei.
     */
    void addBalance(const Address& address, const uint256_t& amount);

    /// Getter for the native balance of an account.
    uint256_t getNativeBalance(const Address& address) const;

    /// Whether there is a contract deployed at the given address.
    bool isContract(const Address& address) const { return this->contracts_.contains(address); }

    /// Deployed contracts, as (name, address) pairs.
    std::vector<std::pair<std::string, Address>> getContracts() const;

    /**
     * Get a deployed contract.
     * @tparam TContract The expected contract type.
     * @param address The contract address.
     * @throw DynamicException if there is no contract of that type at the address.
     */
    template <typename TContract> TContract& getContract(const Address& address) const {
      auto* contract = dynamic_cast<TContract*>(&this->findContract_(address));
      if (contract == nullptr) throw DynamicException(
        "Contract at ", address.hex(true), " is not of the requested type"
      );
      return *contract;
    }

    /**
     * Deploy a new contract.
     * The contract constructor receives `args` followed by the host, the
     * contract address, the creator and the chain ID.
     * @tparam TContract The contract type.
     * @param creator The address creating the contract.
     * @param args The contract-specific constructor arguments.
     * @return The address of the new contract.
     */
    template <typename TContract, typename... Args>
    Address deployContract(const Address& creator, Args&&... args) {
      Address address = this->nextContractAddress_();
      auto contract = std::make_unique<TContract>(
        std::forward<Args>(args)..., *this, address, creator, this->chainId_
      );
      Logger::logToDebug(LogType::INFO, Log::contractHost, __func__,
        "Deployed " + contract->getContractName() + " at " + address.hex(true).get()
        + " (creator " + creator.hex(true).get() + ")"
      );
      this->contracts_.emplace(address, std::move(contract));
      return address;
    }

    /**
     * Call a contract function as a new call frame.
     * On failure every effect of the frame is undone and the exception is
     * rethrown to the caller.
     * @tparam R The return type of the function.
     * @param from The caller.
     * @param to The contract address.
     * @param value The value attached to the call, in wei.
     * @param func The function name.
     * @param args The function arguments (must match the registered types exactly).
     * @return Whatever the function returns.
     */
    template <typename R, typename... Args>
    R callFunction(const Address& from, const Address& to, const uint256_t& value,
      const std::string& func, const Args&... args
    ) {
      BaseContract& contract = this->findContract_(to);
      const auto& functor = functorOf_<R, Args...>(this->findFunction_(contract, func, value), contract, func);
      this->pushFrame_(from, to, value);
      try {
        if constexpr (std::is_void_v<R>) {
          functor(args...);
          this->commitFrame_();
        } else {
          R result = functor(args...);
          this->commitFrame_();
          return result;
        }
      } catch (const std::exception& e) {
        Logger::logToDebug(LogType::DEBUG, Log::contractHost, __func__,
          "Call to " + contract.getContractName() + "::" + func + " at " + to.hex(true).get()
          + " from " + from.hex(true).get() + " reverted: " + e.what()
        );
        this->revertFrame_();
        throw;
      }
    }

    /**
     * Call a read-only contract function. No frame is opened.
     * @tparam R The return type of the function.
     * @param to The contract address.
     * @param func The function name.
     * @param args The function arguments (must match the registered types exactly).
     * @throw DynamicException if the function is not a View function.
     */
    template <typename R, typename... Args>
    R callViewFunction(const Address& to, const std::string& func, const Args&... args) const {
      const BaseContract& contract = this->findContract_(to);
      const RegisteredFunction& fn = contract.getFunction(func);
      if (fn.type != FunctionTypes::View) throw DynamicException(
        contract.getContractName(), " at ", to.hex(true), ": \"", func, "\" is not a view function"
      );
      return functorOf_<R, Args...>(fn, contract, func)(args...);
    }

    /**
     * Send native currency, executing the receiver's `receive` function if
     * it is a contract. Never throws: any failure undoes the transfer and is
     * reported as `false`.
     * @param from The sender.
     * @param to The receiver.
     * @param value The amount to send, in wei.
     * @return `true` on success, `false` otherwise.
     */
    bool sendNative(const Address& from, const Address& to, const uint256_t& value);

    /// Caller of the innermost frame (zero outside of a call).
    Address getCurrentCaller() const;

    /// Value attached to the innermost frame (zero outside of a call).
    uint256_t getCurrentValue() const;

    /// Number of frames currently open.
    uint64_t getCallDepth() const { return this->frames_.size(); }

    /**
     * Register a contract variable as used in the innermost frame, saving its
     * value the first time the frame touches it. No-op outside of a call.
     */
    void registerVariableUse(SafeBase& variable);

    /**
     * Record an event emitted by a contract.
     * @param emitter The contract emitting the event.
     * @param name The event name.
     * @param params The named event parameters.
     */
    void emitEvent(const Address& emitter, const std::string& name, json params);

    /// Events of every committed call, in emission order.
    const std::vector<Event>& getEvents() const { return this->events_; }

    /**
     * Events of committed calls filtered by emitter and, optionally, name.
     * @param emitter The contract that emitted the events.
     * @param name The event name (empty for any).
     */
    std::vector<Event> getEvents(const Address& emitter, const std::string& name = "") const;
};

#endif // CONTRACTHOST_H
