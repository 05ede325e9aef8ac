#ifndef DYNAMICCONTRACT_H
#define DYNAMICCONTRACT_H

#include <functional>
#include <string>
#include <type_traits>

#include "../core/contracthost.h"
#include "contract.h"

/**
 * Template for a contract deployed at runtime.
 * All contracts that can be called through the host derive from this class,
 * registering their callable functions with registerMemberFunction().
 */
class DynamicContract : public BaseContract {
  protected:
    /// Register the functions of the contract. Called by each constructor.
    virtual void registerContractFunctions() = 0;

    /**
     * Register a member function so it can be called through the host.
     * @param name The function name.
     * @param memFunc Pointer to the member function.
     * @param type The function type (View, NonPayable or Payable).
     * @param instance The contract instance the function is bound to.
     */
    template <typename R, typename T, typename... Args> void registerMemberFunction(
      const std::string& name, R(T::*memFunc)(Args...), const FunctionTypes& type, T* instance
    ) {
      std::function<R(const std::decay_t<Args>&...)> functor =
        [instance, memFunc](const std::decay_t<Args>&... args) -> R { return (instance->*memFunc)(args...); };
      this->registerFunction(name, type, std::move(functor));
    }

    /// Overload for const member functions.
    template <typename R, typename T, typename... Args> void registerMemberFunction(
      const std::string& name, R(T::*memFunc)(Args...) const, const FunctionTypes& type, T* instance
    ) {
      std::function<R(const std::decay_t<Args>&...)> functor =
        [instance, memFunc](const std::decay_t<Args>&... args) -> R { return (instance->*memFunc)(args...); };
      this->registerFunction(name, type, std::move(functor));
    }

    /**
     * Call a function of another contract, as a nested call frame.
     * Failures in the callee reach the caller as exceptions.
     * @param to The contract to call.
     * @param value The value to attach, taken from this contract's balance.
     * @param func The function name.
     * @param args The function arguments.
     * @return Whatever the function returns.
     */
    template <typename R, typename... Args> R callContractFunction(
      const Address& to, const uint256_t& value, const std::string& func, const Args&... args
    ) {
      return this->host_.template callFunction<R>(this->getContractAddress(), to, value, func, args...);
    }

    /// Call a View function of another contract.
    template <typename R, typename... Args> R callContractViewFunction(
      const Address& to, const std::string& func, const Args&... args
    ) const {
      return this->host_.template callViewFunction<R>(to, func, args...);
    }

  public:
    using BaseContract::BaseContract;
};

#endif // DYNAMICCONTRACT_H
