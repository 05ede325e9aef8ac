#ifndef REENTRANCYGUARD_H
#define REENTRANCYGUARD_H

#include "contracterrors.h"

/**
 * RAII guard against reentrant calls.
 * Construct it at the start of a guarded function, passing the contract's
 * busy flag. The flag is cleared when the guard goes out of scope, whether
 * the function returns or throws.
 */
class ReentrancyGuard {
  private:
    bool& lock_; ///< The busy flag being held.

  public:
    /**
     * Constructor.
     * @param lock The busy flag of the contract.
     * @throw ContractException(ReentrantCall) if the flag is already set.
     */
    explicit ReentrancyGuard(bool& lock) : lock_(lock) {
      if (lock_) throw ContractException(ContractError::ReentrantCall, "function is already executing");
      lock_ = true;
    }

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    /// Destructor. Releases the flag.
    ~ReentrancyGuard() { lock_ = false; }
};

#endif // REENTRANCYGUARD_H
