#ifndef CONTRACTERRORS_H
#define CONTRACTERRORS_H

#include <string>

#include "../utils/dynamicexception.h"

/// Failure conditions a contract call can end with.
enum class ContractError {
  // Series
  SupplyExceeded,          ///< Mint attempted at or beyond the supply cap.
  IncorrectPayment,        ///< Attached value differs from the mint price.
  PaymentForwardingFailed, ///< The payment recipient did not accept the proceeds.
  Unauthorized,            ///< Admin operation by someone other than the creator or the current recipient.
  InvalidRecipient,        ///< Zero address given as payment recipient.
  ReentrantCall,           ///< Guarded function entered while already executing.
  // Registry
  NoSuchToken,             ///< Token id was never minted.
  InvalidReceiver,         ///< Token sent or minted to the zero address.
  TokenAlreadyMinted,      ///< Token id is already registered.
  IncorrectOwner,          ///< `from` is not the owner of the token.
  InvalidOwner,            ///< Zero address queried as token owner.
  InsufficientApproval,    ///< Caller is neither owner nor approved for the token.
  InvalidApprover,         ///< Caller may not approve for the token.
  InvalidOperator          ///< Zero address given as operator.
};

/// Name of an error, as used in messages and logs.
inline std::string contractErrorToString(ContractError error) {
  switch (error) {
    case ContractError::SupplyExceeded: return "SupplyExceeded";
    case ContractError::IncorrectPayment: return "IncorrectPayment";
    case ContractError::PaymentForwardingFailed: return "PaymentForwardingFailed";
    case ContractError::Unauthorized: return "Unauthorized";
    case ContractError::InvalidRecipient: return "InvalidRecipient";
    case ContractError::ReentrantCall: return "ReentrantCall";
    case ContractError::NoSuchToken: return "NoSuchToken";
    case ContractError::InvalidReceiver: return "InvalidReceiver";
    case ContractError::TokenAlreadyMinted: return "TokenAlreadyMinted";
    case ContractError::IncorrectOwner: return "IncorrectOwner";
    case ContractError::InvalidOwner: return "InvalidOwner";
    case ContractError::InsufficientApproval: return "InsufficientApproval";
    case ContractError::InvalidApprover: return "InvalidApprover";
    case ContractError::InvalidOperator: return "InvalidOperator";
  }
  return "Unknown";
}

/// Exception thrown by contracts, carrying the failure condition.
class ContractException : public DynamicException {
  private:
    ContractError error_; ///< The failure condition.

  public:
    /**
     * Constructor.
     * @param error The failure condition.
     * @param args The parts of the message, concatenated after the error name.
     */
    template<typename... Args> explicit ContractException(ContractError error, const Args&... args)
      : DynamicException(contractErrorToString(error), ": ", args...), error_(error) {}

    /// Getter for the failure condition.
    ContractError getError() const { return this->error_; }
};

#endif // CONTRACTERRORS_H
