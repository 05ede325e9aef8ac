#include "contract.h"
#include "../core/contracthost.h"

void BaseContract::registerFunction(const std::string& name, const FunctionTypes& type, std::any functor) {
  this->functions_.insert_or_assign(name, RegisteredFunction{type, std::move(functor)});
}

void BaseContract::emitEvent(const std::string& name, json params) {
  this->host_.emitEvent(this->contractAddress_, name, std::move(params));
}

bool BaseContract::sendNative(const Address& to, const uint256_t& value) {
  return this->host_.sendNative(this->contractAddress_, to, value);
}

Address BaseContract::getCaller() const { return this->host_.getCurrentCaller(); }

uint256_t BaseContract::getValue() const { return this->host_.getCurrentValue(); }

const RegisteredFunction& BaseContract::getFunction(const std::string& name) const {
  auto it = this->functions_.find(name);
  if (it == this->functions_.end()) throw DynamicException(
    this->contractName_, " at ", this->contractAddress_.hex(true), ": function \"", name, "\" not found"
  );
  return it->second;
}

void BaseContract::registerVariableUse(SafeBase& variable) {
  this->host_.registerVariableUse(variable);
}
