/*
Copyright (c) [2023-2024] [Sparq Network]

This software is distributed under the MIT License.
See the LICENSE.txt file in the project root for more information.
*/

#include "contracthost.h"

Address ContractHost::nextContractAddress_() {
  // Contracts live at 0x0000000000000000000000000000001000000001, ...002, etc.
  Bytes raw = Utils::uint256ToBytes(uint256_t(0x1000000000ULL) + (++this->contractCount_));
  return Address(BytesArrView(raw).subspan(12));
}

void ContractHost::setBalance_(const Address& address, const uint256_t& balance) {
  uint256_t& current = this->balances_[address];
  if (!this->frames_.empty()) this->balanceJournal_.emplace_back(address, current);
  current = balance;
}

void ContractHost::transferNative_(const Address& from, const Address& to, const uint256_t& value) {
  uint256_t fromBalance = this->getNativeBalance(from);
  if (fromBalance < value) throw DynamicException(
    "Insufficient balance: ", from.hex(true), " has ", fromBalance, ", needs ", value
  );
  if (value == 0 || from == to) return;
  this->setBalance_(from, fromBalance - value);
  this->setBalance_(to, this->getNativeBalance(to) + value);
}

void ContractHost::pushFrame_(const Address& from, const Address& to, const uint256_t& value) {
  if (this->frames_.size() >= ContractHost::maxCallDepth) throw DynamicException(
    "Call depth limit of ", ContractHost::maxCallDepth, " reached"
  );
  if (this->getNativeBalance(from) < value) throw DynamicException(
    "Insufficient balance: ", from.hex(true), " cannot send ", value, " to ", to.hex(true)
  );
  this->frames_.push_back(CallFrame{
    from, to, value, this->balanceJournal_.size(), this->pendingEvents_.size(), {}
  });
  this->transferNative_(from, to, value);
}

void ContractHost::commitFrame_() {
  CallFrame frame = std::move(this->frames_.back());
  this->frames_.pop_back();
  const uint64_t depth = this->frames_.size() + 1;
  for (SafeBase* variable : frame.usedVars) {
    // Hand the checkpoint over to the enclosing frame if it has none yet.
    if (variable->commit(depth)) this->frames_.back().usedVars.push_back(variable);
  }
  if (!this->frames_.empty()) return;

  // Top-level call finished, its effects are final.
  this->balanceJournal_.clear();
  for (Event& event : this->pendingEvents_) {
    event.index = this->events_.size();
    this->events_.push_back(std::move(event));
  }
  this->pendingEvents_.clear();
}

void ContractHost::revertFrame_() {
  CallFrame& frame = this->frames_.back();
  for (auto it = frame.usedVars.rbegin(); it != frame.usedVars.rend(); it++) (*it)->revert();
  while (this->balanceJournal_.size() > frame.balanceJournalMark) {
    const auto& [address, balance] = this->balanceJournal_.back();
    this->balances_[address] = balance;
    this->balanceJournal_.pop_back();
  }
  this->pendingEvents_.erase(
    this->pendingEvents_.begin() + static_cast<std::ptrdiff_t>(frame.eventMark), this->pendingEvents_.end()
  );
  this->frames_.pop_back();
}

BaseContract& ContractHost::findContract_(const Address& address) const {
  auto it = this->contracts_.find(address);
  if (it == this->contracts_.end()) throw DynamicException(
    "No contract deployed at ", address.hex(true)
  );
  return *it->second;
}

const RegisteredFunction& ContractHost::findFunction_(
  const BaseContract& contract, const std::string& func, const uint256_t& value
) const {
  const RegisteredFunction& fn = contract.getFunction(func);
  if (value != 0 && fn.type != FunctionTypes::Payable) throw DynamicException(
    contract.getContractName(), " at ", contract.getContractAddress().hex(true),
    ": \"", func, "\" is not payable"
  );
  return fn;
}

void ContractHost::addBalance(const Address& address, const uint256_t& amount) {
  this->setBalance_(address, this->getNativeBalance(address) + amount);
}

uint256_t ContractHost::getNativeBalance(const Address& address) const {
  auto it = this->balances_.find(address);
  return (it == this->balances_.end()) ? uint256_t(0) : it->second;
}

std::vector<std::pair<std::string, Address>> ContractHost::getContracts() const {
  std::vector<std::pair<std::string, Address>> contracts;
  for (const auto& [address, contract] : this->contracts_) {
    contracts.emplace_back(contract->getContractName(), address);
  }
  return contracts;
}

bool ContractHost::sendNative(const Address& from, const Address& to, const uint256_t& value) {
  if (this->isContract(to)) {
    if (!this->findContract_(to).hasFunction("receive")) {
      Logger::logToDebug(LogType::DEBUG, Log::contractHost, __func__,
        "Contract at " + to.hex(true).get() + " has no receive function"
      );
      return false;
    }
    try {
      this->callFunction<void>(from, to, value, "receive");
      return true;
    } catch (const std::exception& e) {
      Logger::logToDebug(LogType::DEBUG, Log::contractHost, __func__,
        "Sending " + value.str() + " wei from " + from.hex(true).get() + " to "
        + to.hex(true).get() + " failed: " + e.what()
      );
      return false;
    }
  }
  uint256_t fromBalance = this->getNativeBalance(from);
  if (fromBalance < value) {
    Logger::logToDebug(LogType::DEBUG, Log::contractHost, __func__,
      "Insufficient balance to send " + value.str() + " wei from " + from.hex(true).get()
    );
    return false;
  }
  this->transferNative_(from, to, value);
  return true;
}

Address ContractHost::getCurrentCaller() const {
  return (this->frames_.empty()) ? Address() : this->frames_.back().caller;
}

uint256_t ContractHost::getCurrentValue() const {
  return (this->frames_.empty()) ? uint256_t(0) : this->frames_.back().value;
}

void ContractHost::registerVariableUse(SafeBase& variable) {
  if (this->frames_.empty()) return;
  const uint64_t depth = this->frames_.size();
  if (variable.checkpointDepth() == depth) return;
  variable.checkpoint(depth);
  this->frames_.back().usedVars.push_back(&variable);
}

void ContractHost::emitEvent(const Address& emitter, const std::string& name, json params) {
  if (this->frames_.empty()) {
    this->events_.push_back(Event{name, emitter, std::move(params), this->events_.size()});
    return;
  }
  this->pendingEvents_.push_back(Event{name, emitter, std::move(params), 0});
}

std::vector<Event> ContractHost::getEvents(const Address& emitter, const std::string& name) const {
  std::vector<Event> events;
  for (const Event& event : this->events_) {
    if (event.address != emitter) continue;
    if (!name.empty() && event.name != name) continue;
    events.push_back(event);
  }
  return events;
}
