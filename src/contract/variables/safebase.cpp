#include "safebase.h"
#include "../contract.h"

void SafeBase::markAsUsed() {
  if (this->owner_ != nullptr) this->owner_->registerVariableUse(*this);
}
