#ifndef SAFEADDRESS_H
#define SAFEADDRESS_H

#include "../../utils/strings.h"
#include "safevariable.h"

/// Safe wrapper for an Address.
class SafeAddress : public SafeVariable<Address> {
  public:
    using SafeVariable<Address>::SafeVariable;
    using SafeVariable<Address>::operator=;
};

#endif // SAFEADDRESS_H
