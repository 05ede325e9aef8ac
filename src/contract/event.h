#ifndef EVENT_H
#define EVENT_H

#include <string>

#include "../utils/strings.h"
#include "../utils/utils.h"

/// Abstraction of a contract event.
struct Event {
  std::string name; ///< Event name (e.g. "Transfer").
  Address address;  ///< Address of the contract that emitted the event.
  json params;      ///< Named event parameters.
  uint64_t index;   ///< Position of the event in the host's event log.
};

#endif // EVENT_H
