#pragma once

#include "event_types.hpp"
#include <variant>

namespace eclear {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope type carried by the EventBus. Adding a
// new event kind means adding it here; std::get_if / std::visit sites then
// pick it up.
// -----------------------------------------------------------------------------
using Event = std::variant<
    ClearingCompletedEvent,
    BidMatchedEvent,
    SupplyAllocatedEvent,
    ClearingFailedEvent>;

// Every alternative belongs to exactly one timeslot.
inline const domain::TimeslotId& eventTimeslot(const Event& event) {
  return std::visit(
      [](const auto& e) -> const domain::TimeslotId& { return e.timeslot_id; },
      event);
}

}  // namespace eclear
