#pragma once

#include "tradeloop/events/event_types.hpp"

#include <variant>

namespace tradeloop {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope type for every lifecycle event the
// agent emits. One EventBus carries all of them; subscribers pick the kinds
// they care about with EventBus::subscribe<T>() or std::visit.
//
// Adding a kind means adding it here and to toJson() in event_json.cpp. The
// overloaded visitor there fails to compile until the new kind is handled.
// -----------------------------------------------------------------------------
using Event = std::variant<
    StateTransitionEvent,
    RecoveryCompleteEvent,
    RecoveryFailedEvent,
    MarketDataUnavailableEvent,
    DataFreshnessFailedEvent,
    DecisionUnavailableEvent,
    DecisionSkippedEvent,
    RiskRejectedEvent,
    TradeExecutedEvent,
    TradeFailedEvent,
    TradeLateFilledEvent,
    ReservationsSweptEvent,
    AgentHaltedEvent,
    CycleCompletedEvent>;

}  // namespace tradeloop
