#pragma once

#include <cstdint>

namespace tradeloop {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that keeps "what time is it" out of the
//         decision loop so freshness checks, cooldown expiry and reservation
//         ages can be driven by a simulated clock in tests.
//
// @details
//   - LiveTimeProvider        → std::chrono::system_clock.
//   - SimulationTimeProvider  → value set explicitly (tests, replay).
//
// Components receive `const ITimeProvider&` and call now_ms() whenever they
// need a timestamp. All ages in the system (snapshot age, reservation age,
// cooldown expiry) are differences of now_ms() values.
//
// Why int64 milliseconds:
//   Snapshot timestamps arrive as integer epoch milliseconds in JSON from
//   the market data publisher. Keeping one integer representation avoids
//   chrono conversion at every comparison.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads. BoundedCaller runs
//   collaborator calls on worker threads that may read the clock while the
//   loop thread does.
//
// Ownership:
//   Components hold a const reference; the entry point owns the provider.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @return Epoch time in milliseconds.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tradeloop
