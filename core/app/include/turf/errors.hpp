#pragma once

#include <stdexcept>
#include <string>

namespace turf {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Exception hierarchy for conditions that must abort a run.
//
// @details
// Only conditions that indicate leakage risk or structurally invalid input
// are raised as exceptions. Numerical edge cases (non-finite scores, a
// vanishing softmax normaliser) are handled locally by the model with a
// documented fallback and counted in the evaluation report instead.
//
//   OrderingError        — an update or lookup presented out of
//                          chronological order.
//   LeakageError         — a feature, rating, or training event whose
//                          timestamp is not strictly before the event it
//                          is used for.
//   DegenerateInputError — zero-entrant events, field-size mismatches,
//                          invalid finishing ranks, double settlement.
//   ConfigError          — missing or out-of-range configuration values.
//
// Every message is expected to carry the offending entity/event ids and
// timestamps so that a failed backtest can be audited from the log alone.
// -----------------------------------------------------------------------------
class TurfError : public std::runtime_error {
 public:
  explicit TurfError(const std::string& what) : std::runtime_error(what) {}
};

class OrderingError : public TurfError {
 public:
  explicit OrderingError(const std::string& what)
      : TurfError("ordering violation: " + what) {}
};

class LeakageError : public TurfError {
 public:
  explicit LeakageError(const std::string& what)
      : TurfError("leakage detected: " + what) {}
};

class DegenerateInputError : public TurfError {
 public:
  explicit DegenerateInputError(const std::string& what)
      : TurfError("degenerate input: " + what) {}
};

class ConfigError : public TurfError {
 public:
  explicit ConfigError(const std::string& what)
      : TurfError("invalid configuration: " + what) {}
};

}  // namespace turf
