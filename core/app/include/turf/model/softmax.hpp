#pragma once

#include <Eigen/Dense>

#include <string>

namespace turf {

// -------------------------------------------------------------------------
// logSumExp(scores)
// -------------------------------------------------------------------------
// @brief  log(sum(exp(scores))) computed as max + log(sum(exp(s - max))).
//
// @details
// Never overflows for finite input. Requires a non-empty vector.
// -------------------------------------------------------------------------
double logSumExp(const Eigen::VectorXd& scores);

// Result of turning one event's scores into a probability distribution.
struct Normalized {
  Eigen::VectorXd probabilities;
  bool fallback{false};      // A numerical guard replaced the softmax
  std::string reason;        // Empty unless fallback
};

// -------------------------------------------------------------------------
// normalizeScores(scores, tolerance)
// -------------------------------------------------------------------------
// @brief  Race-wise softmax with explicit handling of every degenerate case.
//
// @param  scores     One real score per entrant.
// @param  tolerance  Maximum permitted |sum(p) - 1|.
//
// @details
//   size 0          → DegenerateInputError (events are validated at
//                     ingestion, so this indicates a programming error).
//   size 1          → p = {1.0} exactly, never computed as exp(s)/exp(s).
//   non-finite s_i  → uniform 1/n, fallback = true.
//   otherwise       → p_i = exp(s_i - max) / sum_j exp(s_j - max).
//
// After normalisation the sum is checked against tolerance. A sum outside
// it (or a non-finite normaliser) yields the uniform distribution with
// fallback = true; the caller counts it as a numerical incident.
// -------------------------------------------------------------------------
Normalized normalizeScores(const Eigen::VectorXd& scores, double tolerance);

}  // namespace turf
