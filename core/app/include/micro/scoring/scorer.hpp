#pragma once

#include "micro/domain/instrument.hpp"
#include "micro/domain/market_data.hpp"
#include "micro/domain/opportunity.hpp"

#include <functional>
#include <optional>
#include <vector>

namespace micro {

// -----------------------------------------------------------------------------
// momentumScalpScore
// -----------------------------------------------------------------------------
//
// @brief  Default scoring function. Sums three signals and clamps to [-1, 1]:
//
//   trend     +0.3 if EMA(8) > EMA(21), else -0.3
//   RSI       +0.2 if 40 < RSI < 70, -0.2 if RSI > 70, else 0
//   momentum  +0.3 if momentum_5 > 0.01, -0.3 if momentum_5 < -0.01, else 0
// -----------------------------------------------------------------------------
double momentumScalpScore(const domain::Features& features);

// -----------------------------------------------------------------------------
// Scorer
// -----------------------------------------------------------------------------
//
// @brief  Features -> optional Opportunity, plus the ranking order.
//
// @details
// Pure and deterministic: the same (instrument, features) pair always yields
// the same Opportunity, and rank() is a strict total order, so the position
// of an opportunity in a ranked list never depends on input order.
//
// The score function returns a signed value s in [-1, 1]:
//
//   direction   Long if s > 0, Short if s < 0, none on exactly 0
//   score       |s|
//   confidence  score - relative_spread * 10, floored at 0
//
// Opportunities with confidence < min_confidence are dropped.
//
// The score function is replaceable; the confidence filter and ranking are
// not.
//
// Thread-safety: immutable after construction.
// -----------------------------------------------------------------------------
class Scorer {
 public:
  using ScoreFunction = std::function<double(const domain::Features&)>;

  static constexpr double kSpreadPenalty = 10.0;

  explicit Scorer(double min_confidence,
                  ScoreFunction score_fn = momentumScalpScore);

  std::optional<domain::Opportunity> score(
      const domain::Instrument& instrument,
      const domain::Features& features) const;

  // Sorts best-first: score desc, liquidity tier desc, instrument id asc.
  static void rank(std::vector<domain::Opportunity>& opportunities);

  static bool ranksBefore(const domain::Opportunity& a,
                          const domain::Opportunity& b);

  double minConfidence() const { return min_confidence_; }

 private:
  double min_confidence_;
  ScoreFunction score_fn_;
};

}  // namespace micro
