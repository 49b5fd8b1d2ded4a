#include "micro/scoring/scorer.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace micro {

double momentumScalpScore(const domain::Features& f) {
  double score = 0.0;

  score += (f.ema_fast > f.ema_slow) ? 0.3 : -0.3;

  if (f.rsi > 40.0 && f.rsi < 70.0) {
    score += 0.2;
  } else if (f.rsi > 70.0) {
    score -= 0.2;
  }

  if (f.momentum_5 > 0.01) {
    score += 0.3;
  } else if (f.momentum_5 < -0.01) {
    score -= 0.3;
  }

  return std::clamp(score, -1.0, 1.0);
}

Scorer::Scorer(double min_confidence, ScoreFunction score_fn)
    : min_confidence_(min_confidence), score_fn_(std::move(score_fn)) {}

// -----------------------------------------------------------------------------
// score(): direction from the sign, strength from the magnitude, confidence
// net of the spread penalty
// -----------------------------------------------------------------------------
std::optional<domain::Opportunity> Scorer::score(
    const domain::Instrument& instrument,
    const domain::Features& features) const {
  double s = std::clamp(score_fn_(features), -1.0, 1.0);
  if (s == 0.0 || std::isnan(s)) {
    return std::nullopt;
  }

  const double strength = std::fabs(s);
  double confidence =
      std::max(0.0, strength - features.relative_spread * kSpreadPenalty);
  if (confidence < min_confidence_) {
    return std::nullopt;
  }

  domain::Opportunity opp;
  opp.instrument = instrument;
  opp.direction = s > 0.0 ? domain::Direction::Long : domain::Direction::Short;
  opp.score = strength;
  opp.confidence = confidence;
  opp.entry_price = features.last_price;
  opp.timestamp_ms = features.timestamp_ms;
  return opp;
}

bool Scorer::ranksBefore(const domain::Opportunity& a,
                         const domain::Opportunity& b) {
  if (a.score != b.score) {
    return a.score > b.score;
  }
  if (a.instrument.liquidity_tier != b.instrument.liquidity_tier) {
    return a.instrument.liquidity_tier > b.instrument.liquidity_tier;
  }
  return a.instrument.id < b.instrument.id;
}

void Scorer::rank(std::vector<domain::Opportunity>& opportunities) {
  std::sort(opportunities.begin(), opportunities.end(), &Scorer::ranksBefore);
}

}  // namespace micro
