// =============================================================================
// scorer_test.cpp
// =============================================================================
// Unit tests for micro::Scorer and momentumScalpScore.
//
// Validates:
//   - Score components (trend, RSI band, momentum) and their bounds
//   - Direction from the sign; confidence net of the spread penalty
//   - Opportunities below minConfidence are dropped
//   - Ranking: |score| desc, liquidity tier desc, id asc (deterministic)
//   - A custom scoring function can be plugged in
// =============================================================================

#include "micro/scoring/scorer.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace {

micro::domain::Features bullish() {
  micro::domain::Features f;
  f.last_price = 2.0;
  f.ema_fast = 1.1;
  f.ema_slow = 1.0;
  f.rsi = 55.0;
  f.momentum_5 = 0.02;
  f.relative_spread = 0.0;
  f.timestamp_ms = 1'000;
  return f;
}

micro::domain::Features bearish() {
  micro::domain::Features f = bullish();
  f.ema_fast = 0.9;
  f.rsi = 75.0;
  f.momentum_5 = -0.02;
  return f;
}

micro::domain::Instrument inst(const std::string& id, int tier = 1) {
  micro::domain::Instrument i;
  i.id = id;
  i.liquidity_tier = tier;
  return i;
}

micro::domain::Opportunity opp(
    const std::string& id, double score, int tier,
    micro::domain::Direction dir = micro::domain::Direction::Long) {
  micro::domain::Opportunity o;
  o.instrument = inst(id, tier);
  o.direction = dir;
  o.score = score;
  o.confidence = score;
  return o;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. All three components agree: +0.3 trend, +0.2 RSI band, +0.3 momentum.
// -----------------------------------------------------------------------------
TEST(ScorerTest, BullishComponentsSum) {
  EXPECT_DOUBLE_EQ(micro::momentumScalpScore(bullish()), 0.8);
}

TEST(ScorerTest, BearishComponentsSum) {
  EXPECT_DOUBLE_EQ(micro::momentumScalpScore(bearish()), -0.8);
}

// -----------------------------------------------------------------------------
// 2. Positive score opens Long, negative opens Short.
// -----------------------------------------------------------------------------
TEST(ScorerTest, DirectionFollowsSign) {
  micro::Scorer scorer(0.5);

  auto up = scorer.score(inst("UP"), bullish());
  auto down = scorer.score(inst("DOWN"), bearish());

  ASSERT_TRUE(up.has_value());
  ASSERT_TRUE(down.has_value());
  EXPECT_EQ(up->direction, micro::domain::Direction::Long);
  EXPECT_EQ(down->direction, micro::domain::Direction::Short);
  EXPECT_DOUBLE_EQ(up->confidence, 0.8);
  EXPECT_DOUBLE_EQ(up->score, 0.8);
  EXPECT_DOUBLE_EQ(down->score, 0.8);  // strength, not sign
  EXPECT_DOUBLE_EQ(up->entry_price, 2.0);
  EXPECT_EQ(up->timestamp_ms, 1'000);
}

// -----------------------------------------------------------------------------
// 3. A wide spread eats into confidence and can drop the opportunity.
// Why: Relative spread 0.03 costs 0.3 confidence: 0.8 -> 0.5, below a 0.6
//      threshold. Crossing the spread would consume most of a scalp target.
// -----------------------------------------------------------------------------
TEST(ScorerTest, SpreadPenaltyCanDropOpportunity) {
  micro::Scorer scorer(0.6);
  auto wide = bullish();
  wide.relative_spread = 0.03;

  EXPECT_FALSE(scorer.score(inst("WIDE"), wide).has_value());

  micro::Scorer lenient(0.4);
  auto kept = lenient.score(inst("WIDE"), wide);
  ASSERT_TRUE(kept.has_value());
  EXPECT_NEAR(kept->confidence, 0.5, 1e-12);
}

TEST(ScorerTest, ZeroScoreIsNotAnOpportunity) {
  micro::Scorer scorer(0.0, [](const micro::domain::Features&) {
    return 0.0;
  });
  EXPECT_FALSE(scorer.score(inst("FLAT"), bullish()).has_value());
}

// -----------------------------------------------------------------------------
// 4. Scoring is a pure function of the features.
// Why: Two scans of the same data must produce the same trades.
// -----------------------------------------------------------------------------
TEST(ScorerTest, ScoringIsDeterministic) {
  micro::Scorer scorer(0.1);
  auto a = scorer.score(inst("X"), bullish());
  auto b = scorer.score(inst("X"), bullish());
  ASSERT_TRUE(a && b);
  EXPECT_EQ(a->score, b->score);
  EXPECT_EQ(a->confidence, b->confidence);
}

TEST(ScorerTest, CustomScoreFunctionIsClamped) {
  micro::Scorer scorer(0.1, [](const micro::domain::Features&) {
    return -7.0;
  });
  auto o = scorer.score(inst("X"), bullish());
  ASSERT_TRUE(o.has_value());
  EXPECT_DOUBLE_EQ(o->score, 1.0);
  EXPECT_EQ(o->direction, micro::domain::Direction::Short);
}

// -----------------------------------------------------------------------------
// 5. Ranking order: score desc, then liquidity tier desc, then id asc.
//    A short ranks on its strength exactly like a long.
// Why: The execution coordinator submits strictly in this order, so ties
//      must break the same way on every run.
// -----------------------------------------------------------------------------
TEST(ScorerTest, RankOrdersByScoreTierThenId) {
  std::vector<micro::domain::Opportunity> ops = {
      opp("CCC", 0.5, 1),
      opp("BBB", 0.9, 1, micro::domain::Direction::Short),
      opp("AAA", 0.5, 1),
      opp("DDD", 0.5, 3),
      opp("EEE", 0.7, 2),
  };

  micro::Scorer::rank(ops);

  std::vector<std::string> ids;
  for (const auto& o : ops) {
    ids.push_back(o.instrument.id);
  }
  EXPECT_EQ(ids, (std::vector<std::string>{"BBB", "EEE", "DDD", "AAA", "CCC"}));
}

TEST(ScorerTest, RankIsIndependentOfInputOrder) {
  std::vector<micro::domain::Opportunity> forward = {
      opp("A", 0.6, 1), opp("B", 0.6, 1), opp("C", 0.8, 1)};
  std::vector<micro::domain::Opportunity> backward(forward.rbegin(),
                                                   forward.rend());

  micro::Scorer::rank(forward);
  micro::Scorer::rank(backward);

  for (std::size_t i = 0; i < forward.size(); ++i) {
    EXPECT_EQ(forward[i].instrument.id, backward[i].instrument.id);
  }
}
