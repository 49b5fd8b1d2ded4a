#include "micro/serialization/json_codec.hpp"

namespace micro {

nlohmann::json toJson(const domain::Position& p) {
  nlohmann::json j;
  j["id"] = p.id;
  j["instrument"] = p.instrument_id;
  j["direction"] = domain::directionToString(p.direction);
  j["entryPrice"] = p.entry_price;
  j["size"] = p.size;
  j["stopLoss"] = p.stop_loss;
  j["takeProfit"] = p.take_profit;
  j["openedAtMs"] = p.opened_at_ms;
  j["orderId"] = p.order_id;
  j["status"] = domain::positionStatusToString(p.status);
  j["forcedClose"] = p.forced_close;
  j["closeReason"] = domain::closeReasonToString(p.close_reason);
  return j;
}

nlohmann::json toJson(const domain::ClosedTrade& t) {
  nlohmann::json j;
  j["positionId"] = t.position_id;
  j["instrument"] = t.instrument_id;
  j["direction"] = domain::directionToString(t.direction);
  j["size"] = t.size;
  j["entryPrice"] = t.entry_price;
  j["exitPrice"] = t.exit_price;
  j["realizedPnl"] = t.realized_pnl;
  j["reason"] = domain::closeReasonToString(t.reason);
  j["openedAtMs"] = t.opened_at_ms;
  j["closedAtMs"] = t.closed_at_ms;
  return j;
}

nlohmann::json toJson(const domain::PerformanceSnapshot& s) {
  nlohmann::json j;
  j["timestampMs"] = s.timestamp_ms;
  j["balance"] = s.balance;
  j["growthPct"] = s.growth_pct;
  j["tradeCount"] = s.trade_count;
  j["wins"] = s.wins;
  j["winRate"] = s.win_rate;
  j["totalPnl"] = s.total_pnl;
  j["openPositions"] = s.open_positions;
  j["riskState"] = domain::riskStateToString(s.risk_state);
  return j;
}

nlohmann::json toJson(const domain::AccountState& a) {
  nlohmann::json j;
  j["balance"] = a.balance;
  j["peakBalance"] = a.peak_balance;
  j["dailyPnl"] = a.daily_pnl;
  j["dayStartBalance"] = a.day_start_balance;
  j["sessionRealizedPnl"] = a.session_realized_pnl;
  j["sessionStartBalance"] = a.session_start_balance;
  j["openPositions"] = a.open_positions;
  j["tradingDay"] = a.trading_day;
  return j;
}

}  // namespace micro
