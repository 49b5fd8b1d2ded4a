#include "micro/universe/universe_manager.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <set>
#include <utility>

namespace micro {

UniverseManager::UniverseManager(IMarketGateway& gateway,
                                 const EngineConfig& config)
    : gateway_(gateway), config_(config) {}

// -----------------------------------------------------------------------------
// refresh(): fetch, select, swap (or keep the last good set)
// -----------------------------------------------------------------------------
bool UniverseManager::refresh() {
  std::vector<domain::Instrument> listing;
  try {
    listing = gateway_.listInstruments();
  } catch (const GatewayError& e) {
    std::cerr << "[UniverseManager] refresh failed, keeping " << size()
              << " instrument(s): " << e.what() << "\n";
    return false;
  }

  std::vector<domain::Instrument> selected = select(std::move(listing), config_);
  if (selected.empty()) {
    std::cerr << "[UniverseManager] refresh selected nothing, keeping "
              << size() << " instrument(s)\n";
    return false;
  }

  std::size_t count = selected.size();
  {
    std::unique_lock lock(mutex_);
    instruments_ = std::move(selected);
  }

  std::cout << "[UniverseManager] universe refreshed: " << count
            << " instrument(s)\n";
  return true;
}

std::vector<domain::Instrument> UniverseManager::instruments() const {
  std::shared_lock lock(mutex_);
  return instruments_;
}

std::size_t UniverseManager::size() const {
  std::shared_lock lock(mutex_);
  return instruments_.size();
}

// -----------------------------------------------------------------------------
// select(): whitelist, volume floor, deterministic order, truncate
// -----------------------------------------------------------------------------
std::vector<domain::Instrument> UniverseManager::select(
    std::vector<domain::Instrument> listing, const EngineConfig& config) {
  std::set<std::string> whitelist(config.symbols.begin(),
                                  config.symbols.end());

  listing.erase(
      std::remove_if(listing.begin(), listing.end(),
                     [&](const domain::Instrument& inst) {
                       if (!whitelist.empty() &&
                           whitelist.count(inst.id) == 0) {
                         return true;
                       }
                       return inst.volume_24h < config.min_24h_volume;
                     }),
      listing.end());

  std::sort(listing.begin(), listing.end(),
            [](const domain::Instrument& a, const domain::Instrument& b) {
              if (a.liquidity_tier != b.liquidity_tier) {
                return a.liquidity_tier > b.liquidity_tier;
              }
              if (a.volume_24h != b.volume_24h) {
                return a.volume_24h > b.volume_24h;
              }
              return a.id < b.id;
            });

  if (listing.size() > config.universe_size) {
    listing.resize(config.universe_size);
  }
  return listing;
}

}  // namespace micro
