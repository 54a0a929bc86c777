#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <hcr/terrain.hpp>

namespace hcr {

struct Crashed {};
struct Flipped {
  double airtime = 0.0;
};
struct CoinCollected {
  PickupId id = 0;
};
struct FuelCollected {
  PickupId id = 0;
  double amount = 0.0;
};
struct FuelEmpty {};
struct HazardTriggered {
  HazardId id = 0;
  HazardKind kind = HazardKind::Spikes;
};
struct LevelComplete {
  double distance = 0.0;
  std::uint32_t coins = 0;
  double time_elapsed = 0.0;
};

using GameEvent = std::variant<Crashed, Flipped, CoinCollected, FuelCollected,
                               FuelEmpty, HazardTriggered, LevelComplete>;

const char* event_name(const GameEvent& ev);
const char* hazard_name(HazardKind kind);

// One-line description for logs and the viewer's toast list.
std::string describe_event(const GameEvent& ev);

// Counts events of type T in a batch.
template <class T>
std::size_t count_events(const std::vector<GameEvent>& events) {
  std::size_t n = 0;
  for (const auto& e : events) if (std::holds_alternative<T>(e)) ++n;
  return n;
}

} // namespace hcr
