#include <hcr/events.hpp>
#include <cstdio>
#include <type_traits>

namespace hcr {

template <class> inline constexpr bool kAlwaysFalse = false;

const char* hazard_name(HazardKind kind) {
  switch (kind) {
    case HazardKind::Spikes: return "spikes";
    case HazardKind::Boost:  return "boost";
  }
  return "unknown";
}

const char* event_name(const GameEvent& ev) {
  return std::visit([](const auto& e) -> const char* {
    using T = std::decay_t<decltype(e)>;
    if constexpr (std::is_same_v<T, Crashed>)              return "Crashed";
    else if constexpr (std::is_same_v<T, Flipped>)         return "Flipped";
    else if constexpr (std::is_same_v<T, CoinCollected>)   return "CoinCollected";
    else if constexpr (std::is_same_v<T, FuelCollected>)   return "FuelCollected";
    else if constexpr (std::is_same_v<T, FuelEmpty>)       return "FuelEmpty";
    else if constexpr (std::is_same_v<T, HazardTriggered>) return "HazardTriggered";
    else if constexpr (std::is_same_v<T, LevelComplete>)   return "LevelComplete";
    else static_assert(kAlwaysFalse<T>, "unhandled event");
  }, ev);
}

std::string describe_event(const GameEvent& ev) {
  char buf[128];
  std::visit([&](const auto& e) {
    using T = std::decay_t<decltype(e)>;
    if constexpr (std::is_same_v<T, Crashed>) {
      std::snprintf(buf, sizeof(buf), "Crashed");
    } else if constexpr (std::is_same_v<T, Flipped>) {
      std::snprintf(buf, sizeof(buf), "Flipped (%.1fs air)", e.airtime);
    } else if constexpr (std::is_same_v<T, CoinCollected>) {
      std::snprintf(buf, sizeof(buf), "Coin #%u", static_cast<unsigned>(e.id));
    } else if constexpr (std::is_same_v<T, FuelCollected>) {
      std::snprintf(buf, sizeof(buf), "Fuel +%.0f", e.amount);
    } else if constexpr (std::is_same_v<T, FuelEmpty>) {
      std::snprintf(buf, sizeof(buf), "Out of fuel");
    } else if constexpr (std::is_same_v<T, HazardTriggered>) {
      std::snprintf(buf, sizeof(buf), "Hazard #%u (%s)", static_cast<unsigned>(e.id), hazard_name(e.kind));
    } else if constexpr (std::is_same_v<T, LevelComplete>) {
      std::snprintf(buf, sizeof(buf), "Level complete: %.0f m, %u coins, %.1fs",
                    e.distance, static_cast<unsigned>(e.coins), e.time_elapsed);
    } else {
      static_assert(kAlwaysFalse<T>, "unhandled event");
    }
  }, ev);
  return buf;
}

} // namespace hcr
