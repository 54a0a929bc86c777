#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include <hcr/events.hpp>

using namespace hcr;

TEST_CASE("event_name covers every event kind") {
  REQUIRE(std::string(event_name(Crashed{})) == "Crashed");
  REQUIRE(std::string(event_name(Flipped{1.0})) == "Flipped");
  REQUIRE(std::string(event_name(CoinCollected{3})) == "CoinCollected");
  REQUIRE(std::string(event_name(FuelCollected{1, 35.0})) == "FuelCollected");
  REQUIRE(std::string(event_name(FuelEmpty{})) == "FuelEmpty");
  REQUIRE(std::string(event_name(HazardTriggered{2, HazardKind::Boost})) == "HazardTriggered");
  REQUIRE(std::string(event_name(LevelComplete{5000.0, 12, 300.0})) == "LevelComplete");
}

TEST_CASE("describe_event carries the payload") {
  REQUIRE(describe_event(Crashed{}) == "Crashed");
  REQUIRE(describe_event(FuelEmpty{}) == "Out of fuel");
  REQUIRE(describe_event(CoinCollected{17}) == "Coin #17");
  REQUIRE(describe_event(FuelCollected{4, 35.0}) == "Fuel +35");
  REQUIRE(describe_event(Flipped{1.3}) == "Flipped (1.3s air)");
  REQUIRE(describe_event(HazardTriggered{9, HazardKind::Spikes}) == "Hazard #9 (spikes)");
  REQUIRE(describe_event(LevelComplete{5000.0, 12, 300.0}) == "Level complete: 5000 m, 12 coins, 300.0s");
}

TEST_CASE("count_events filters by type") {
  std::vector<GameEvent> batch{
    CoinCollected{1}, CoinCollected{2}, FuelEmpty{}, CoinCollected{3}, Crashed{}
  };
  REQUIRE(count_events<CoinCollected>(batch) == 3);
  REQUIRE(count_events<FuelEmpty>(batch) == 1);
  REQUIRE(count_events<Crashed>(batch) == 1);
  REQUIRE(count_events<Flipped>(batch) == 0);
}

TEST_CASE("hazard_name") {
  REQUIRE(std::string(hazard_name(HazardKind::Spikes)) == "spikes");
  REQUIRE(std::string(hazard_name(HazardKind::Boost)) == "boost");
}
