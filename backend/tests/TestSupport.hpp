#pragma once
#include <ctime>
#include <map>
#include <string>
#include "core/Card.hpp"
#include "core/Deck.hpp"
#include "core/SessionBuilder.hpp"
#include "utils/Config.hpp"

namespace testing_support {

// Fixed point in time all tests count from (2023-11-14T22:13:20Z).
constexpr std::time_t kNow = 1700000000;
constexpr std::time_t kMinute = 60;
constexpr std::time_t kDay = 86400;

// Deterministic jitter: per-card offsets, zero by default.
class FixedJitter : public JitterSource {
public:
    std::map<std::string, int> offsets;

    int offsetSeconds(const CardSummary& card, int) override {
        auto it = offsets.find(card.card_id);
        return it == offsets.end() ? 0 : it->second;
    }
};

inline DeckPrefs prefs(int newPerDay, int revPerDay, std::vector<int> steps = { 10, 1440 }) {
    DeckPrefs p;
    p.new_per_day = newPerDay;
    p.rev_per_day = revPerDay;
    p.steps_min = std::move(steps);
    return p;
}

inline AppConfig testConfig() {
    AppConfig cfg;
    cfg.database_path = ":memory:";
    return cfg;
}

} // namespace testing_support
