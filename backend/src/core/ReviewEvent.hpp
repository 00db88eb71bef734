#pragma once
#include <cstdint>
#include <ctime>
#include <string>
#include "Card.hpp"

// One row of the review ledger. The persisted columns are fixed: card,
// timestamp, rating, answer duration, prior state, prior interval and
// resulting interval.
struct ReviewEvent {
    std::int64_t id = 0;              // assigned by the store
    std::string card_id;
    std::time_t timestamp = 0;        // seconds
    Rating rating = Rating::Missed;
    std::int64_t answer_ms = 0;
    CardState prior_state = CardState::New;
    double prior_interval = 0.0;
    double resulting_interval = 0.0;
};

// Per (deck, study date) answer counters used by the daily limits.
struct DailyCounts {
    int new_studied = 0;
    int rev_studied = 0;
};
