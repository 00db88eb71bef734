#pragma once
#include <string>
#include <nlohmann/json_fwd.hpp>
#include "../core/CardStateMachine.hpp"
#include "../core/Deck.hpp"
#include "../core/IntervalCalculator.hpp"

// Application settings, read from a JSON file. Unknown keys are ignored,
// missing keys keep the defaults below.
struct AppConfig {
    std::string database_path = "retain.sqlite";
    std::string log_file = "retain.log";
    std::string log_level = "info";

    int rollover_hour = 4;
    int leech_threshold = 8;
    double max_interval_days = 36500.0;
    HardIntervalPolicy hard_interval_policy = HardIntervalPolicy::EaseAdjusted;
    double hard_multiplier = 1.2;
    GraduationPolicy graduation_policy = GraduationPolicy::FirstSixDays;
    int jitter_max_seconds = 300;

    DeckPrefs default_deck_prefs;

    // Throws ValidationError on out-of-range values.
    void validate() const;

    IntervalOptions intervalOptions() const;
    StateMachineOptions stateMachineOptions() const;

    // A missing file yields the defaults (with a warning); an unreadable or
    // malformed one throws ValidationError.
    static AppConfig load(const std::string& path);
    static AppConfig fromJson(const nlohmann::json& doc);
    nlohmann::json toJson() const;
};
