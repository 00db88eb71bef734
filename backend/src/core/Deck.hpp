#pragma once
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

// How the New and Review buckets are merged once learning cards are placed.
enum class QueueOrder {
    NewFirst,
    ReviewsFirst,
    Alternate
};

const char* queueOrderName(QueueOrder order);
QueueOrder parseQueueOrder(const std::string& name);

struct DeckPrefs {
    int new_per_day = 10;                     // 0 disables new cards
    int rev_per_day = 100;                    // 0 disables reviews
    std::vector<int> steps_min{ 10, 1440 };   // learning steps in minutes
    QueueOrder order = QueueOrder::NewFirst;
    bool bidirectional = false;               // also create back->front cards

    // Throws ValidationError(InvalidDeckConfig) on negative limits, an empty
    // step list or a step shorter than one minute.
    void validate() const;

    // Clamps a (possibly stale) step index to the configured steps.
    int stepMinutes(int index) const;
    int lastStepIndex() const { return static_cast<int>(steps_min.size()) - 1; }
};

nlohmann::json deckPrefsToJson(const DeckPrefs& prefs);
// Missing keys keep their defaults; wrong types or values are InvalidDeckConfig.
DeckPrefs deckPrefsFromJson(const nlohmann::json& doc);

class Deck {
public:
    std::string id;
    std::string name;
    bool is_builtin = false;
    DeckPrefs prefs;
};
