#include "Deck.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

const char* queueOrderName(QueueOrder order) {
    switch (order) {
    case QueueOrder::NewFirst: return "new_first";
    case QueueOrder::ReviewsFirst: return "reviews_first";
    case QueueOrder::Alternate: return "alternate";
    }
    return "new_first";
}

QueueOrder parseQueueOrder(const std::string& name) {
    if (name == "new_first") return QueueOrder::NewFirst;
    if (name == "reviews_first") return QueueOrder::ReviewsFirst;
    if (name == "alternate") return QueueOrder::Alternate;
    throw ValidationError(ErrorKind::InvalidDeckConfig, "Unknown queue order '" + name + "'");
}

void DeckPrefs::validate() const {
    if (new_per_day < 0) {
        throw ValidationError(ErrorKind::InvalidDeckConfig, "new_per_day must be >= 0");
    }
    if (rev_per_day < 0) {
        throw ValidationError(ErrorKind::InvalidDeckConfig, "rev_per_day must be >= 0");
    }
    if (steps_min.empty()) {
        throw ValidationError(ErrorKind::InvalidDeckConfig, "steps_min must not be empty");
    }
    for (int step : steps_min) {
        if (step < 1) {
            throw ValidationError(ErrorKind::InvalidDeckConfig,
                "learning steps must be at least 1 minute (got " + std::to_string(step) + ")");
        }
    }
}

int DeckPrefs::stepMinutes(int index) const {
    int idx = std::clamp(index, 0, lastStepIndex());
    return steps_min[static_cast<size_t>(idx)];
}

nlohmann::json deckPrefsToJson(const DeckPrefs& prefs) {
    return nlohmann::json{
        { "new_per_day", prefs.new_per_day },
        { "rev_per_day", prefs.rev_per_day },
        { "steps_min", prefs.steps_min },
        { "order", queueOrderName(prefs.order) },
        { "bidirectional_cards", prefs.bidirectional }
    };
}

namespace {

int intField(const nlohmann::json& doc, const char* key, int fallback) {
    if (!doc.contains(key) || doc[key].is_null()) return fallback;
    const auto& value = doc[key];
    if (!value.is_number_integer()) {
        throw ValidationError(ErrorKind::InvalidDeckConfig,
            std::string("Expected integer for field '") + key + "'");
    }
    return value.get<int>();
}

} // namespace

DeckPrefs deckPrefsFromJson(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw ValidationError(ErrorKind::InvalidDeckConfig, "Deck preferences must be a JSON object");
    }

    DeckPrefs prefs;
    prefs.new_per_day = intField(doc, "new_per_day", prefs.new_per_day);
    prefs.rev_per_day = intField(doc, "rev_per_day", prefs.rev_per_day);

    if (doc.contains("steps_min")) {
        const auto& steps = doc["steps_min"];
        if (!steps.is_array()) {
            throw ValidationError(ErrorKind::InvalidDeckConfig, "steps_min must be an array");
        }
        prefs.steps_min.clear();
        for (const auto& s : steps) {
            if (!s.is_number_integer()) {
                throw ValidationError(ErrorKind::InvalidDeckConfig, "steps_min entries must be integers");
            }
            prefs.steps_min.push_back(s.get<int>());
        }
    }

    if (doc.contains("order")) {
        if (!doc["order"].is_string()) {
            throw ValidationError(ErrorKind::InvalidDeckConfig, "order must be a string");
        }
        prefs.order = parseQueueOrder(doc["order"].get<std::string>());
    }

    if (doc.contains("bidirectional_cards")) {
        if (!doc["bidirectional_cards"].is_boolean()) {
            throw ValidationError(ErrorKind::InvalidDeckConfig, "bidirectional_cards must be a boolean");
        }
        prefs.bidirectional = doc["bidirectional_cards"].get<bool>();
    }

    prefs.validate();
    return prefs;
}
