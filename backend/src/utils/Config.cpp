#include "Config.hpp"
#include "../core/Errors.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* key, Setter&& setter) {
    if (!obj.contains(key)) {
        return false;
    }
    const auto& value = obj[key];
    if (value.is_null()) {
        return false;
    }
    try {
        setter(value);
    }
    catch (const nlohmann::json::exception& e) {
        throw ValidationError(ErrorKind::InvalidArgument,
            std::string("Bad value for config field '") + key + "': " + e.what());
    }
    return true;
}

} // namespace

void AppConfig::validate() const {
    if (database_path.empty()) {
        throw ValidationError(ErrorKind::InvalidArgument, "database_path must not be empty");
    }
    if (spdlog::level::from_str(log_level) == spdlog::level::off && log_level != "off") {
        throw ValidationError(ErrorKind::InvalidArgument, "Unknown log_level '" + log_level + "'");
    }
    if (rollover_hour < 0 || rollover_hour > 23) {
        throw ValidationError(ErrorKind::InvalidArgument, "rollover_hour must be within 0..23");
    }
    if (leech_threshold < 1) {
        throw ValidationError(ErrorKind::InvalidArgument, "leech_threshold must be >= 1");
    }
    if (max_interval_days < 1.0) {
        throw ValidationError(ErrorKind::InvalidArgument, "max_interval_days must be >= 1");
    }
    if (hard_multiplier < 1.0) {
        throw ValidationError(ErrorKind::InvalidArgument, "hard_multiplier must be >= 1");
    }
    if (jitter_max_seconds < 0 || jitter_max_seconds > 300) {
        throw ValidationError(ErrorKind::InvalidArgument, "jitter_max_seconds must be within 0..300");
    }
    default_deck_prefs.validate();
}

IntervalOptions AppConfig::intervalOptions() const {
    IntervalOptions opts;
    opts.max_interval_days = max_interval_days;
    opts.hard_policy = hard_interval_policy;
    opts.hard_multiplier = hard_multiplier;
    return opts;
}

StateMachineOptions AppConfig::stateMachineOptions() const {
    StateMachineOptions opts;
    opts.graduation = graduation_policy;
    opts.leech_threshold = leech_threshold;
    return opts;
}

AppConfig AppConfig::fromJson(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw ValidationError(ErrorKind::InvalidArgument, "Config must be a JSON object");
    }

    AppConfig cfg;
    assign_if_present(doc, "database_path", [&](const nlohmann::json& v) { cfg.database_path = v.get<std::string>(); });
    assign_if_present(doc, "log_file", [&](const nlohmann::json& v) { cfg.log_file = v.get<std::string>(); });
    assign_if_present(doc, "log_level", [&](const nlohmann::json& v) { cfg.log_level = v.get<std::string>(); });
    assign_if_present(doc, "rollover_hour", [&](const nlohmann::json& v) { cfg.rollover_hour = v.get<int>(); });
    assign_if_present(doc, "leech_threshold", [&](const nlohmann::json& v) { cfg.leech_threshold = v.get<int>(); });
    assign_if_present(doc, "max_interval_days", [&](const nlohmann::json& v) { cfg.max_interval_days = v.get<double>(); });
    assign_if_present(doc, "hard_interval_policy", [&](const nlohmann::json& v) {
        cfg.hard_interval_policy = parseHardIntervalPolicy(v.get<std::string>());
    });
    assign_if_present(doc, "hard_multiplier", [&](const nlohmann::json& v) { cfg.hard_multiplier = v.get<double>(); });
    assign_if_present(doc, "graduation_policy", [&](const nlohmann::json& v) {
        cfg.graduation_policy = parseGraduationPolicy(v.get<std::string>());
    });
    assign_if_present(doc, "jitter_max_seconds", [&](const nlohmann::json& v) { cfg.jitter_max_seconds = v.get<int>(); });
    assign_if_present(doc, "default_deck_prefs", [&](const nlohmann::json& v) {
        cfg.default_deck_prefs = deckPrefsFromJson(v);
    });

    cfg.validate();
    return cfg;
}

nlohmann::json AppConfig::toJson() const {
    return nlohmann::json{
        { "database_path", database_path },
        { "log_file", log_file },
        { "log_level", log_level },
        { "rollover_hour", rollover_hour },
        { "leech_threshold", leech_threshold },
        { "max_interval_days", max_interval_days },
        { "hard_interval_policy", hardIntervalPolicyName(hard_interval_policy) },
        { "hard_multiplier", hard_multiplier },
        { "graduation_policy", graduationPolicyName(graduation_policy) },
        { "jitter_max_seconds", jitter_max_seconds },
        { "default_deck_prefs", deckPrefsToJson(default_deck_prefs) }
    };
}

AppConfig AppConfig::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        spdlog::warn("Config file '{}' not found; using defaults", path);
        return AppConfig();
    }

    nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        throw ValidationError(ErrorKind::InvalidArgument, "Config file '" + path + "' is not valid JSON");
    }

    AppConfig cfg = fromJson(doc);
    spdlog::info("Loaded config from '{}'", path);
    return cfg;
}
