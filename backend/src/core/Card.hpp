#pragma once
#include <string>
#include <ctime>
#include <optional>

enum class CardState {
    New,
    Learning,
    Review,
    Relearning,
    Suspended
};

enum class Rating {
    Missed = 0,
    Almost = 1,
    GotIt = 2
};

// Stored/logged spelling of a state ("new", "learning", ...).
const char* cardStateName(CardState state);
// Throws ValidationError for an unknown spelling.
CardState parseCardState(const std::string& name);

// Maps a raw 0/1/2 grade to a Rating; anything else is InvalidRating.
Rating ratingFromInt(int value);
const char* ratingName(Rating rating);

// Template tags for the cards a note can own.
inline constexpr const char* kFrontToBack = "front->back";
inline constexpr const char* kBackToFront = "back->front";

class Card {
public:
    static constexpr double kDefaultEase = 2.5;

    std::string id;
    std::string note_id;
    std::string template_tag = kFrontToBack;

    CardState state = CardState::New;
    std::time_t due = 0;              // creation order while New, absolute instant otherwise
    double interval_days = 0.0;
    double ease_factor = kDefaultEase;
    int lapses = 0;
    int step_index = 0;               // index into the deck's learning steps
    std::optional<std::time_t> last_review;

    bool graduated_before = false;    // has ever left (re)learning for Review
    std::optional<CardState> suspended_from;
    std::optional<std::time_t> buried_until;

    static std::string generateID();
};

// What a session hands to the presenter.
struct CardSummary {
    std::string card_id;
    std::string note_id;
    std::string deck_id;
    std::string front;
    std::string back;
    CardState state = CardState::New;
    std::string template_tag;
    std::time_t due = 0;
};
