#pragma once
#include <ctime>
#include "Card.hpp"
#include "Deck.hpp"
#include "IntervalCalculator.hpp"

enum class GraduationPolicy {
    FirstSixDays,   // 6 days on the first graduation, 1 day after that
    AlwaysOneDay
};

const char* graduationPolicyName(GraduationPolicy policy);
GraduationPolicy parseGraduationPolicy(const std::string& name);

struct StateMachineOptions {
    GraduationPolicy graduation = GraduationPolicy::FirstSixDays;
    double first_graduation_days = 6.0;
    double graduation_days = 1.0;
    int leech_threshold = 8;
    int almost_floor_minutes = 10;  // shortest delay an Almost in (re)learning can produce
};

struct Transition {
    Card card;            // posterior snapshot
    bool graduated = false;
    bool lapsed = false;  // lapse counted (Review miss or miss while relearning)
    bool leech = false;   // lapse count reached the threshold on this answer
};

/*
  Pure lifecycle logic: (card, rating, deck prefs, now) -> next card.
  No clock reads, no randomness, no I/O; the caller supplies "now".
  Dispatch is a switch over the state tag and the rating.
*/
class CardStateMachine {
public:
    CardStateMachine(const IntervalCalculator& calculator, StateMachineOptions options = StateMachineOptions());

    // Throws ValidationError(CardSuspended) for a suspended card.
    Transition answer(const Card& card, Rating rating, const DeckPrefs& prefs, std::time_t now) const;

    // From any non-suspended state; suspending a suspended card changes nothing.
    static Card suspend(const Card& card);
    // Restores the pre-suspend state; other parameters are untouched.
    static Card unsuspend(const Card& card);

private:
    const IntervalCalculator& calculator;
    StateMachineOptions opts;

    void answerLearning(Transition& t, Rating rating, const DeckPrefs& prefs, std::time_t now) const;
    void answerReview(Transition& t, Rating rating, const DeckPrefs& prefs, std::time_t now) const;
    void graduate(Transition& t, std::time_t now) const;
    void handleLapse(Transition& t, const DeckPrefs& prefs, std::time_t now) const;
};
