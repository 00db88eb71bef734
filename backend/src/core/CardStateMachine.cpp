#include "CardStateMachine.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace {

std::time_t afterMinutes(std::time_t now, int minutes) {
    return now + static_cast<std::time_t>(minutes) * 60;
}

} // namespace

const char* graduationPolicyName(GraduationPolicy policy) {
    switch (policy) {
    case GraduationPolicy::FirstSixDays: return "first_six_days";
    case GraduationPolicy::AlwaysOneDay: return "always_one_day";
    }
    return "first_six_days";
}

GraduationPolicy parseGraduationPolicy(const std::string& name) {
    if (name == "first_six_days") return GraduationPolicy::FirstSixDays;
    if (name == "always_one_day") return GraduationPolicy::AlwaysOneDay;
    throw ValidationError(ErrorKind::InvalidArgument, "Unknown graduation policy '" + name + "'");
}

CardStateMachine::CardStateMachine(const IntervalCalculator& calc, StateMachineOptions options)
    : calculator(calc), opts(options)
{
    if (opts.leech_threshold < 1) {
        throw ValidationError(ErrorKind::InvalidArgument, "leech_threshold must be >= 1");
    }
}

Transition CardStateMachine::answer(const Card& card, Rating rating, const DeckPrefs& prefs, std::time_t now) const {
    prefs.validate();

    Transition t;
    t.card = card;

    switch (card.state) {
    case CardState::New:
        // Enter the first learning step, then grade as a learning answer.
        t.card.state = CardState::Learning;
        t.card.step_index = 0;
        t.card.interval_days = 0.0;
        t.card.due = afterMinutes(now, prefs.stepMinutes(0));
        answerLearning(t, rating, prefs, now);
        break;
    case CardState::Learning:
    case CardState::Relearning:
        answerLearning(t, rating, prefs, now);
        break;
    case CardState::Review:
        answerReview(t, rating, prefs, now);
        break;
    case CardState::Suspended:
        throw ValidationError(ErrorKind::CardSuspended, "Card " + card.id + " is suspended");
    }

    t.card.last_review = now;

    spdlog::debug("Transition card={} {} --{}--> {} step={} ivl={:.2f}d ease={:.2f} due={}",
        card.id, cardStateName(card.state), ratingName(rating), cardStateName(t.card.state),
        t.card.step_index, t.card.interval_days, t.card.ease_factor, t.card.due);
    return t;
}

void CardStateMachine::answerLearning(Transition& t, Rating rating, const DeckPrefs& prefs, std::time_t now) const {
    Card& c = t.card;
    int step = std::clamp(c.step_index, 0, prefs.lastStepIndex());

    switch (rating) {
    case Rating::GotIt:
        if (step >= prefs.lastStepIndex()) {
            graduate(t, now);
        }
        else {
            c.step_index = step + 1;
            c.due = afterMinutes(now, prefs.stepMinutes(c.step_index));
        }
        break;
    case Rating::Almost:
        c.step_index = step;
        c.due = afterMinutes(now, std::max(prefs.stepMinutes(step), opts.almost_floor_minutes));
        break;
    case Rating::Missed:
        c.step_index = 0;
        c.due = afterMinutes(now, prefs.stepMinutes(0));
        if (c.state == CardState::Relearning) {
            c.lapses++;
            t.lapsed = true;
            t.leech = c.lapses >= opts.leech_threshold;
        }
        break;
    }
}

void CardStateMachine::graduate(Transition& t, std::time_t now) const {
    Card& c = t.card;
    bool first = !c.graduated_before;

    if (opts.graduation == GraduationPolicy::FirstSixDays && first) {
        c.interval_days = opts.first_graduation_days;
    }
    else {
        c.interval_days = opts.graduation_days;
    }
    if (c.ease_factor <= 0.0) {
        c.ease_factor = Card::kDefaultEase;
    }

    c.state = CardState::Review;
    c.step_index = 0;
    c.graduated_before = true;
    c.due = now + intervalSeconds(c.interval_days);
    t.graduated = true;
}

void CardStateMachine::answerReview(Transition& t, Rating rating, const DeckPrefs& prefs, std::time_t now) const {
    if (rating == Rating::Missed) {
        handleLapse(t, prefs, now);
        return;
    }

    Card& c = t.card;
    EaseInterval next = calculator.nextReview(c.ease_factor, c.interval_days, rating);
    c.ease_factor = next.ease;
    c.interval_days = next.interval_days;
    c.due = now + intervalSeconds(c.interval_days);
}

/*
  Lapse: Review -> Relearning at the first step. The card is only flagged
  as a leech here; suspending it is the caller's decision.
*/
void CardStateMachine::handleLapse(Transition& t, const DeckPrefs& prefs, std::time_t now) const {
    Card& c = t.card;
    c.ease_factor = calculator.lapseEase(c.ease_factor);
    c.lapses++;
    c.state = CardState::Relearning;
    c.step_index = 0;
    c.interval_days = 0.0;
    c.due = afterMinutes(now, prefs.stepMinutes(0));

    t.lapsed = true;
    t.leech = c.lapses >= opts.leech_threshold;
}

Card CardStateMachine::suspend(const Card& card) {
    if (card.state == CardState::Suspended) {
        return card;
    }
    Card out = card;
    out.suspended_from = card.state;
    out.state = CardState::Suspended;
    return out;
}

Card CardStateMachine::unsuspend(const Card& card) {
    if (card.state != CardState::Suspended) {
        return card;
    }
    Card out = card;
    out.state = card.suspended_from.value_or(CardState::New);
    out.suspended_from.reset();
    return out;
}
