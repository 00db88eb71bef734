#pragma once
#include "Card.hpp"

// Interval used by the Almost ("hard") path of a Review card.
enum class HardIntervalPolicy {
    EaseAdjusted,     // previous interval x the already-lowered ease
    FixedMultiplier   // previous interval x hard_multiplier
};

const char* hardIntervalPolicyName(HardIntervalPolicy policy);
HardIntervalPolicy parseHardIntervalPolicy(const std::string& name);

struct IntervalOptions {
    double ease_floor = 1.3;
    double max_interval_days = 36500.0;
    double min_review_interval_days = 1.0;
    HardIntervalPolicy hard_policy = HardIntervalPolicy::EaseAdjusted;
    double hard_multiplier = 1.2;
};

struct EaseInterval {
    double ease = Card::kDefaultEase;
    double interval_days = 0.0;
};

/*
  Seam between the state machine and the memory model. The closed-form
  ease-factor rule is the only implementation; a retrievability-based model
  would plug in here.
*/
class IntervalCalculator {
public:
    virtual ~IntervalCalculator() = default;

    // Next (ease, interval) for a card currently in Review.
    virtual EaseInterval nextReview(double ease, double intervalDays, Rating rating) const = 0;
    // Ease after a lapse (Review -> Relearning).
    virtual double lapseEase(double ease) const = 0;
};

class EaseIntervalCalculator : public IntervalCalculator {
public:
    explicit EaseIntervalCalculator(IntervalOptions options = IntervalOptions());

    EaseInterval nextReview(double ease, double intervalDays, Rating rating) const override;
    double lapseEase(double ease) const override;

    static constexpr double kHardEasePenalty = 0.15;
    static constexpr double kLapseEasePenalty = 0.8;

private:
    IntervalOptions opts;

    double clampInterval(double days) const;
};

// Seconds to add to "now" for an interval in (possibly fractional) days.
long long intervalSeconds(double intervalDays);
