#include "IntervalCalculator.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

const char* hardIntervalPolicyName(HardIntervalPolicy policy) {
    switch (policy) {
    case HardIntervalPolicy::EaseAdjusted: return "ease_adjusted";
    case HardIntervalPolicy::FixedMultiplier: return "fixed_multiplier";
    }
    return "ease_adjusted";
}

HardIntervalPolicy parseHardIntervalPolicy(const std::string& name) {
    if (name == "ease_adjusted") return HardIntervalPolicy::EaseAdjusted;
    if (name == "fixed_multiplier") return HardIntervalPolicy::FixedMultiplier;
    throw ValidationError(ErrorKind::InvalidArgument, "Unknown hard interval policy '" + name + "'");
}

EaseIntervalCalculator::EaseIntervalCalculator(IntervalOptions options)
    : opts(options)
{
    if (opts.ease_floor <= 0.0 || opts.max_interval_days < opts.min_review_interval_days) {
        throw ValidationError(ErrorKind::InvalidArgument, "Invalid interval calculator bounds");
    }
}

double EaseIntervalCalculator::clampInterval(double days) const {
    return std::clamp(days, opts.min_review_interval_days, opts.max_interval_days);
}

/*
  Review-state update:
    Got-it -> interval x ease, ease unchanged
    Almost -> ease - 0.15 (floored), interval x new ease (or x hard_multiplier)
    Missed -> handled as a lapse by the state machine; interval drops to 0
*/
EaseInterval EaseIntervalCalculator::nextReview(double ease, double intervalDays, Rating rating) const {
    EaseInterval out;
    double ef = std::max(opts.ease_floor, ease);
    double prev = std::max(opts.min_review_interval_days, intervalDays);

    switch (rating) {
    case Rating::GotIt:
        out.ease = ef;
        out.interval_days = clampInterval(prev * ef);
        break;
    case Rating::Almost:
        out.ease = std::max(opts.ease_floor, ef - kHardEasePenalty);
        if (opts.hard_policy == HardIntervalPolicy::EaseAdjusted) {
            out.interval_days = clampInterval(prev * out.ease);
        }
        else {
            out.interval_days = clampInterval(prev * opts.hard_multiplier);
        }
        break;
    case Rating::Missed:
        out.ease = lapseEase(ef);
        out.interval_days = 0.0;
        break;
    }

    spdlog::debug("Ease/interval: ease={:.2f} ivl={:.2f}d rating={} -> ease={:.2f} ivl={:.2f}d",
        ease, intervalDays, ratingName(rating), out.ease, out.interval_days);
    return out;
}

double EaseIntervalCalculator::lapseEase(double ease) const {
    return std::max(opts.ease_floor, ease - kLapseEasePenalty);
}

long long intervalSeconds(double intervalDays) {
    return std::llround(intervalDays * 86400.0);
}
