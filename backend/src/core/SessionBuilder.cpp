#include "SessionBuilder.hpp"
#include "Errors.hpp"
#include "SiblingFilter.hpp"
#include "../storage/CardStore.hpp"
#include <algorithm>
#include <limits>
#include <sodium.h>
#include <spdlog/spdlog.h>

int SodiumJitter::offsetSeconds(const CardSummary&, int maxSeconds) {
    if (maxSeconds <= 0) return 0;
    return static_cast<int>(randombytes_uniform(static_cast<uint32_t>(maxSeconds) + 1));
}

SessionBuilder::SessionBuilder(CardStore& s, const StudyDay& day, JitterSource& j, int jitterMaxSeconds)
    : store(s), study_day(day), jitter(j), jitter_max(jitterMaxSeconds)
{
    if (jitter_max < 0 || jitter_max > kMaxJitterSeconds) {
        throw ValidationError(ErrorKind::InvalidArgument, "jitter must be within 0..300 seconds");
    }
}

std::vector<CardSummary> SessionBuilder::build(const SessionRequest& req) {
    if (req.max_new && *req.max_new < 0) {
        throw ValidationError(ErrorKind::InvalidArgument, "max_new must be >= 0");
    }
    if (req.max_review && *req.max_review < 0) {
        throw ValidationError(ErrorKind::InvalidArgument, "max_review must be >= 0");
    }
    if (req.deck_ids.empty()) {
        return {};
    }

    // Resolve every deck before reading cards so an unknown id fails cleanly.
    std::vector<Deck> decks;
    for (const auto& id : req.deck_ids) {
        auto seen = std::find_if(decks.begin(), decks.end(), [&](const Deck& d) { return d.id == id; });
        if (seen != decks.end()) continue;

        auto deck = store.findDeck(id);
        if (!deck) {
            throw NotFoundError(ErrorKind::UnknownDeck, "Unknown deck " + id);
        }
        decks.push_back(*deck);
    }

    const std::string today = study_day.dateFor(req.now);
    int new_budget = req.max_new.value_or(std::numeric_limits<int>::max());
    int rev_budget = req.max_review.value_or(std::numeric_limits<int>::max());

    SiblingFilter filter(req.now);
    std::vector<CardSummary> learning;
    std::vector<CardSummary> reviews;
    std::vector<CardSummary> fresh;

    for (const auto& deck : decks) {
        DailyCounts done = store.dailyCounts(deck.id, today);
        int new_left = std::min(new_budget, std::max(0, deck.prefs.new_per_day - done.new_studied));
        int rev_left = std::min(rev_budget, std::max(0, deck.prefs.rev_per_day - done.rev_studied));

        // Learning cards are time critical and bypass the daily limits.
        auto l = filter.take(store.learningCandidates(deck.id, req.now), std::numeric_limits<size_t>::max());
        auto r = filter.take(store.reviewCandidates(deck.id, req.now), static_cast<size_t>(rev_left));
        auto n = filter.take(store.newCandidates(deck.id), static_cast<size_t>(new_left));

        new_budget -= static_cast<int>(n.size());
        rev_budget -= static_cast<int>(r.size());

        spdlog::debug("Session deck '{}': learning={} review={}/{} new={}/{} (answered today new={} rev={})",
            deck.name, l.size(), r.size(), rev_left, n.size(), new_left, done.new_studied, done.rev_studied);

        learning.insert(learning.end(), l.begin(), l.end());
        reviews.insert(reviews.end(), r.begin(), r.end());
        fresh.insert(fresh.end(), n.begin(), n.end());
    }

    // Keep each bucket's order across decks: reviews by due, new by creation.
    auto byDue = [](const CardSummary& a, const CardSummary& b) { return a.due < b.due; };
    std::stable_sort(reviews.begin(), reviews.end(), byDue);
    std::stable_sort(fresh.begin(), fresh.end(), byDue);

    std::vector<CardSummary> session = orderLearning(std::move(learning));
    auto rest = merge(decks.front().prefs.order, fresh, reviews);
    session.insert(session.end(), rest.begin(), rest.end());

    spdlog::info("Built session: {} cards ({} siblings suppressed)", session.size(), filter.suppressedCount());
    return session;
}

std::vector<CardSummary> SessionBuilder::orderLearning(std::vector<CardSummary> learning) {
    std::vector<std::pair<std::time_t, CardSummary>> keyed;
    keyed.reserve(learning.size());
    for (auto& c : learning) {
        int offset = std::clamp(jitter.offsetSeconds(c, jitter_max), 0, jitter_max);
        std::time_t skewed = c.due + offset;
        keyed.emplace_back(skewed, std::move(c));
    }

    std::stable_sort(keyed.begin(), keyed.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<CardSummary> out;
    out.reserve(keyed.size());
    for (auto& k : keyed) out.push_back(std::move(k.second));
    return out;
}

std::vector<CardSummary> SessionBuilder::merge(QueueOrder order, const std::vector<CardSummary>& fresh,
    const std::vector<CardSummary>& reviews)
{
    std::vector<CardSummary> out;
    out.reserve(fresh.size() + reviews.size());

    switch (order) {
    case QueueOrder::NewFirst:
        out.insert(out.end(), fresh.begin(), fresh.end());
        out.insert(out.end(), reviews.begin(), reviews.end());
        break;
    case QueueOrder::ReviewsFirst:
        out.insert(out.end(), reviews.begin(), reviews.end());
        out.insert(out.end(), fresh.begin(), fresh.end());
        break;
    case QueueOrder::Alternate: {
        size_t i = 0, j = 0;
        while (i < reviews.size() || j < fresh.size()) {
            if (i < reviews.size()) out.push_back(reviews[i++]);
            if (j < fresh.size()) out.push_back(fresh[j++]);
        }
        break;
    }
    }
    return out;
}
