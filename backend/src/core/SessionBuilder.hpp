#pragma once
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include "Card.hpp"
#include "Deck.hpp"
#include "StudyDay.hpp"

class CardStore;

// Source of the small per-card skew used to break up learning cards that
// share a due timestamp.
class JitterSource {
public:
    virtual ~JitterSource() = default;
    // A value in [0, maxSeconds].
    virtual int offsetSeconds(const CardSummary& card, int maxSeconds) = 0;
};

// Draws from libsodium's CSPRNG; requires sodium_init().
class SodiumJitter : public JitterSource {
public:
    int offsetSeconds(const CardSummary& card, int maxSeconds) override;
};

struct SessionRequest {
    std::vector<std::string> deck_ids;
    std::time_t now = 0;
    std::optional<int> max_new;      // caps the session total across decks
    std::optional<int> max_review;
};

/*
  Builds the ordered list of cards for one review pass:
    1. per deck: learning (due), review (due, by due) and new (creation order)
    2. daily allowance = deck limit - answered today, further capped by the
       request overrides
    3. one card per note (learning, then review, then new claim first)
    4. learning first, ordered by jittered due; then new/review merged by the
       first deck's order policy
  The result is a snapshot; nothing here holds cursors into the store.
*/
class SessionBuilder {
public:
    static constexpr int kMaxJitterSeconds = 300;

    SessionBuilder(CardStore& store, const StudyDay& studyDay, JitterSource& jitter,
        int jitterMaxSeconds = kMaxJitterSeconds);

    std::vector<CardSummary> build(const SessionRequest& request);

private:
    CardStore& store;
    const StudyDay& study_day;
    JitterSource& jitter;
    int jitter_max;

    std::vector<CardSummary> orderLearning(std::vector<CardSummary> learning);
    static std::vector<CardSummary> merge(QueueOrder order, const std::vector<CardSummary>& fresh,
        const std::vector<CardSummary>& reviews);
};
