#include "ReviewLedger.hpp"
#include "Errors.hpp"
#include "../storage/CardStore.hpp"
#include <spdlog/spdlog.h>

ReviewLedger::ReviewLedger(CardStore& s)
    : store(s)
{
}

ReviewEvent ReviewLedger::record(const std::string& cardId, Rating rating, std::int64_t answerMs,
    const Card& prior, const Card& posterior, std::time_t timestamp)
{
    if (answerMs < 0) {
        throw ValidationError(ErrorKind::InvalidArgument, "answer duration must be >= 0 ms");
    }

    ReviewEvent e;
    e.card_id = cardId;
    e.timestamp = timestamp;
    e.rating = rating;
    e.answer_ms = answerMs;
    e.prior_state = prior.state;
    e.prior_interval = prior.interval_days;
    e.resulting_interval = posterior.interval_days;
    e.id = store.appendReview(e);

    spdlog::debug("Ledger #{} card={} rating={} {} {:.2f}d -> {:.2f}d",
        e.id, cardId, static_cast<int>(rating), cardStateName(e.prior_state), e.prior_interval, e.resulting_interval);
    return e;
}

std::vector<ReviewEvent> ReviewLedger::history(const std::string& cardId) const {
    return store.reviewsForCard(cardId);
}
