#pragma once
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>
#include "Card.hpp"
#include "ReviewEvent.hpp"

class CardStore;

// Append-only record of grading decisions. A failed append throws
// StorageError; the review it belongs to is then not committed.
class ReviewLedger {
public:
    explicit ReviewLedger(CardStore& store);

    ReviewEvent record(const std::string& cardId, Rating rating, std::int64_t answerMs,
        const Card& prior, const Card& posterior, std::time_t timestamp);

    // Oldest first.
    std::vector<ReviewEvent> history(const std::string& cardId) const;

private:
    CardStore& store;
};
