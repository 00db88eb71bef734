#include "Card.hpp"
#include "Errors.hpp"
#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>

const char* cardStateName(CardState state) {
    switch (state) {
    case CardState::New: return "new";
    case CardState::Learning: return "learning";
    case CardState::Review: return "review";
    case CardState::Relearning: return "relearning";
    case CardState::Suspended: return "suspended";
    }
    return "new";
}

CardState parseCardState(const std::string& name) {
    if (name == "new") return CardState::New;
    if (name == "learning") return CardState::Learning;
    if (name == "review") return CardState::Review;
    if (name == "relearning") return CardState::Relearning;
    if (name == "suspended") return CardState::Suspended;
    throw ValidationError(ErrorKind::InvalidArgument, "Unknown card state '" + name + "'");
}

Rating ratingFromInt(int value) {
    switch (value) {
    case 0: return Rating::Missed;
    case 1: return Rating::Almost;
    case 2: return Rating::GotIt;
    default:
        throw ValidationError(ErrorKind::InvalidRating,
            "Rating must be 0, 1 or 2 (got " + std::to_string(value) + ")");
    }
}

const char* ratingName(Rating rating) {
    switch (rating) {
    case Rating::Missed: return "missed";
    case Rating::Almost: return "almost";
    case Rating::GotIt: return "got-it";
    }
    return "missed";
}

// Simple unique ID generator (timestamp + random bits)
std::string Card::generateID() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count();

    static thread_local std::mt19937_64 eng{ std::random_device{}() };
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t randPart = dist(eng);

    std::stringstream ss;
    ss << std::hex << millis << "-" << std::setw(16) << std::setfill('0') << randPart;
    return ss.str();
}
