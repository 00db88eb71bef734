#pragma once
#include <ctime>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "Card.hpp"

// A due card as fetched for a session build, with its manual bury mark.
struct SessionCandidate {
    CardSummary summary;
    std::optional<std::time_t> buried_until;
};

/*
  Keeps at most one card per note in a session. State lives only for the
  duration of one build: the first card admitted for a note claims it and
  every later sibling is dropped. Cards with a manual bury mark still in the
  future are never admitted.
*/
class SiblingFilter {
public:
    explicit SiblingFilter(std::time_t now);

    // Admits candidates in order until `limit` are taken. Suppressed or
    // buried cards do not count against the limit.
    std::vector<CardSummary> take(const std::vector<SessionCandidate>& candidates, std::size_t limit);

    bool claimed(const std::string& noteId) const { return notes.count(noteId) > 0; }
    std::size_t suppressedCount() const { return suppressed; }

private:
    std::time_t now;
    std::unordered_set<std::string> notes;
    std::size_t suppressed = 0;
};
