#include "SiblingFilter.hpp"
#include <spdlog/spdlog.h>

SiblingFilter::SiblingFilter(std::time_t t)
    : now(t)
{
}

std::vector<CardSummary> SiblingFilter::take(const std::vector<SessionCandidate>& candidates, std::size_t limit) {
    std::vector<CardSummary> out;
    if (limit == 0) return out;

    for (const auto& c : candidates) {
        if (out.size() >= limit) break;

        if (c.buried_until && *c.buried_until > now) {
            continue;
        }
        if (!notes.insert(c.summary.note_id).second) {
            ++suppressed;
            spdlog::debug("Sibling of note {} suppressed: card {}", c.summary.note_id, c.summary.card_id);
            continue;
        }
        out.push_back(c.summary);
    }
    return out;
}
