#pragma once
#include <cstdint>
#include <ctime>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Card.hpp"
#include "CardStateMachine.hpp"
#include "Deck.hpp"
#include "IntervalCalculator.hpp"
#include "Note.hpp"
#include "ReviewLedger.hpp"
#include "SessionBuilder.hpp"
#include "StudyDay.hpp"
#include "../utils/Config.hpp"

class CardStore;

struct LeechNotice {
    std::string card_id;
    std::string note_id;
    int lapses = 0;
};

using LeechHook = std::function<void(const LeechNotice&)>;

// Due (not limited) card counts for a set of decks.
struct DueStats {
    int new_cards = 0;
    int learning = 0;   // learning + relearning
    int review = 0;
    int total = 0;
};

/*
  Engine facade. Owns the scheduling components and drives them against a
  CardStore:
    - decks and notes (add_note is the only ingestion point)
    - build_session: ordered snapshot of what to study now
    - review: state machine + card row + ledger row + daily counters, all in
      one transaction
    - suspend/unsuspend, manual bury
  Every `now` parameter defaults to the wall clock.
*/
class Scheduler {
public:
    Scheduler(CardStore& store, const AppConfig& config);
    Scheduler(CardStore& store, const AppConfig& config, std::unique_ptr<JitterSource> jitter);

    // DECKS
    std::string createDeck(const std::string& name, const std::optional<DeckPrefs>& prefs = std::nullopt,
        bool builtin = false);
    Deck deck(const std::string& deckId);
    std::vector<Deck> listDecks();
    // Enabling bidirectional cards backfills missing reverse cards.
    void updateDeckPrefs(const std::string& deckId, const DeckPrefs& prefs);
    void deleteDeck(const std::string& deckId);

    // NOTES
    // Throws DuplicateNoteError when (deck, front, back) already exists and
    // allowDuplicate is false.
    std::string addNote(const std::string& deckId, const std::string& front, const std::string& back,
        const nlohmann::json& meta = nullptr, bool allowDuplicate = false,
        std::optional<std::time_t> now = std::nullopt);
    // Creates the back->front card if the note lacks one; returns its id.
    std::string addReverseCard(const std::string& noteId, std::optional<std::time_t> now = std::nullopt);
    Note note(const std::string& noteId);
    std::vector<Card> cardsForNote(const std::string& noteId);
    void deleteNote(const std::string& noteId);

    // SESSIONS
    std::vector<CardSummary> buildSession(const std::vector<std::string>& deckIds,
        std::optional<std::time_t> now = std::nullopt,
        std::optional<int> maxNew = std::nullopt,
        std::optional<int> maxReview = std::nullopt);

    // Rating must be 0 (missed), 1 (almost) or 2 (got it). The leech hook,
    // if any, runs after the review has committed.
    Card review(const std::string& cardId, int rating, std::int64_t answerMs,
        std::optional<std::time_t> now = std::nullopt);

    void suspend(const std::string& cardId);
    void unsuspend(const std::string& cardId);
    // Manual bury: the card is left out of sessions until `until`.
    void bury(const std::string& cardId, std::time_t until);
    void unbury(const std::string& cardId);

    Card card(const std::string& cardId);
    std::vector<ReviewEvent> history(const std::string& cardId);

    // STATS
    DueStats statsToday(const std::vector<std::string>& deckIds, std::optional<std::time_t> now = std::nullopt);
    DailyCounts studiedToday(const std::string& deckId, std::optional<std::time_t> now = std::nullopt);

    void setLeechHook(LeechHook hook) { leech_hook = std::move(hook); }

    const AppConfig& config() const { return cfg; }

private:
    CardStore& store;
    AppConfig cfg;
    StudyDay study_day;
    EaseIntervalCalculator calculator;
    CardStateMachine machine;
    ReviewLedger ledger;
    std::unique_ptr<JitterSource> jitter;
    SessionBuilder builder;
    LeechHook leech_hook;

    static JitterSource& requireJitter(const std::unique_ptr<JitterSource>& j);
    Deck requireDeck(const std::string& deckId);
    Card requireCard(const std::string& cardId);
    Card newCard(const std::string& noteId, const std::string& templateTag, std::time_t createdAt) const;

    static std::time_t resolve(std::optional<std::time_t> now) { return now ? *now : std::time(nullptr); }
};
