#pragma once
#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "../core/Card.hpp"
#include "../core/Deck.hpp"
#include "../core/Note.hpp"
#include "../core/ReviewEvent.hpp"
#include "../core/SiblingFilter.hpp"

struct sqlite3;

// CardStore owns the SQLite collection: decks, notes, cards, the review log
// and per-day counters.
//
// Every failure throws StorageError (after logging it). Writes that must
// commit together run inside a Transaction; without one each statement
// commits on its own.
//
// Schema (foreign keys on, WAL for file databases):
//   decks(id, name UNIQUE, is_builtin, prefs JSON)
//   notes(id, deck_id -> decks, front, back, meta JSON, created_at, checksum)
//   cards(id, note_id -> notes, template, state, due_ts, interval_days, ease,
//         lapses, step_index, last_review_ts, graduated, suspended_from,
//         buried_until, UNIQUE(note_id, template))
//   review_log(id, card_id -> cards, ts, rating, answer_ms, prev_state,
//              prev_interval, next_interval)
//   daily_stats(deck_id -> decks, study_date, new_studied, rev_studied)

class CardStore {
public:
    // ":memory:" opens a private in-memory collection.
    explicit CardStore(const std::string& path);
    ~CardStore();

    CardStore(const CardStore&) = delete;
    CardStore& operator=(const CardStore&) = delete;

    // RAII transaction: rolled back on destruction unless commit() ran.
    // Opening one while another is active joins the outer transaction.
    class Transaction {
    public:
        explicit Transaction(CardStore& store);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        CardStore& store;
        bool owner = false;
        bool done = false;
    };

    // DECKS
    void insertDeck(const Deck& deck);
    std::optional<Deck> findDeck(const std::string& deckId);
    std::optional<Deck> findDeckByName(const std::string& name);
    std::vector<Deck> listDecks();                 // built-ins first, then by name
    void updateDeckPrefs(const std::string& deckId, const DeckPrefs& prefs);
    bool deleteDeck(const std::string& deckId);

    // NOTES
    void insertNote(const Note& note);
    std::optional<Note> findNote(const std::string& noteId);
    std::optional<std::string> findDuplicateNote(const std::string& deckId, const std::string& front,
        const std::string& back);
    std::vector<Note> notesInDeck(const std::string& deckId);
    bool deleteNote(const std::string& noteId);

    // CARDS
    void insertCard(const Card& card);
    std::optional<Card> findCard(const std::string& cardId);
    std::optional<Card> findCard(const std::string& noteId, const std::string& templateTag);
    std::vector<Card> cardsForNote(const std::string& noteId);
    void updateCard(const Card& card);
    std::optional<std::string> deckIdForCard(const std::string& cardId);

    // SESSION CANDIDATES (suspended cards never appear)
    std::vector<SessionCandidate> learningCandidates(const std::string& deckId, std::time_t now);
    std::vector<SessionCandidate> reviewCandidates(const std::string& deckId, std::time_t now);
    std::vector<SessionCandidate> newCandidates(const std::string& deckId);
    std::map<CardState, int> dueCounts(const std::vector<std::string>& deckIds, std::time_t now);

    // REVIEW LOG
    std::int64_t appendReview(const ReviewEvent& event);
    std::vector<ReviewEvent> reviewsForCard(const std::string& cardId);

    // DAILY COUNTERS
    DailyCounts dailyCounts(const std::string& deckId, const std::string& studyDate);
    void bumpDailyCounts(const std::string& deckId, const std::string& studyDate, int newDelta, int revDelta);

    // Raw SQL, for maintenance tasks.
    void execute(const std::string& sql);

private:
    std::string db_path;
    sqlite3* db = nullptr;

    void createTables();
    std::vector<SessionCandidate> candidates(const std::string& sql, const std::string& deckId,
        std::optional<std::time_t> now);
};
