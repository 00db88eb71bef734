#include <gtest/gtest.h>
#include <memory>
#include <sodium.h>
#include "TestSupport.hpp"
#include "core/Errors.hpp"
#include "core/Scheduler.hpp"
#include "storage/CardStore.hpp"

using namespace testing_support;

namespace {

class SchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_GE(sodium_init(), 0);
        rebuild(testConfig());
    }

    void rebuild(const AppConfig& cfg) {
        scheduler = std::make_unique<Scheduler>(store, cfg, std::make_unique<FixedJitter>());
        if (deckId.empty()) {
            deckId = scheduler->createDeck("Japanese", prefs(10, 100));
        }
    }

    std::string frontCard(const std::string& noteId) {
        for (const auto& c : scheduler->cardsForNote(noteId)) {
            if (c.template_tag == kFrontToBack) return c.id;
        }
        return std::string();
    }

    CardStore store{ ":memory:" };
    std::unique_ptr<Scheduler> scheduler;
    std::string deckId;
};

} // namespace

/* -------------------------
   Decks and notes
   ------------------------- */

TEST_F(SchedulerTest, DeckNamesAreUnique) {
    try {
        scheduler->createDeck("Japanese");
        FAIL() << "expected ConflictError";
    }
    catch (const ConflictError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DuplicateDeck);
    }
    EXPECT_THROW(scheduler->createDeck(""), ValidationError);
}

TEST_F(SchedulerTest, InvalidDeckPreferencesAreRejected) {
    DeckPrefs bad = prefs(10, 100, {});
    try {
        scheduler->createDeck("Korean", bad);
        FAIL() << "expected ValidationError";
    }
    catch (const ValidationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidDeckConfig);
    }
    EXPECT_THROW(scheduler->updateDeckPrefs(deckId, prefs(-1, 100)), ValidationError);
    EXPECT_EQ(scheduler->listDecks().size(), 1u);
}

TEST_F(SchedulerTest, NewDecksUseConfiguredDefaults) {
    AppConfig cfg = testConfig();
    cfg.default_deck_prefs = prefs(4, 40, { 1, 5 });
    rebuild(cfg);

    Deck d = scheduler->deck(scheduler->createDeck("Korean"));
    EXPECT_EQ(d.prefs.new_per_day, 4);
    EXPECT_EQ(d.prefs.steps_min, (std::vector<int>{ 1, 5 }));
}

TEST_F(SchedulerTest, AddNoteCreatesNewCardDueAtCreation) {
    std::string noteId = scheduler->addNote(deckId, "inu", "dog", nullptr, false, kNow);
    auto cards = scheduler->cardsForNote(noteId);
    ASSERT_EQ(cards.size(), 1u);
    EXPECT_EQ(cards[0].state, CardState::New);
    EXPECT_EQ(cards[0].template_tag, kFrontToBack);
    EXPECT_EQ(cards[0].due, kNow);
    EXPECT_DOUBLE_EQ(cards[0].ease_factor, Card::kDefaultEase);
    EXPECT_EQ(scheduler->note(noteId).created_at, kNow);
}

TEST_F(SchedulerTest, DuplicateNotesReportTheExistingNote) {
    std::string first = scheduler->addNote(deckId, "inu", "dog", nullptr, false, kNow);
    try {
        scheduler->addNote(deckId, "inu", "dog", nullptr, false, kNow + 1);
        FAIL() << "expected DuplicateNoteError";
    }
    catch (const DuplicateNoteError& e) {
        EXPECT_EQ(e.existingNoteId(), first);
        EXPECT_EQ(e.kind(), ErrorKind::DuplicateNote);
    }

    std::string forced = scheduler->addNote(deckId, "inu", "dog", nullptr, true, kNow + 2);
    EXPECT_NE(forced, first);

    std::string other = scheduler->createDeck("Korean");
    EXPECT_NO_THROW(scheduler->addNote(other, "inu", "dog"));
    EXPECT_NO_THROW(scheduler->addNote(deckId, "inu", "hound"));
}

TEST_F(SchedulerTest, AddNoteValidatesInput) {
    EXPECT_THROW(scheduler->addNote("missing", "inu", "dog"), NotFoundError);
    EXPECT_THROW(scheduler->addNote(deckId, "", "dog"), ValidationError);
    EXPECT_THROW(scheduler->addNote(deckId, "inu", ""), ValidationError);
    EXPECT_THROW(scheduler->addNote(deckId, "inu", "dog", nlohmann::json::array({ 1, 2 })), ValidationError);
}

TEST_F(SchedulerTest, MetadataIsKeptOnTheNote) {
    nlohmann::json meta = { { "tags", { "animals", "n5" } }, { "reading", "いぬ" } };
    std::string noteId = scheduler->addNote(deckId, "犬", "dog", meta);

    Note n = scheduler->note(noteId);
    EXPECT_EQ(n.tags(), (std::vector<std::string>{ "animals", "n5" }));
    EXPECT_EQ(n.meta["reading"], "いぬ");
}

TEST_F(SchedulerTest, BidirectionalDeckCreatesReverseCards) {
    DeckPrefs p = prefs(10, 100);
    p.bidirectional = true;
    std::string both = scheduler->createDeck("Both ways", p);

    std::string noteId = scheduler->addNote(both, "neko", "cat");
    auto cards = scheduler->cardsForNote(noteId);
    ASSERT_EQ(cards.size(), 2u);
    EXPECT_EQ(cards[0].template_tag, kFrontToBack);
    EXPECT_EQ(cards[1].template_tag, kBackToFront);
}

TEST_F(SchedulerTest, EnablingBidirectionalBackfillsReverseCards) {
    std::string a = scheduler->addNote(deckId, "neko", "cat");
    std::string b = scheduler->addNote(deckId, "inu", "dog");
    std::string existing = scheduler->addReverseCard(b);

    DeckPrefs p = scheduler->deck(deckId).prefs;
    p.bidirectional = true;
    scheduler->updateDeckPrefs(deckId, p);

    EXPECT_EQ(scheduler->cardsForNote(a).size(), 2u);
    auto bCards = scheduler->cardsForNote(b);
    ASSERT_EQ(bCards.size(), 2u);
    EXPECT_EQ(bCards[1].id, existing);
}

TEST_F(SchedulerTest, AddReverseCardIsIdempotent) {
    std::string noteId = scheduler->addNote(deckId, "neko", "cat");
    std::string first = scheduler->addReverseCard(noteId);
    std::string second = scheduler->addReverseCard(noteId);
    EXPECT_EQ(first, second);
    EXPECT_EQ(scheduler->cardsForNote(noteId).size(), 2u);
    EXPECT_THROW(scheduler->addReverseCard("missing"), NotFoundError);
}

TEST_F(SchedulerTest, DeletingNoteRemovesItsCards) {
    std::string noteId = scheduler->addNote(deckId, "neko", "cat", nullptr, false, kNow);
    std::string cardId = frontCard(noteId);
    scheduler->review(cardId, 2, 1000, kNow);

    scheduler->deleteNote(noteId);
    EXPECT_THROW(scheduler->card(cardId), NotFoundError);
    EXPECT_THROW(scheduler->note(noteId), NotFoundError);
    EXPECT_TRUE(store.reviewsForCard(cardId).empty());
    EXPECT_THROW(scheduler->deleteNote(noteId), NotFoundError);
}

TEST_F(SchedulerTest, DeletingDeckRemovesItsNotes) {
    std::string noteId = scheduler->addNote(deckId, "neko", "cat");
    scheduler->deleteDeck(deckId);
    EXPECT_THROW(scheduler->note(noteId), NotFoundError);
    EXPECT_THROW(scheduler->deck(deckId), NotFoundError);
    EXPECT_THROW(scheduler->deleteDeck(deckId), NotFoundError);
}

/* -------------------------
   Reviews
   ------------------------- */

TEST_F(SchedulerTest, WorkedExampleThroughTheEngine) {
    std::string cardId = frontCard(scheduler->addNote(deckId, "mizu", "water", nullptr, false, kNow));

    Card c = scheduler->review(cardId, 2, 1200, kNow);
    EXPECT_EQ(c.state, CardState::Learning);
    EXPECT_EQ(c.due, kNow + 1440 * kMinute);

    std::time_t t2 = kNow + kDay;
    c = scheduler->review(cardId, 2, 900, t2);
    EXPECT_EQ(c.state, CardState::Review);
    EXPECT_DOUBLE_EQ(c.interval_days, 6.0);
    EXPECT_EQ(c.due, t2 + 6 * kDay);

    std::time_t t3 = t2 + 6 * kDay;
    c = scheduler->review(cardId, 0, 3000, t3);
    EXPECT_EQ(c.state, CardState::Relearning);
    EXPECT_NEAR(c.ease_factor, 1.7, 1e-9);
    EXPECT_EQ(c.lapses, 1);
    EXPECT_EQ(c.due, t3 + 10 * kMinute);

    // The stored card matches what review returned.
    Card stored = scheduler->card(cardId);
    EXPECT_EQ(stored.state, c.state);
    EXPECT_EQ(stored.due, c.due);
    EXPECT_EQ(stored.last_review, std::optional<std::time_t>(t3));
}

TEST_F(SchedulerTest, EveryReviewIsLedgered) {
    std::string cardId = frontCard(scheduler->addNote(deckId, "mizu", "water", nullptr, false, kNow));
    scheduler->review(cardId, 2, 1200, kNow);
    scheduler->review(cardId, 2, 900, kNow + kDay);

    auto log = scheduler->history(cardId);
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0].card_id, cardId);
    EXPECT_EQ(log[0].timestamp, kNow);
    EXPECT_EQ(log[0].rating, Rating::GotIt);
    EXPECT_EQ(log[0].answer_ms, 1200);
    EXPECT_EQ(log[0].prior_state, CardState::New);
    EXPECT_DOUBLE_EQ(log[0].prior_interval, 0.0);

    EXPECT_EQ(log[1].prior_state, CardState::Learning);
    EXPECT_DOUBLE_EQ(log[1].resulting_interval, 6.0);
    EXPECT_THROW(scheduler->history("missing"), NotFoundError);
}

TEST_F(SchedulerTest, InvalidRatingChangesNothing) {
    std::string cardId = frontCard(scheduler->addNote(deckId, "mizu", "water", nullptr, false, kNow));

    for (int bad : { 3, -1 }) {
        try {
            scheduler->review(cardId, bad, 1000, kNow);
            FAIL() << "expected ValidationError for rating " << bad;
        }
        catch (const ValidationError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidRating);
        }
    }
    EXPECT_THROW(scheduler->review(cardId, 1, -5, kNow), ValidationError);

    EXPECT_EQ(scheduler->card(cardId).state, CardState::New);
    EXPECT_TRUE(scheduler->history(cardId).empty());
    EXPECT_EQ(scheduler->studiedToday(deckId, kNow).new_studied, 0);
}

TEST_F(SchedulerTest, UnknownCardIsReported) {
    try {
        scheduler->review("missing", 2, 100, kNow);
        FAIL() << "expected NotFoundError";
    }
    catch (const NotFoundError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnknownCard);
    }
    EXPECT_THROW(scheduler->suspend("missing"), NotFoundError);
}

TEST_F(SchedulerTest, FailedLedgerWriteRollsBackTheReview) {
    std::string cardId = frontCard(scheduler->addNote(deckId, "mizu", "water", nullptr, false, kNow));
    store.execute("CREATE TRIGGER fail_ledger BEFORE INSERT ON review_log "
                  "BEGIN SELECT RAISE(ABORT, 'ledger offline'); END;");

    EXPECT_THROW(scheduler->review(cardId, 2, 1000, kNow), StorageError);

    Card c = scheduler->card(cardId);
    EXPECT_EQ(c.state, CardState::New);
    EXPECT_EQ(c.due, kNow);
    EXPECT_FALSE(c.last_review.has_value());
    EXPECT_EQ(scheduler->studiedToday(deckId, kNow).new_studied, 0);

    store.execute("DROP TRIGGER fail_ledger;");
    EXPECT_NO_THROW(scheduler->review(cardId, 2, 1000, kNow));
    EXPECT_EQ(scheduler->history(cardId).size(), 1u);
}

TEST_F(SchedulerTest, DailyCountersFollowPriorState) {
    std::string a = frontCard(scheduler->addNote(deckId, "ichi", "one", nullptr, false, kNow));
    std::string b = frontCard(scheduler->addNote(deckId, "ni", "two", nullptr, false, kNow));

    scheduler->review(a, 0, 100, kNow);              // New -> Learning
    scheduler->review(a, 2, 100, kNow + 1);          // Learning, not counted
    Card graduated = scheduler->review(a, 2, 100, kNow + 2);
    ASSERT_EQ(graduated.state, CardState::Review);
    scheduler->review(b, 1, 100, kNow + 3);          // New -> Learning

    DailyCounts today = scheduler->studiedToday(deckId, kNow + 4);
    EXPECT_EQ(today.new_studied, 2);
    EXPECT_EQ(today.rev_studied, 0);

    scheduler->review(a, 2, 100, graduated.due);
    DailyCounts later = scheduler->studiedToday(deckId, graduated.due);
    EXPECT_EQ(later.rev_studied, 1);
    EXPECT_EQ(later.new_studied, 0);
}

/* -------------------------
   Suspend, bury, leeches
   ------------------------- */

TEST_F(SchedulerTest, SuspendRoundTripsThePriorState) {
    std::string cardId = frontCard(scheduler->addNote(deckId, "mizu", "water", nullptr, false, kNow));
    scheduler->review(cardId, 0, 100, kNow);

    scheduler->suspend(cardId);
    EXPECT_EQ(scheduler->card(cardId).state, CardState::Suspended);
    EXPECT_TRUE(scheduler->buildSession({ deckId }, kNow + kDay).empty());

    try {
        scheduler->review(cardId, 2, 100, kNow + kDay);
        FAIL() << "expected ValidationError";
    }
    catch (const ValidationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CardSuspended);
    }

    // Repeating either call is harmless.
    scheduler->suspend(cardId);
    scheduler->unsuspend(cardId);
    scheduler->unsuspend(cardId);

    Card back = scheduler->card(cardId);
    EXPECT_EQ(back.state, CardState::Learning);
    EXPECT_FALSE(back.suspended_from.has_value());
    EXPECT_EQ(scheduler->buildSession({ deckId }, kNow + kDay).size(), 1u);
}

TEST_F(SchedulerTest, BuryHidesCardUntilGivenTime) {
    std::string cardId = frontCard(scheduler->addNote(deckId, "mizu", "water", nullptr, false, kNow));
    scheduler->bury(cardId, kNow + kDay);

    EXPECT_TRUE(scheduler->buildSession({ deckId }, kNow).empty());
    EXPECT_EQ(scheduler->statsToday({ deckId }, kNow).total, 0);

    scheduler->unbury(cardId);
    EXPECT_EQ(scheduler->buildSession({ deckId }, kNow).size(), 1u);
}

TEST_F(SchedulerTest, LeechHookFiresAtThreshold) {
    AppConfig cfg = testConfig();
    cfg.leech_threshold = 2;
    rebuild(cfg);

    std::vector<LeechNotice> notices;
    scheduler->setLeechHook([&](const LeechNotice& n) { notices.push_back(n); });

    std::string noteId = scheduler->addNote(deckId, "mizu", "water", nullptr, false, kNow);
    std::string cardId = frontCard(noteId);
    std::time_t t = kNow;
    scheduler->review(cardId, 2, 100, t);
    Card c = scheduler->review(cardId, 2, 100, t += kMinute);
    ASSERT_EQ(c.state, CardState::Review);

    c = scheduler->review(cardId, 0, 100, c.due);       // lapse 1
    EXPECT_TRUE(notices.empty());
    c = scheduler->review(cardId, 2, 100, c.due);       // relearning step 1
    c = scheduler->review(cardId, 2, 100, c.due);       // back to review
    ASSERT_EQ(c.state, CardState::Review);
    c = scheduler->review(cardId, 0, 100, c.due);       // lapse 2

    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].card_id, cardId);
    EXPECT_EQ(notices[0].note_id, noteId);
    EXPECT_EQ(notices[0].lapses, 2);
    // Flagged only; the card keeps its schedule.
    EXPECT_EQ(scheduler->card(cardId).state, CardState::Relearning);
}

TEST_F(SchedulerTest, StatsCountDueCardsPerState) {
    std::string a = frontCard(scheduler->addNote(deckId, "ichi", "one", nullptr, false, kNow));
    std::string b = frontCard(scheduler->addNote(deckId, "ni", "two", nullptr, false, kNow));
    frontCard(scheduler->addNote(deckId, "san", "three", nullptr, false, kNow));
    scheduler->review(a, 0, 100, kNow);
    scheduler->suspend(b);

    DueStats now = scheduler->statsToday({ deckId }, kNow);
    EXPECT_EQ(now.new_cards, 1);
    EXPECT_EQ(now.learning, 0);
    EXPECT_EQ(now.total, 1);

    DueStats later = scheduler->statsToday({ deckId, deckId }, kNow + 11 * kMinute);
    EXPECT_EQ(later.new_cards, 1);
    EXPECT_EQ(later.learning, 1);
    EXPECT_EQ(later.total, 2);

    EXPECT_EQ(scheduler->statsToday({}, kNow).total, 0);
    EXPECT_THROW(scheduler->statsToday({ "missing" }, kNow), NotFoundError);
}

TEST_F(SchedulerTest, RebuiltSessionShowsCardsThatCameDueAgain) {
    std::string cardId = frontCard(scheduler->addNote(deckId, "mizu", "water", nullptr, false, kNow));

    auto first = scheduler->buildSession({ deckId }, kNow);
    ASSERT_EQ(first.size(), 1u);
    scheduler->review(first[0].card_id, 0, 100, kNow);

    EXPECT_TRUE(scheduler->buildSession({ deckId }, kNow + kMinute).empty());
    auto again = scheduler->buildSession({ deckId }, kNow + 10 * kMinute);
    ASSERT_EQ(again.size(), 1u);
    EXPECT_EQ(again[0].card_id, cardId);
    EXPECT_EQ(again[0].state, CardState::Learning);
}
