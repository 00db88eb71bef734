#include "Scheduler.hpp"
#include "Errors.hpp"
#include "../storage/CardStore.hpp"
#include <algorithm>
#include <sodium.h>
#include <stdexcept>
#include <spdlog/spdlog.h>

Scheduler::Scheduler(CardStore& s, const AppConfig& config)
    : Scheduler(s, config, std::make_unique<SodiumJitter>())
{
}

Scheduler::Scheduler(CardStore& s, const AppConfig& config, std::unique_ptr<JitterSource> j)
    : store(s),
    cfg(config),
    study_day(config.rollover_hour),
    calculator(config.intervalOptions()),
    machine(calculator, config.stateMachineOptions()),
    ledger(s),
    jitter(std::move(j)),
    builder(s, study_day, requireJitter(jitter), config.jitter_max_seconds)
{
    if (sodium_init() < 0) {
        spdlog::error("libsodium initialization failed");
        throw std::runtime_error("Failed to initialize libsodium");
    }
    cfg.validate();

    spdlog::info("Scheduler initialized (graduation={}, hard={}, leech_threshold={}, rollover={}h)",
        graduationPolicyName(cfg.graduation_policy), hardIntervalPolicyName(cfg.hard_interval_policy),
        cfg.leech_threshold, cfg.rollover_hour);
}

JitterSource& Scheduler::requireJitter(const std::unique_ptr<JitterSource>& j) {
    if (!j) {
        throw ValidationError(ErrorKind::InvalidArgument, "Scheduler needs a jitter source");
    }
    return *j;
}

Deck Scheduler::requireDeck(const std::string& deckId) {
    auto d = store.findDeck(deckId);
    if (!d) {
        throw NotFoundError(ErrorKind::UnknownDeck, "Unknown deck " + deckId);
    }
    return *d;
}

Card Scheduler::requireCard(const std::string& cardId) {
    auto c = store.findCard(cardId);
    if (!c) {
        throw NotFoundError(ErrorKind::UnknownCard, "Unknown card " + cardId);
    }
    return *c;
}

Card Scheduler::newCard(const std::string& noteId, const std::string& templateTag, std::time_t createdAt) const {
    Card c;
    c.id = Card::generateID();
    c.note_id = noteId;
    c.template_tag = templateTag;
    c.state = CardState::New;
    c.due = createdAt;
    c.ease_factor = Card::kDefaultEase;
    return c;
}

/* -------------------------
   Decks
   ------------------------- */

std::string Scheduler::createDeck(const std::string& name, const std::optional<DeckPrefs>& prefs, bool builtin) {
    if (name.empty()) {
        throw ValidationError(ErrorKind::InvalidArgument, "Deck name must not be empty");
    }

    Deck d;
    d.id = Card::generateID();
    d.name = name;
    d.is_builtin = builtin;
    d.prefs = prefs.value_or(cfg.default_deck_prefs);
    d.prefs.validate();

    CardStore::Transaction tx(store);
    if (store.findDeckByName(name)) {
        throw ConflictError(ErrorKind::DuplicateDeck, "A deck named '" + name + "' already exists");
    }
    store.insertDeck(d);
    tx.commit();

    spdlog::info("Created deck '{}' ({})", d.name, d.id);
    return d.id;
}

Deck Scheduler::deck(const std::string& deckId) {
    return requireDeck(deckId);
}

std::vector<Deck> Scheduler::listDecks() {
    return store.listDecks();
}

void Scheduler::updateDeckPrefs(const std::string& deckId, const DeckPrefs& prefs) {
    prefs.validate();

    CardStore::Transaction tx(store);
    Deck d = requireDeck(deckId);
    store.updateDeckPrefs(deckId, prefs);

    int added = 0;
    if (prefs.bidirectional && !d.prefs.bidirectional) {
        std::time_t now = std::time(nullptr);
        for (const auto& n : store.notesInDeck(deckId)) {
            if (!store.findCard(n.id, kBackToFront)) {
                store.insertCard(newCard(n.id, kBackToFront, now));
                ++added;
            }
        }
    }
    tx.commit();

    spdlog::info("Updated preferences of deck '{}' (new/day={}, rev/day={}, steps={}, reverse cards added={})",
        d.name, prefs.new_per_day, prefs.rev_per_day, prefs.steps_min.size(), added);
}

void Scheduler::deleteDeck(const std::string& deckId) {
    if (!store.deleteDeck(deckId)) {
        throw NotFoundError(ErrorKind::UnknownDeck, "Unknown deck " + deckId);
    }
    spdlog::info("Deleted deck {}", deckId);
}

/* -------------------------
   Notes
   ------------------------- */

std::string Scheduler::addNote(const std::string& deckId, const std::string& front, const std::string& back,
    const nlohmann::json& meta, bool allowDuplicate, std::optional<std::time_t> now)
{
    if (front.empty() || back.empty()) {
        throw ValidationError(ErrorKind::InvalidArgument, "Note front and back must not be empty");
    }
    if (!meta.is_null() && !meta.is_object()) {
        throw ValidationError(ErrorKind::InvalidArgument, "Note metadata must be a JSON object");
    }

    CardStore::Transaction tx(store);
    Deck d = requireDeck(deckId);

    if (!allowDuplicate) {
        if (auto existing = store.findDuplicateNote(deckId, front, back)) {
            spdlog::info("Duplicate note rejected in deck '{}': '{}' (existing {})", d.name, front, *existing);
            throw DuplicateNoteError(*existing, "Note '" + front + "' already exists in deck '" + d.name + "'");
        }
    }

    Note n(deckId, front, back);
    n.meta = meta;
    n.created_at = resolve(now);
    store.insertNote(n);

    store.insertCard(newCard(n.id, kFrontToBack, n.created_at));
    if (d.prefs.bidirectional) {
        store.insertCard(newCard(n.id, kBackToFront, n.created_at));
    }
    tx.commit();

    spdlog::info("Added note {} to deck '{}'{}", n.id, d.name, d.prefs.bidirectional ? " (with reverse card)" : "");
    return n.id;
}

std::string Scheduler::addReverseCard(const std::string& noteId, std::optional<std::time_t> now) {
    CardStore::Transaction tx(store);
    if (!store.findNote(noteId)) {
        throw NotFoundError(ErrorKind::UnknownNote, "Unknown note " + noteId);
    }
    if (auto existing = store.findCard(noteId, kBackToFront)) {
        tx.commit();
        return existing->id;
    }

    Card c = newCard(noteId, kBackToFront, resolve(now));
    store.insertCard(c);
    tx.commit();

    spdlog::info("Added reverse card {} for note {}", c.id, noteId);
    return c.id;
}

Note Scheduler::note(const std::string& noteId) {
    auto n = store.findNote(noteId);
    if (!n) {
        throw NotFoundError(ErrorKind::UnknownNote, "Unknown note " + noteId);
    }
    return *n;
}

std::vector<Card> Scheduler::cardsForNote(const std::string& noteId) {
    note(noteId);
    return store.cardsForNote(noteId);
}

void Scheduler::deleteNote(const std::string& noteId) {
    if (!store.deleteNote(noteId)) {
        throw NotFoundError(ErrorKind::UnknownNote, "Unknown note " + noteId);
    }
    spdlog::info("Deleted note {}", noteId);
}

/* -------------------------
   Sessions and reviews
   ------------------------- */

std::vector<CardSummary> Scheduler::buildSession(const std::vector<std::string>& deckIds,
    std::optional<std::time_t> now, std::optional<int> maxNew, std::optional<int> maxReview)
{
    SessionRequest req;
    req.deck_ids = deckIds;
    req.now = resolve(now);
    req.max_new = maxNew;
    req.max_review = maxReview;
    return builder.build(req);
}

Card Scheduler::review(const std::string& cardId, int rating, std::int64_t answerMs, std::optional<std::time_t> now) {
    // Validate before touching the store.
    Rating r = ratingFromInt(rating);
    if (answerMs < 0) {
        throw ValidationError(ErrorKind::InvalidArgument, "answer duration must be >= 0 ms");
    }
    std::time_t ts = resolve(now);

    CardStore::Transaction tx(store);
    Card prior = requireCard(cardId);
    auto deckId = store.deckIdForCard(cardId);
    if (!deckId) {
        throw StorageError("Card " + cardId + " has no owning note");
    }
    Deck d = requireDeck(*deckId);

    Transition t = machine.answer(prior, r, d.prefs, ts);
    store.updateCard(t.card);
    ledger.record(cardId, r, answerMs, prior, t.card, ts);

    int newCount = prior.state == CardState::New ? 1 : 0;
    int revCount = prior.state == CardState::Review ? 1 : 0;
    if (newCount || revCount) {
        store.bumpDailyCounts(d.id, study_day.dateFor(ts), newCount, revCount);
    }
    tx.commit();

    spdlog::info("Reviewed card {} rating={} {} -> {} ivl={:.2f}d ease={:.2f}",
        cardId, rating, cardStateName(prior.state), cardStateName(t.card.state), t.card.interval_days,
        t.card.ease_factor);

    if (t.leech) {
        spdlog::warn("Card {} is a leech: lapses={} (threshold {})", cardId, t.card.lapses, cfg.leech_threshold);
        if (leech_hook) {
            leech_hook(LeechNotice{ cardId, t.card.note_id, t.card.lapses });
        }
    }
    return t.card;
}

void Scheduler::suspend(const std::string& cardId) {
    CardStore::Transaction tx(store);
    Card c = requireCard(cardId);
    if (c.state == CardState::Suspended) {
        tx.commit();
        spdlog::debug("Card {} already suspended", cardId);
        return;
    }
    store.updateCard(CardStateMachine::suspend(c));
    tx.commit();
    spdlog::info("Suspended card {} (was {})", cardId, cardStateName(c.state));
}

void Scheduler::unsuspend(const std::string& cardId) {
    CardStore::Transaction tx(store);
    Card c = requireCard(cardId);
    if (c.state != CardState::Suspended) {
        tx.commit();
        spdlog::debug("Card {} is not suspended", cardId);
        return;
    }
    Card restored = CardStateMachine::unsuspend(c);
    store.updateCard(restored);
    tx.commit();
    spdlog::info("Unsuspended card {} (back to {})", cardId, cardStateName(restored.state));
}

void Scheduler::bury(const std::string& cardId, std::time_t until) {
    CardStore::Transaction tx(store);
    Card c = requireCard(cardId);
    c.buried_until = until;
    store.updateCard(c);
    tx.commit();
    spdlog::info("Buried card {} until {}", cardId, until);
}

void Scheduler::unbury(const std::string& cardId) {
    CardStore::Transaction tx(store);
    Card c = requireCard(cardId);
    c.buried_until.reset();
    store.updateCard(c);
    tx.commit();
    spdlog::info("Unburied card {}", cardId);
}

Card Scheduler::card(const std::string& cardId) {
    return requireCard(cardId);
}

std::vector<ReviewEvent> Scheduler::history(const std::string& cardId) {
    requireCard(cardId);
    return ledger.history(cardId);
}

/* -------------------------
   Stats
   ------------------------- */

DueStats Scheduler::statsToday(const std::vector<std::string>& deckIds, std::optional<std::time_t> now) {
    DueStats stats;
    if (deckIds.empty()) return stats;

    std::vector<std::string> unique;
    for (const auto& id : deckIds) {
        requireDeck(id);
        if (std::find(unique.begin(), unique.end(), id) == unique.end()) unique.push_back(id);
    }

    auto counts = store.dueCounts(unique, resolve(now));
    stats.new_cards = counts[CardState::New];
    stats.learning = counts[CardState::Learning] + counts[CardState::Relearning];
    stats.review = counts[CardState::Review];
    stats.total = stats.new_cards + stats.learning + stats.review;
    return stats;
}

DailyCounts Scheduler::studiedToday(const std::string& deckId, std::optional<std::time_t> now) {
    requireDeck(deckId);
    return store.dailyCounts(deckId, study_day.dateFor(resolve(now)));
}
