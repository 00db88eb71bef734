#include "CardStore.hpp"
#include "../core/Errors.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace {

[[noreturn]] void fail(sqlite3* db, const std::string& what) {
    std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : "no database handle");
    spdlog::error("SQLite failure: {}", msg);
    throw StorageError(msg);
}

// Prepared statement bound to one query; finalized on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql)
        : db_(db)
    {
        if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt_, nullptr) != SQLITE_OK) {
            fail(db_, "prepare failed for \"" + sql + "\"");
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int idx, const std::string& value) {
        check(sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
        return *this;
    }
    Statement& bind(int idx, std::int64_t value) {
        check(sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value)));
        return *this;
    }
    Statement& bind(int idx, int value) {
        check(sqlite3_bind_int(stmt_, idx, value));
        return *this;
    }
    Statement& bind(int idx, double value) {
        check(sqlite3_bind_double(stmt_, idx, value));
        return *this;
    }
    Statement& bindNull(int idx) {
        check(sqlite3_bind_null(stmt_, idx));
        return *this;
    }
    template <typename T>
    Statement& bindOptional(int idx, const std::optional<T>& value) {
        if (value) return bind(idx, static_cast<std::int64_t>(*value));
        return bindNull(idx);
    }

    // true while rows remain
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        fail(db_, "step failed");
    }

    void run() {
        while (step()) {
        }
    }

    bool isNull(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }
    std::string text(int col) const {
        const unsigned char* p = sqlite3_column_text(stmt_, col);
        if (!p) return std::string();
        return std::string(reinterpret_cast<const char*>(p), static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
    }
    std::int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    int integer(int col) const { return sqlite3_column_int(stmt_, col); }
    double real(int col) const { return sqlite3_column_double(stmt_, col); }
    std::optional<std::time_t> optionalTime(int col) const {
        if (isNull(col)) return std::nullopt;
        return static_cast<std::time_t>(int64(col));
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;

    void check(int rc) {
        if (rc != SQLITE_OK) fail(db_, "bind failed");
    }
};

const char* kCardColumns =
    "c.id, c.note_id, c.template, c.state, c.due_ts, c.interval_days, c.ease, c.lapses, "
    "c.step_index, c.last_review_ts, c.graduated, c.suspended_from, c.buried_until";

Card readCard(const Statement& st) {
    Card c;
    c.id = st.text(0);
    c.note_id = st.text(1);
    c.template_tag = st.text(2);
    c.state = parseCardState(st.text(3));
    c.due = static_cast<std::time_t>(st.int64(4));
    c.interval_days = st.real(5);
    c.ease_factor = st.real(6);
    c.lapses = st.integer(7);
    c.step_index = st.integer(8);
    c.last_review = st.optionalTime(9);
    c.graduated_before = st.integer(10) != 0;
    if (!st.isNull(11)) c.suspended_from = parseCardState(st.text(11));
    c.buried_until = st.optionalTime(12);
    return c;
}

Deck readDeck(const Statement& st) {
    Deck d;
    d.id = st.text(0);
    d.name = st.text(1);
    d.is_builtin = st.integer(2) != 0;
    nlohmann::json prefs = nlohmann::json::parse(st.text(3), nullptr, false);
    if (prefs.is_discarded()) {
        throw StorageError("Deck " + d.id + " has unreadable preferences");
    }
    d.prefs = deckPrefsFromJson(prefs);
    return d;
}

Note readNote(const Statement& st) {
    Note n;
    n.id = st.text(0);
    n.deck_id = st.text(1);
    n.front = st.text(2);
    n.back = st.text(3);
    if (!st.isNull(4)) {
        n.meta = nlohmann::json::parse(st.text(4), nullptr, false);
        if (n.meta.is_discarded()) n.meta = nullptr;
    }
    n.created_at = static_cast<std::time_t>(st.int64(5));
    return n;
}

} // namespace

CardStore::CardStore(const std::string& path)
    : db_path(path)
{
    if (sqlite3_open(db_path.c_str(), &db) != SQLITE_OK) {
        std::string msg = "Can't open database '" + db_path + "'";
        spdlog::error("{}: {}", msg, db ? sqlite3_errmsg(db) : "out of memory");
        sqlite3_close(db);
        db = nullptr;
        throw StorageError(msg);
    }

    try {
        execute("PRAGMA foreign_keys = ON");
        if (db_path != ":memory:") {
            execute("PRAGMA journal_mode = WAL");
        }
        createTables();
    }
    catch (const StorageError&) {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }

    spdlog::info("CardStore opened '{}'", db_path);
}

CardStore::~CardStore() {
    sqlite3_close(db);
}

void CardStore::execute(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        spdlog::error("SQLite exec failed: {}", msg);
        throw StorageError(msg);
    }
}

void CardStore::createTables() {
    execute(R"SQL(
        CREATE TABLE IF NOT EXISTS decks (
            id TEXT PRIMARY KEY,
            name TEXT UNIQUE NOT NULL,
            is_builtin INTEGER NOT NULL DEFAULT 0,
            prefs TEXT NOT NULL
        );

        CREATE TABLE IF NOT EXISTS notes (
            id TEXT PRIMARY KEY,
            deck_id TEXT NOT NULL,
            front TEXT NOT NULL,
            back TEXT NOT NULL,
            meta TEXT,
            created_at INTEGER NOT NULL,
            checksum TEXT NOT NULL,
            FOREIGN KEY(deck_id) REFERENCES decks(id) ON DELETE CASCADE
        );

        CREATE TABLE IF NOT EXISTS cards (
            id TEXT PRIMARY KEY,
            note_id TEXT NOT NULL,
            template TEXT NOT NULL,
            state TEXT NOT NULL,
            due_ts INTEGER NOT NULL,
            interval_days REAL NOT NULL DEFAULT 0,
            ease REAL NOT NULL DEFAULT 2.5,
            lapses INTEGER NOT NULL DEFAULT 0,
            step_index INTEGER NOT NULL DEFAULT 0,
            last_review_ts INTEGER,
            graduated INTEGER NOT NULL DEFAULT 0,
            suspended_from TEXT,
            buried_until INTEGER,
            UNIQUE(note_id, template),
            FOREIGN KEY(note_id) REFERENCES notes(id) ON DELETE CASCADE
        );

        CREATE TABLE IF NOT EXISTS review_log (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            card_id TEXT NOT NULL,
            ts INTEGER NOT NULL,
            rating INTEGER NOT NULL,
            answer_ms INTEGER NOT NULL,
            prev_state TEXT,
            prev_interval REAL,
            next_interval REAL,
            FOREIGN KEY(card_id) REFERENCES cards(id) ON DELETE CASCADE
        );

        CREATE TABLE IF NOT EXISTS daily_stats (
            deck_id TEXT NOT NULL,
            study_date TEXT NOT NULL,
            new_studied INTEGER NOT NULL DEFAULT 0,
            rev_studied INTEGER NOT NULL DEFAULT 0,
            PRIMARY KEY(deck_id, study_date),
            FOREIGN KEY(deck_id) REFERENCES decks(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_cards_due ON cards(state, due_ts);
        CREATE INDEX IF NOT EXISTS idx_cards_note ON cards(note_id);
        CREATE INDEX IF NOT EXISTS idx_notes_checksum ON notes(deck_id, checksum);
        CREATE INDEX IF NOT EXISTS idx_review_log_card ON review_log(card_id, ts);
    )SQL");
}

/* -------------------------
   Transactions
   ------------------------- */

CardStore::Transaction::Transaction(CardStore& s)
    : store(s)
{
    if (sqlite3_get_autocommit(store.db)) {
        store.execute("BEGIN IMMEDIATE");
        owner = true;
    }
}

CardStore::Transaction::~Transaction() {
    if (owner && !done) {
        // Best effort: the exception that got us here is what the caller sees.
        if (sqlite3_exec(store.db, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
            spdlog::error("ROLLBACK failed: {}", sqlite3_errmsg(store.db));
        }
        else {
            spdlog::warn("Transaction rolled back");
        }
    }
}

void CardStore::Transaction::commit() {
    if (owner && !done) {
        store.execute("COMMIT");
    }
    done = true;
}

/* -------------------------
   Decks
   ------------------------- */

void CardStore::insertDeck(const Deck& deck) {
    Statement st(db, "INSERT INTO decks (id, name, is_builtin, prefs) VALUES (?, ?, ?, ?)");
    st.bind(1, deck.id).bind(2, deck.name).bind(3, deck.is_builtin ? 1 : 0).bind(4, deckPrefsToJson(deck.prefs).dump());
    st.run();
}

std::optional<Deck> CardStore::findDeck(const std::string& deckId) {
    Statement st(db, "SELECT id, name, is_builtin, prefs FROM decks WHERE id = ?");
    st.bind(1, deckId);
    if (!st.step()) return std::nullopt;
    return readDeck(st);
}

std::optional<Deck> CardStore::findDeckByName(const std::string& name) {
    Statement st(db, "SELECT id, name, is_builtin, prefs FROM decks WHERE name = ?");
    st.bind(1, name);
    if (!st.step()) return std::nullopt;
    return readDeck(st);
}

std::vector<Deck> CardStore::listDecks() {
    Statement st(db, "SELECT id, name, is_builtin, prefs FROM decks ORDER BY is_builtin DESC, name");
    std::vector<Deck> out;
    while (st.step()) out.push_back(readDeck(st));
    return out;
}

void CardStore::updateDeckPrefs(const std::string& deckId, const DeckPrefs& prefs) {
    Statement st(db, "UPDATE decks SET prefs = ? WHERE id = ?");
    st.bind(1, deckPrefsToJson(prefs).dump()).bind(2, deckId);
    st.run();
}

bool CardStore::deleteDeck(const std::string& deckId) {
    Statement st(db, "DELETE FROM decks WHERE id = ?");
    st.bind(1, deckId);
    st.run();
    return sqlite3_changes(db) > 0;
}

/* -------------------------
   Notes
   ------------------------- */

void CardStore::insertNote(const Note& note) {
    Statement st(db,
        "INSERT INTO notes (id, deck_id, front, back, meta, created_at, checksum) VALUES (?, ?, ?, ?, ?, ?, ?)");
    st.bind(1, note.id).bind(2, note.deck_id).bind(3, note.front).bind(4, note.back);
    if (note.meta.is_null()) st.bindNull(5);
    else st.bind(5, note.meta.dump());
    st.bind(6, static_cast<std::int64_t>(note.created_at)).bind(7, Note::checksum(note.front, note.back));
    st.run();
}

std::optional<Note> CardStore::findNote(const std::string& noteId) {
    Statement st(db, "SELECT id, deck_id, front, back, meta, created_at FROM notes WHERE id = ?");
    st.bind(1, noteId);
    if (!st.step()) return std::nullopt;
    return readNote(st);
}

std::optional<std::string> CardStore::findDuplicateNote(const std::string& deckId, const std::string& front,
    const std::string& back)
{
    Statement st(db,
        "SELECT id FROM notes WHERE deck_id = ? AND checksum = ? AND front = ? AND back = ? LIMIT 1");
    st.bind(1, deckId).bind(2, Note::checksum(front, back)).bind(3, front).bind(4, back);
    if (!st.step()) return std::nullopt;
    return st.text(0);
}

std::vector<Note> CardStore::notesInDeck(const std::string& deckId) {
    Statement st(db,
        "SELECT id, deck_id, front, back, meta, created_at FROM notes WHERE deck_id = ? ORDER BY created_at, rowid");
    st.bind(1, deckId);
    std::vector<Note> out;
    while (st.step()) out.push_back(readNote(st));
    return out;
}

bool CardStore::deleteNote(const std::string& noteId) {
    Statement st(db, "DELETE FROM notes WHERE id = ?");
    st.bind(1, noteId);
    st.run();
    return sqlite3_changes(db) > 0;
}

/* -------------------------
   Cards
   ------------------------- */

void CardStore::insertCard(const Card& card) {
    Statement st(db,
        "INSERT INTO cards (id, note_id, template, state, due_ts, interval_days, ease, lapses, step_index, "
        "last_review_ts, graduated, suspended_from, buried_until) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    st.bind(1, card.id).bind(2, card.note_id).bind(3, card.template_tag).bind(4, std::string(cardStateName(card.state)));
    st.bind(5, static_cast<std::int64_t>(card.due)).bind(6, card.interval_days).bind(7, card.ease_factor);
    st.bind(8, card.lapses).bind(9, card.step_index).bindOptional(10, card.last_review);
    st.bind(11, card.graduated_before ? 1 : 0);
    if (card.suspended_from) st.bind(12, std::string(cardStateName(*card.suspended_from)));
    else st.bindNull(12);
    st.bindOptional(13, card.buried_until);
    st.run();
}

std::optional<Card> CardStore::findCard(const std::string& cardId) {
    Statement st(db, std::string("SELECT ") + kCardColumns + " FROM cards c WHERE c.id = ?");
    st.bind(1, cardId);
    if (!st.step()) return std::nullopt;
    return readCard(st);
}

std::optional<Card> CardStore::findCard(const std::string& noteId, const std::string& templateTag) {
    Statement st(db, std::string("SELECT ") + kCardColumns + " FROM cards c WHERE c.note_id = ? AND c.template = ?");
    st.bind(1, noteId).bind(2, templateTag);
    if (!st.step()) return std::nullopt;
    return readCard(st);
}

std::vector<Card> CardStore::cardsForNote(const std::string& noteId) {
    Statement st(db, std::string("SELECT ") + kCardColumns + " FROM cards c WHERE c.note_id = ? ORDER BY c.rowid");
    st.bind(1, noteId);
    std::vector<Card> out;
    while (st.step()) out.push_back(readCard(st));
    return out;
}

void CardStore::updateCard(const Card& card) {
    Statement st(db,
        "UPDATE cards SET state = ?, due_ts = ?, interval_days = ?, ease = ?, lapses = ?, step_index = ?, "
        "last_review_ts = ?, graduated = ?, suspended_from = ?, buried_until = ? WHERE id = ?");
    st.bind(1, std::string(cardStateName(card.state))).bind(2, static_cast<std::int64_t>(card.due));
    st.bind(3, card.interval_days).bind(4, card.ease_factor).bind(5, card.lapses).bind(6, card.step_index);
    st.bindOptional(7, card.last_review).bind(8, card.graduated_before ? 1 : 0);
    if (card.suspended_from) st.bind(9, std::string(cardStateName(*card.suspended_from)));
    else st.bindNull(9);
    st.bindOptional(10, card.buried_until).bind(11, card.id);
    st.run();

    if (sqlite3_changes(db) == 0) {
        throw StorageError("Card " + card.id + " vanished during update");
    }
}

std::optional<std::string> CardStore::deckIdForCard(const std::string& cardId) {
    Statement st(db, "SELECT n.deck_id FROM cards c JOIN notes n ON c.note_id = n.id WHERE c.id = ?");
    st.bind(1, cardId);
    if (!st.step()) return std::nullopt;
    return st.text(0);
}

/* -------------------------
   Session candidates
   ------------------------- */

std::vector<SessionCandidate> CardStore::candidates(const std::string& sql, const std::string& deckId,
    std::optional<std::time_t> now)
{
    Statement st(db, sql);
    st.bind(1, deckId);
    if (now) st.bind(2, static_cast<std::int64_t>(*now));

    std::vector<SessionCandidate> out;
    while (st.step()) {
        SessionCandidate c;
        c.summary.card_id = st.text(0);
        c.summary.note_id = st.text(1);
        c.summary.template_tag = st.text(2);
        c.summary.state = parseCardState(st.text(3));
        c.summary.due = static_cast<std::time_t>(st.int64(4));
        c.summary.front = st.text(5);
        c.summary.back = st.text(6);
        c.summary.deck_id = st.text(7);
        c.buried_until = st.optionalTime(8);
        out.push_back(std::move(c));
    }
    return out;
}

namespace {

const char* kCandidateSelect =
    "SELECT c.id, c.note_id, c.template, c.state, c.due_ts, n.front, n.back, n.deck_id, c.buried_until "
    "FROM cards c JOIN notes n ON c.note_id = n.id ";

} // namespace

std::vector<SessionCandidate> CardStore::learningCandidates(const std::string& deckId, std::time_t now) {
    return candidates(std::string(kCandidateSelect) +
        "WHERE n.deck_id = ? AND c.state IN ('learning', 'relearning') AND c.due_ts <= ? "
        "ORDER BY c.due_ts, c.rowid", deckId, now);
}

std::vector<SessionCandidate> CardStore::reviewCandidates(const std::string& deckId, std::time_t now) {
    return candidates(std::string(kCandidateSelect) +
        "WHERE n.deck_id = ? AND c.state = 'review' AND c.due_ts <= ? "
        "ORDER BY c.due_ts, c.rowid", deckId, now);
}

std::vector<SessionCandidate> CardStore::newCandidates(const std::string& deckId) {
    return candidates(std::string(kCandidateSelect) +
        "WHERE n.deck_id = ? AND c.state = 'new' "
        "ORDER BY c.due_ts, c.rowid", deckId, std::nullopt);
}

std::map<CardState, int> CardStore::dueCounts(const std::vector<std::string>& deckIds, std::time_t now) {
    std::map<CardState, int> counts;
    for (const auto& deckId : deckIds) {
        Statement st(db,
            "SELECT c.state, COUNT(*) FROM cards c JOIN notes n ON c.note_id = n.id "
            "WHERE n.deck_id = ? AND c.due_ts <= ? AND c.state != 'suspended' "
            "AND (c.buried_until IS NULL OR c.buried_until <= ?) GROUP BY c.state");
        st.bind(1, deckId).bind(2, static_cast<std::int64_t>(now)).bind(3, static_cast<std::int64_t>(now));
        while (st.step()) {
            counts[parseCardState(st.text(0))] += st.integer(1);
        }
    }
    return counts;
}

/* -------------------------
   Review log
   ------------------------- */

std::int64_t CardStore::appendReview(const ReviewEvent& e) {
    Statement st(db,
        "INSERT INTO review_log (card_id, ts, rating, answer_ms, prev_state, prev_interval, next_interval) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)");
    st.bind(1, e.card_id).bind(2, static_cast<std::int64_t>(e.timestamp)).bind(3, static_cast<int>(e.rating));
    st.bind(4, e.answer_ms).bind(5, std::string(cardStateName(e.prior_state)));
    st.bind(6, e.prior_interval).bind(7, e.resulting_interval);
    st.run();
    return sqlite3_last_insert_rowid(db);
}

std::vector<ReviewEvent> CardStore::reviewsForCard(const std::string& cardId) {
    Statement st(db,
        "SELECT id, card_id, ts, rating, answer_ms, prev_state, prev_interval, next_interval "
        "FROM review_log WHERE card_id = ? ORDER BY ts, id");
    st.bind(1, cardId);

    std::vector<ReviewEvent> out;
    while (st.step()) {
        ReviewEvent e;
        e.id = st.int64(0);
        e.card_id = st.text(1);
        e.timestamp = static_cast<std::time_t>(st.int64(2));
        e.rating = ratingFromInt(st.integer(3));
        e.answer_ms = st.int64(4);
        e.prior_state = parseCardState(st.text(5));
        e.prior_interval = st.real(6);
        e.resulting_interval = st.real(7);
        out.push_back(e);
    }
    return out;
}

/* -------------------------
   Daily counters
   ------------------------- */

DailyCounts CardStore::dailyCounts(const std::string& deckId, const std::string& studyDate) {
    Statement st(db, "SELECT new_studied, rev_studied FROM daily_stats WHERE deck_id = ? AND study_date = ?");
    st.bind(1, deckId).bind(2, studyDate);

    DailyCounts counts;
    if (st.step()) {
        counts.new_studied = st.integer(0);
        counts.rev_studied = st.integer(1);
    }
    return counts;
}

void CardStore::bumpDailyCounts(const std::string& deckId, const std::string& studyDate, int newDelta, int revDelta) {
    Statement st(db,
        "INSERT INTO daily_stats (deck_id, study_date, new_studied, rev_studied) VALUES (?, ?, ?, ?) "
        "ON CONFLICT(deck_id, study_date) DO UPDATE SET "
        "new_studied = new_studied + excluded.new_studied, rev_studied = rev_studied + excluded.rev_studied");
    st.bind(1, deckId).bind(2, studyDate).bind(3, newDelta).bind(4, revDelta);
    st.run();
}
