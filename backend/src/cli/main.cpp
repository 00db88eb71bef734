#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>
#include <sodium.h>

#include "../utils/logging.hpp"
#include "../utils/Config.hpp"
#include "../storage/CardStore.hpp"
#include "../core/Errors.hpp"
#include "../core/NoteImporter.hpp"
#include "../core/Scheduler.hpp"
#include "../core/StudyDay.hpp"

namespace {

void discardLine() {
    std::cin.clear();
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
}

int readChoice() {
    int choice;
    if (!(std::cin >> choice)) {
        discardLine();
        return -1;
    }
    discardLine();
    return choice;
}

std::vector<std::string> splitTagsLine(const std::string& line) {
    std::vector<std::string> out;
    std::istringstream iss(line);
    std::string t;
    while (std::getline(iss, t, ',')) {
        while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
        while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
        if (!t.empty()) out.push_back(t);
    }
    return out;
}

void listDecks(Scheduler& scheduler, const std::vector<Deck>& decks) {
    std::cout << "\n===== DECKS =====\n";
    if (decks.empty()) {
        std::cout << "No decks yet.\n";
        return;
    }

    for (size_t i = 0; i < decks.size(); i++) {
        const Deck& d = decks[i];
        DueStats due = scheduler.statsToday({ d.id });
        DailyCounts done = scheduler.studiedToday(d.id);

        std::cout << i + 1 << ". " << d.name << (d.is_builtin ? " [built-in]" : "") << "\n"
            << "   Due: new=" << due.new_cards << " learning=" << due.learning << " review=" << due.review << "\n"
            << "   Studied today: new=" << done.new_studied << " review=" << done.rev_studied << "\n"
            << "   Limits: " << d.prefs.new_per_day << " new/day, " << d.prefs.rev_per_day << " reviews/day, order="
            << queueOrderName(d.prefs.order) << (d.prefs.bidirectional ? ", bidirectional" : "") << "\n";
    }
}

int chooseDeck(Scheduler& scheduler) {
    auto decks = scheduler.listDecks();
    listDecks(scheduler, decks);
    if (decks.empty()) return -1;

    std::cout << "Choose deck number: ";
    int sel = readChoice();
    if (sel < 1 || (size_t)sel > decks.size()) {
        std::cout << "Invalid selection.\n";
        return -1;
    }
    return sel - 1;
}

int askRating() {
    while (true) {
        std::cout << "\nHow did it go?\n"
            " 0 = Missed\n"
            " 1 = Almost\n"
            " 2 = Got it\n"
            " s = Suspend card, q = Quit session\n> ";
        std::string in;
        if (!std::getline(std::cin, in)) return -2;
        if (in == "q") return -2;
        if (in == "s") return -1;
        if (in == "0" || in == "1" || in == "2") return in[0] - '0';
        std::cout << "Invalid input.\n";
    }
}

void study(Scheduler& scheduler, const Deck& deck) {
    auto session = scheduler.buildSession({ deck.id });
    if (session.empty()) {
        StudyDay day(scheduler.config().rollover_hour);
        std::time_t next = day.nextRollover(std::time(nullptr));
        std::tm local{};
        localtime_r(&next, &local);
        char when[32];
        std::strftime(when, sizeof(when), "%Y-%m-%d %H:%M", &local);
        std::cout << "Nothing due in '" << deck.name << "'. Daily limits reset at " << when << ".\n";
        return;
    }

    std::cout << session.size() << " card(s) in this session.\n";
    for (const auto& card : session) {
        bool reverse = card.template_tag == kBackToFront;
        std::cout << "\n[" << cardStateName(card.state) << "] " << (reverse ? card.back : card.front)
            << "\n(press Enter to show the answer)";
        auto shown = std::chrono::steady_clock::now();
        std::string dummy;
        std::getline(std::cin, dummy);
        std::cout << "Answer: " << (reverse ? card.front : card.back) << "\n";
        auto answerMs = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - shown).count();

        int rating = askRating();
        if (rating == -2) break;
        if (rating == -1) {
            scheduler.suspend(card.card_id);
            std::cout << "Suspended.\n";
            continue;
        }

        Card updated = scheduler.review(card.card_id, rating, answerMs);
        std::cout << "Next: " << cardStateName(updated.state);
        if (updated.state == CardState::Review) std::cout << " in " << updated.interval_days << " day(s)";
        std::cout << "\n";
    }
    std::cout << "Session finished. Rebuild it to see cards that came due again.\n";
}

} // namespace

int main(int argc, char** argv) {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    AppConfig config;
    try {
        config = AppConfig::load(argc > 1 ? argv[1] : "retain.json");
    }
    catch (const SchedulerError& e) {
        std::cerr << "Bad configuration: " << e.what() << "\n";
        return 1;
    }

    Log::init(config.log_file, config.log_level);

    try {
        CardStore store(config.database_path);
        Scheduler scheduler(store, config);
        scheduler.setLeechHook([](const LeechNotice& n) {
            std::cout << "This card has lapsed " << n.lapses << " times; consider suspending or rewriting it.\n";
        });

        if (scheduler.listDecks().empty()) {
            scheduler.createDeck("Default", std::nullopt, true);
        }

        // MAIN LOOP
        while (true) {
            std::cout << "\n===== MAIN MENU =====\n"
                "1. List Decks\n"
                "2. Create Deck\n"
                "3. Add Note\n"
                "4. Study\n"
                "5. Import Notes (JSON lines)\n"
                "6. Deck Preferences\n"
                "7. Exit\n> ";

            int choice = readChoice();
            try {
                if (choice == 1) {
                    listDecks(scheduler, scheduler.listDecks());
                }

                else if (choice == 2) {
                    std::string name;
                    std::cout << "Deck name: "; std::getline(std::cin, name);
                    scheduler.createDeck(name);
                    std::cout << "Deck created.\n";
                }

                else if (choice == 3) {
                    int idx = chooseDeck(scheduler); if (idx < 0) continue;
                    Deck deck = scheduler.listDecks()[idx];

                    std::string front, back, tags_line;
                    std::cout << "Front: "; std::getline(std::cin, front);
                    std::cout << "Back: "; std::getline(std::cin, back);
                    std::cout << "Tags (comma-separated): "; std::getline(std::cin, tags_line);

                    nlohmann::json meta;
                    auto tags = splitTagsLine(tags_line);
                    if (!tags.empty()) meta["tags"] = tags;

                    try {
                        scheduler.addNote(deck.id, front, back, meta);
                        std::cout << "Note added.\n";
                    }
                    catch (const DuplicateNoteError&) {
                        std::cout << "This note already exists. Add it anyway? (y/n) ";
                        std::string yn; std::getline(std::cin, yn);
                        if (yn == "y") {
                            scheduler.addNote(deck.id, front, back, meta, true);
                            std::cout << "Note added.\n";
                        }
                    }
                }

                else if (choice == 4) {
                    int idx = chooseDeck(scheduler); if (idx < 0) continue;
                    study(scheduler, scheduler.listDecks()[idx]);
                }

                else if (choice == 5) {
                    int idx = chooseDeck(scheduler); if (idx < 0) continue;
                    std::string path;
                    std::cout << "File: "; std::getline(std::cin, path);
                    NoteImporter importer(scheduler);
                    ImportReport r = importer.importFile(scheduler.listDecks()[idx].id, path);
                    std::cout << "Added " << r.added << ", duplicates " << r.duplicates << ", skipped " << r.skipped << ".\n";
                }

                else if (choice == 6) {
                    int idx = chooseDeck(scheduler); if (idx < 0) continue;
                    Deck deck = scheduler.listDecks()[idx];
                    DeckPrefs prefs = deck.prefs;

                    std::cout << "New cards per day [" << prefs.new_per_day << "] (-1 keeps current): ";
                    if (int v = readChoice(); v >= 0) prefs.new_per_day = v;
                    std::cout << "Reviews per day [" << prefs.rev_per_day << "] (-1 keeps current): ";
                    if (int v = readChoice(); v >= 0) prefs.rev_per_day = v;

                    std::cout << "Learning steps in minutes, space separated (blank keeps current): ";
                    std::string steps_line; std::getline(std::cin, steps_line);
                    if (!steps_line.empty()) {
                        std::istringstream ss(steps_line);
                        std::vector<int> steps;
                        int s;
                        while (ss >> s) steps.push_back(s);
                        prefs.steps_min = steps;
                    }

                    std::cout << "Order (new_first/reviews_first/alternate, blank keeps current): ";
                    std::string order; std::getline(std::cin, order);
                    if (!order.empty()) prefs.order = parseQueueOrder(order);

                    std::cout << "Create reverse cards? (y/n, blank keeps current): ";
                    std::string yn; std::getline(std::cin, yn);
                    if (yn == "y") prefs.bidirectional = true;
                    else if (yn == "n") prefs.bidirectional = false;

                    scheduler.updateDeckPrefs(deck.id, prefs);
                    std::cout << "Preferences saved.\n";
                }

                else if (choice == 7) {
                    std::cout << "Goodbye!\n";
                    break;
                }

                else {
                    std::cout << "Invalid.\n";
                }
            }
            catch (const ValidationError& e) {
                std::cout << "Invalid input [" << errorKindName(e.kind()) << "]: " << e.what() << "\n";
            }
            catch (const ConflictError& e) {
                std::cout << "[" << errorKindName(e.kind()) << "] " << e.what() << "\n";
            }
            catch (const NotFoundError& e) {
                std::cout << "[" << errorKindName(e.kind()) << "] " << e.what() << "\n";
            }
        }
    }
    catch (const StorageError& e) {
        std::cerr << "Storage failure: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
