#pragma once
#include <cstddef>
#include <istream>
#include <string>

class Scheduler;

struct ImportReport {
    std::size_t added = 0;
    std::size_t duplicates = 0;
    std::size_t skipped = 0;    // blank, malformed or incomplete lines
};

// Feeds bundled content into a deck: one JSON object per line,
// {"front": "...", "back": "...", "meta": {"tags": [...], ...}}.
// Every note goes through Scheduler::addNote; duplicates are counted, not
// added.
class NoteImporter {
public:
    explicit NoteImporter(Scheduler& scheduler);

    ImportReport importLines(const std::string& deckId, std::istream& in);
    // Throws ValidationError if the file can't be opened.
    ImportReport importFile(const std::string& deckId, const std::string& path);

private:
    Scheduler& scheduler;
};
