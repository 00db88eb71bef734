#include "NoteImporter.hpp"
#include "Errors.hpp"
#include "Scheduler.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

NoteImporter::NoteImporter(Scheduler& s)
    : scheduler(s)
{
}

ImportReport NoteImporter::importLines(const std::string& deckId, std::istream& in) {
    ImportReport report;
    std::string raw;
    std::size_t lineNo = 0;

    // Fail on a bad deck before reading anything.
    scheduler.deck(deckId);

    while (std::getline(in, raw)) {
        ++lineNo;
        if (raw.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }

        nlohmann::json obj = nlohmann::json::parse(raw, nullptr, false);
        if (obj.is_discarded() || !obj.is_object()) {
            spdlog::warn("Import line {}: not a JSON object, skipped", lineNo);
            ++report.skipped;
            continue;
        }
        if (!obj.contains("front") || !obj["front"].is_string() || !obj.contains("back") || !obj["back"].is_string()) {
            spdlog::warn("Import line {}: missing front/back, skipped", lineNo);
            ++report.skipped;
            continue;
        }

        nlohmann::json meta = obj.contains("meta") && obj["meta"].is_object() ? obj["meta"] : nlohmann::json();
        try {
            scheduler.addNote(deckId, obj["front"].get<std::string>(), obj["back"].get<std::string>(), meta);
            ++report.added;
        }
        catch (const DuplicateNoteError&) {
            ++report.duplicates;
        }
        catch (const ValidationError& e) {
            spdlog::warn("Import line {}: {}", lineNo, e.what());
            ++report.skipped;
        }
    }

    spdlog::info("Imported into deck {}: added={} duplicates={} skipped={}",
        deckId, report.added, report.duplicates, report.skipped);
    return report;
}

ImportReport NoteImporter::importFile(const std::string& deckId, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ValidationError(ErrorKind::InvalidArgument, "Can't open import file '" + path + "'");
    }
    return importLines(deckId, in);
}
