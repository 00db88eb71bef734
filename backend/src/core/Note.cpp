#include "Note.hpp"
#include "Card.hpp"
#include <algorithm>
#include <cctype>
#include <sodium.h>
#include <spdlog/spdlog.h>

namespace {

std::string trimmed(const std::string& in) {
    std::string t = in;
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
    return t;
}

} // namespace

Note::Note(const std::string& deckId, const std::string& f, const std::string& b)
    : deck_id(deckId), front(f), back(b)
{
    id = Card::generateID();
    created_at = std::time(nullptr);
}

std::vector<std::string> Note::tags() const {
    std::vector<std::string> out;
    if (!meta.is_object() || !meta.contains("tags") || !meta["tags"].is_array()) return out;
    for (const auto& t : meta["tags"]) {
        if (t.is_string()) out.push_back(t.get<std::string>());
    }
    return out;
}

void Note::addTag(const std::string& tag) {
    std::string t = trimmed(tag);
    if (t.empty() || hasTag(t)) return;

    if (!meta.is_object()) meta = nlohmann::json::object();
    if (!meta.contains("tags") || !meta["tags"].is_array()) meta["tags"] = nlohmann::json::array();
    meta["tags"].push_back(t);
    spdlog::debug("Note ID={} addTag '{}'", id, t);
}

bool Note::removeTag(const std::string& tag) {
    auto current = tags();
    auto it = std::find(current.begin(), current.end(), tag);
    if (it == current.end()) return false;

    current.erase(it);
    meta["tags"] = current;
    spdlog::debug("Note ID={} removeTag '{}'", id, tag);
    return true;
}

bool Note::hasTag(const std::string& tag) const {
    auto current = tags();
    return std::find(current.begin(), current.end(), tag) != current.end();
}

void Note::setTags(const std::vector<std::string>& newTags) {
    std::vector<std::string> clean;
    for (const auto& t : newTags) {
        std::string tmp = trimmed(t);
        if (!tmp.empty() && std::find(clean.begin(), clean.end(), tmp) == clean.end()) {
            clean.push_back(tmp);
        }
    }
    if (!meta.is_object()) meta = nlohmann::json::object();
    meta["tags"] = clean;
    spdlog::debug("Note ID={} setTags count={}", id, clean.size());
}

std::string Note::checksum(const std::string& front, const std::string& back) {
    unsigned char digest[16];
    crypto_generichash_state state;

    // Unit separator keeps ("ab", "c") and ("a", "bc") apart.
    const unsigned char sep = 0x1f;
    crypto_generichash_init(&state, nullptr, 0, sizeof(digest));
    crypto_generichash_update(&state, reinterpret_cast<const unsigned char*>(front.data()), front.size());
    crypto_generichash_update(&state, &sep, 1);
    crypto_generichash_update(&state, reinterpret_cast<const unsigned char*>(back.data()), back.size());
    crypto_generichash_final(&state, digest, sizeof(digest));

    char hex[sizeof(digest) * 2 + 1];
    sodium_bin2hex(hex, sizeof(hex), digest, sizeof(digest));
    return std::string(hex);
}
