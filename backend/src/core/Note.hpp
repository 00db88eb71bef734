#pragma once
#include <string>
#include <ctime>
#include <vector>
#include <nlohmann/json.hpp>

class Note {
public:
    Note() = default;
    Note(const std::string& deckId, const std::string& front, const std::string& back);

    std::string id;
    std::string deck_id;
    std::string front;
    std::string back;
    nlohmann::json meta;          // free-form object (tags, annotations) or null
    std::time_t created_at = 0;

    // Tag helpers; tags live in meta["tags"] as a list of strings.
    std::vector<std::string> tags() const;
    void addTag(const std::string& tag);
    bool removeTag(const std::string& tag); // returns true if removed
    bool hasTag(const std::string& tag) const;
    void setTags(const std::vector<std::string>& newTags);

    // BLAKE2b digest of (front, back), hex encoded. Used to find duplicates
    // without comparing full texts; requires sodium_init().
    static std::string checksum(const std::string& front, const std::string& back);
};
