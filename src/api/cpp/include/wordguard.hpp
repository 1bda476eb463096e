#pragma once

#include <string>
#include <vector>
#include <memory>
#include <unordered_map>

namespace wordguard {
namespace api {

// Character -> replacement. A replacement of ' ' is a special-character
// fold; any other replacement is a leetspeak fold.
using CharacterReplacements = std::unordered_map<char32_t, char32_t>;

// Profanity detector
//
// Configuration is set at construction and changed only through the with_*
// methods, which must not run concurrently with queries on the same
// instance. Queries are const and safe to call from multiple threads.
class ProfanityDetector {
public:
    // Default options, built-in dictionaries and replacement table
    ProfanityDetector();
    ~ProfanityDetector();

    ProfanityDetector(const ProfanityDetector& other);
    ProfanityDetector& operator=(const ProfanityDetector& other);
    // A moved-from detector throws on use until it is assigned again
    ProfanityDetector(ProfanityDetector&& other) noexcept;
    ProfanityDetector& operator=(ProfanityDetector&& other) noexcept;

    // Build from a JSON configuration; also applies its logging section
    static ProfanityDetector from_config_file(const std::string& path);
    static ProfanityDetector from_config_string(const std::string& content);

    // Reconfiguration
    ProfanityDetector& with_sanitize_leet_speak(bool sanitize);
    ProfanityDetector& with_sanitize_special_characters(bool sanitize);
    ProfanityDetector& with_sanitize_accents(bool sanitize);
    // Enabling space removal turns exact-word matching off
    ProfanityDetector& with_sanitize_spaces(bool sanitize);
    // Enabling exact-word matching turns space removal off
    ProfanityDetector& with_exact_word(bool exact_word);
    // Entries are lowercased; empty entries are ignored
    ProfanityDetector& with_custom_dictionary(const std::vector<std::string>& profanities,
                                              const std::vector<std::string>& false_positives,
                                              const std::vector<std::string>& false_negatives);
    // A custom table is kept when folding flags change later
    ProfanityDetector& with_custom_character_replacements(const CharacterReplacements& replacements);
    ProfanityDetector& with_default_character_replacements();

    // Queries
    bool is_profane(const std::string& text) const;
    // First profanity found, or an empty string
    std::string extract_profanity(const std::string& text) const;
    // Same number of characters as `text`, profane spans replaced by '*'
    std::string censor(const std::string& text) const;
    // Canonical form used for matching
    std::string sanitize(const std::string& text) const;

    // Configuration access
    bool sanitize_special_characters() const;
    bool sanitize_leet_speak() const;
    bool sanitize_accents() const;
    bool sanitize_spaces() const;
    bool exact_word() const;
    bool has_custom_character_replacements() const;
    CharacterReplacements character_replacements() const;
    const std::vector<std::string>& profanities() const;
    const std::vector<std::string>& false_positives() const;
    const std::vector<std::string>& false_negatives() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;

    // Throws StateException on a moved-from detector
    Impl& impl();
    const Impl& impl() const;
};

// Shared default-configured detector, created on first use
const ProfanityDetector& default_detector();

// Convenience functions backed by default_detector()
bool is_profane(const std::string& text);
std::string extract_profanity(const std::string& text);
std::string censor(const std::string& text);

// Version information
std::string version();

} // namespace api
} // namespace wordguard
