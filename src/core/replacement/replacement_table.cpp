#include "replacement_table.hpp"
#include <unicode/uchar.h>
#include <utility>

namespace wordguard {

namespace {

// Punctuation and symbols folded to a blank
constexpr char32_t SPECIAL_CHARACTERS[] = {
    U'-', U'_', U'|', U'.', U',', U'(', U')', U'<', U'>', U'"', U'`',
    U'~', U'*', U'&', U'%', U'$', U'#', U'@', U'!', U'?', U'+'
};

// Digit and symbol stand-ins folded to letters
constexpr std::pair<char32_t, char32_t> LEET_SPEAK[] = {
    {U'4', U'a'}, {U'$', U's'}, {U'!', U'i'}, {U'+', U't'},
    {U'#', U'h'}, {U'@', U'a'}, {U'0', U'o'}, {U'1', U'i'},
    {U'7', U'l'}, {U'3', U'e'}, {U'5', U's'}, {U'<', U'c'}
};

} // namespace

ReplacementTable::ReplacementTable(Map entries) {
    // Input is lowercased before lookup, so keys are stored lowercased too
    for (const auto& entry : entries) {
        entries_[static_cast<char32_t>(u_tolower(static_cast<UChar32>(entry.first)))] = entry.second;
    }
}

ReplacementTable ReplacementTable::build(bool sanitize_special_characters, bool sanitize_leet_speak) {
    ReplacementTable table;
    if (sanitize_special_characters) {
        for (char32_t ch : SPECIAL_CHARACTERS) {
            table.entries_[ch] = BLANK;
        }
    }
    if (sanitize_leet_speak) {
        for (const auto& entry : LEET_SPEAK) {
            table.entries_[entry.first] = entry.second;
        }
    }
    return table;
}

const ReplacementTable& ReplacementTable::defaults() {
    static const ReplacementTable table = build(true, true);
    return table;
}

bool ReplacementTable::lookup(char32_t ch, char32_t& replacement) const {
    auto it = entries_.find(ch);
    if (it == entries_.end()) {
        return false;
    }
    replacement = it->second;
    return true;
}

bool ReplacementTable::is_special(char32_t ch) const {
    auto it = entries_.find(ch);
    return it != entries_.end() && it->second == BLANK;
}

bool ReplacementTable::is_leet(char32_t ch) const {
    auto it = entries_.find(ch);
    return it != entries_.end() && it->second != BLANK;
}

void ReplacementTable::set(char32_t ch, char32_t replacement) {
    entries_[static_cast<char32_t>(u_tolower(static_cast<UChar32>(ch)))] = replacement;
}

void ReplacementTable::erase(char32_t ch) {
    entries_.erase(static_cast<char32_t>(u_tolower(static_cast<UChar32>(ch))));
}

} // namespace wordguard
