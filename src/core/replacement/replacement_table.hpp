#pragma once

#include <string>
#include <unordered_map>

namespace wordguard {

// Replacement value marking a special-character fold
constexpr char32_t BLANK = U' ';

// Character substitution table used by the sanitizer.
//
// An entry whose replacement is BLANK is a special-character fold; any other
// replacement is a leetspeak fold. The classification depends only on the
// mapped value, never on the order entries were added.
class ReplacementTable {
public:
    using Map = std::unordered_map<char32_t, char32_t>;

    ReplacementTable() = default;
    explicit ReplacementTable(Map entries);

    // Derived table for the given folding flags. Special-character entries are
    // inserted first and leetspeak entries override them for shared keys.
    static ReplacementTable build(bool sanitize_special_characters, bool sanitize_leet_speak);

    // Same as build(true, true)
    static const ReplacementTable& defaults();

    // Lookup
    bool lookup(char32_t ch, char32_t& replacement) const;
    bool is_special(char32_t ch) const;
    bool is_leet(char32_t ch) const;

    // Modification
    void set(char32_t ch, char32_t replacement);
    void erase(char32_t ch);

    const Map& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    bool operator==(const ReplacementTable& other) const { return entries_ == other.entries_; }
    bool operator!=(const ReplacementTable& other) const { return !(*this == other); }

private:
    Map entries_;
};

} // namespace wordguard
