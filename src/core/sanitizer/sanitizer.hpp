#pragma once

#include "../config/detector_options.hpp"
#include "../replacement/replacement_table.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace wordguard {

// Canonical comparison text, optionally paired with the position in the
// original input that produced each character.
//
// When indexes are tracked, text.size() == indexes.size() holds after every
// operation and indexes is non-decreasing. Positions are code point offsets
// into the decoded input.
struct CanonicalText {
    std::u32string text;
    std::vector<int32_t> indexes;
    bool tracked = false;

    size_t size() const { return text.size(); }
    bool empty() const { return text.empty(); }

    // Remove every non-overlapping occurrence of `word` (left to right) from
    // the text together with the paired index entries. Returns the number of
    // occurrences removed. An empty word removes nothing.
    size_t erase_all(const std::u32string& word);

    // Original position of canonical character `pos`, or -1 if untracked or
    // out of range
    int32_t original_index(size_t pos) const;

    std::string to_utf8() const;
};

// Sanitizer transforms raw input into canonical comparison text.
//
// Steps, in order: lowercase, "()" -> "o" (detection only), per-character
// replacement, accent folding, index recording, blank removal.
class Sanitizer {
public:
    Sanitizer(const DetectorOptions& options, const ReplacementTable& replacements);

    CanonicalText sanitize(const std::string& input, bool track_indexes) const;

    // Individual processing steps
    std::u32string fold_characters(const std::u32string& text) const;
    // `origins[i]` receives the position in `text` that produced result[i]
    std::u32string fold_accents(const std::u32string& text, std::vector<int32_t>& origins) const;

    // Accent-folded form of a single character; may be empty (combining marks)
    // or longer than one character
    static std::u32string fold_accent(char32_t ch);

    // True if every character lies in the printable ASCII range
    static bool is_printable_ascii(const std::u32string& text);

private:
    char32_t fold_character(char32_t ch) const;

    const DetectorOptions& options_;
    const ReplacementTable& replacements_;
};

} // namespace wordguard
