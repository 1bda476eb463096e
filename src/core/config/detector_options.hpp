#pragma once

#include "../../common/error.hpp"

namespace wordguard {

// Detection configuration
struct DetectorOptions {
    // Sanitization
    bool sanitize_special_characters = true;   // Fold punctuation/symbols to a blank
    bool sanitize_leet_speak = true;           // Fold digit/symbol stand-ins to letters
    bool sanitize_accents = true;              // Fold accented letters to base letters
    bool sanitize_spaces = true;               // Remove blanks after folding

    // Matching
    bool exact_word = false;                   // Require whole-token matches

    // Exact-word matching needs the blanks that space removal would delete
    void validate() const {
        CHECK_CONFIG(!(exact_word && sanitize_spaces),
                     "exact_word cannot be combined with sanitize_spaces");
    }

    bool operator==(const DetectorOptions& other) const {
        return sanitize_special_characters == other.sanitize_special_characters &&
               sanitize_leet_speak == other.sanitize_leet_speak &&
               sanitize_accents == other.sanitize_accents &&
               sanitize_spaces == other.sanitize_spaces &&
               exact_word == other.exact_word;
    }
    bool operator!=(const DetectorOptions& other) const { return !(*this == other); }
};

} // namespace wordguard
