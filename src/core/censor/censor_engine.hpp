#pragma once

#include "../dictionary/dictionary.hpp"
#include "../sanitizer/sanitizer.hpp"
#include <string>
#include <vector>

namespace wordguard {

// Character written over censored positions
constexpr char32_t MASK_CHARACTER = U'*';

// Masks profane spans of the original input.
//
// Matches are found in index-tracked canonical text and projected back onto
// the original characters, so the output has exactly as many characters as
// the input.
class CensorEngine {
public:
    CensorEngine(const Sanitizer& sanitizer, const CompiledDictionary& dictionary);

    std::string censor(const std::string& input) const;

    // Mask every non-overlapping occurrence of each word.
    // Returns the number of characters newly masked.
    static size_t mask_occurrences(const CanonicalText& canonical,
                                   const std::vector<std::u32string>& words,
                                   std::u32string& censored);

private:
    // One sanitize-and-mask round over `text`, the UTF-8 form of `censored`
    size_t mask_pass(const std::string& text, std::u32string& censored) const;

    const Sanitizer& sanitizer_;
    const CompiledDictionary& dictionary_;
};

} // namespace wordguard
