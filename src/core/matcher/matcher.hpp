#pragma once

#include "../dictionary/dictionary.hpp"
#include "../sanitizer/sanitizer.hpp"
#include <string>

namespace wordguard {

// Match result
struct Match {
    enum class Source {
        NONE,
        FALSE_NEGATIVE,
        PROFANITY
    };

    Source source = Source::NONE;
    std::u32string word;

    bool found() const { return source != Source::NONE; }
};

// Decides presence and identity of a profanity in canonical text.
//
// False negatives are checked first and win outright; false positives are
// then excised before profanity matching (substring or exact-token).
class Matcher {
public:
    Matcher(const CompiledDictionary& dictionary, bool exact_word);

    Match match(CanonicalText canonical) const;

    // UTF-8 form of the first match, empty if nothing matched
    std::string extract(const CanonicalText& canonical) const;

private:
    Match find_false_negative(const CanonicalText& canonical) const;
    Match find_profanity(const CanonicalText& canonical) const;
    Match find_exact_token(const CanonicalText& canonical) const;

    const CompiledDictionary& dictionary_;
    bool exact_word_;
};

} // namespace wordguard
