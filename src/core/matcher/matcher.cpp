#include "matcher.hpp"
#include "../../common/logging.hpp"
#include "../../common/utils.hpp"

namespace wordguard {

Matcher::Matcher(const CompiledDictionary& dictionary, bool exact_word)
    : dictionary_(dictionary)
    , exact_word_(exact_word) {
}

Match Matcher::match(CanonicalText canonical) const {
    Match result = find_false_negative(canonical);
    if (result.found()) {
        return result;
    }

    for (const auto& word : dictionary_.false_positives) {
        canonical.erase_all(word);
    }

    return exact_word_ ? find_exact_token(canonical) : find_profanity(canonical);
}

std::string Matcher::extract(const CanonicalText& canonical) const {
    Match result = match(canonical);
    if (!result.found()) {
        return std::string();
    }

    std::string word = common::StringUtils::to_utf8(result.word);
    LOG_DEBUG("Matched " + std::string(result.source == Match::Source::FALSE_NEGATIVE
                                           ? "false negative" : "profanity") + ": " + word);
    return word;
}

Match Matcher::find_false_negative(const CanonicalText& canonical) const {
    Match result;
    for (const auto& word : dictionary_.false_negatives) {
        if (common::StringUtils::contains(canonical.text, word)) {
            result.source = Match::Source::FALSE_NEGATIVE;
            result.word = word;
            break;
        }
    }
    return result;
}

Match Matcher::find_profanity(const CanonicalText& canonical) const {
    Match result;
    for (const auto& word : dictionary_.profanities) {
        if (common::StringUtils::contains(canonical.text, word)) {
            result.source = Match::Source::PROFANITY;
            result.word = word;
            break;
        }
    }
    return result;
}

Match Matcher::find_exact_token(const CanonicalText& canonical) const {
    Match result;
    for (const auto& token : common::StringUtils::split(canonical.text, BLANK)) {
        if (token.empty()) {
            continue;
        }
        for (const auto& word : dictionary_.profanities) {
            if (common::StringUtils::equals_ignore_case(token, word)) {
                result.source = Match::Source::PROFANITY;
                result.word = token;
                return result;
            }
        }
    }
    return result;
}

} // namespace wordguard
