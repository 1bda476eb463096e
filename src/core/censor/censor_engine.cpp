#include "censor_engine.hpp"
#include "../../common/logging.hpp"
#include "../../common/utils.hpp"

namespace wordguard {

CensorEngine::CensorEngine(const Sanitizer& sanitizer, const CompiledDictionary& dictionary)
    : sanitizer_(sanitizer)
    , dictionary_(dictionary) {
}

std::string CensorEngine::censor(const std::string& input) const {
    std::u32string censored = common::StringUtils::to_utf32(input);
    if (censored.empty()) {
        return input;
    }

    // Masks turn into blanks on the next sanitize, which can join the text
    // around them into new matches. Repeat until a pass masks nothing so that
    // censoring the result again changes nothing.
    size_t total = 0;
    size_t masked = mask_pass(input, censored);
    while (masked > 0) {
        total += masked;
        masked = mask_pass(common::StringUtils::to_utf8(censored), censored);
    }

    if (total == 0) {
        return input;
    }

    LOG_DEBUG("Masked " + std::to_string(total) + " characters");
    return common::StringUtils::to_utf8(censored);
}

size_t CensorEngine::mask_pass(const std::string& text, std::u32string& censored) const {
    CanonicalText canonical = sanitizer_.sanitize(text, true);

    size_t masked = mask_occurrences(canonical, dictionary_.false_negatives, censored);

    for (const auto& word : dictionary_.false_positives) {
        canonical.erase_all(word);
    }

    masked += mask_occurrences(canonical, dictionary_.profanities, censored);
    return masked;
}

size_t CensorEngine::mask_occurrences(const CanonicalText& canonical,
                                      const std::vector<std::u32string>& words,
                                      std::u32string& censored) {
    size_t masked = 0;
    for (const auto& word : words) {
        if (word.empty()) {
            continue;
        }

        size_t pos = 0;
        while ((pos = canonical.text.find(word, pos)) != std::u32string::npos) {
            for (size_t i = pos; i < pos + word.size(); i++) {
                int32_t original = canonical.original_index(i);
                if (original < 0 || static_cast<size_t>(original) >= censored.size()) {
                    continue;
                }
                if (censored[original] != MASK_CHARACTER) {
                    censored[original] = MASK_CHARACTER;
                    masked++;
                }
            }
            pos += word.size();
        }
    }
    return masked;
}

} // namespace wordguard
