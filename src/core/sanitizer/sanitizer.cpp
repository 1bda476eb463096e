#include "sanitizer.hpp"
#include "../../common/logging.hpp"
#include "../../common/utils.hpp"
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/normalizer2.h>

namespace wordguard {

namespace {

constexpr char32_t FIRST_SUPPORTED = U' ';
constexpr char32_t LAST_SUPPORTED = U'~';

bool in_supported_range(char32_t ch) {
    return ch >= FIRST_SUPPORTED && ch <= LAST_SUPPORTED;
}

std::u32string to_code_points(const icu::UnicodeString& ustr) {
    std::u32string result;
    for (int32_t i = 0; i < ustr.length(); i = ustr.moveIndex32(i, 1)) {
        result.push_back(static_cast<char32_t>(ustr.char32At(i)));
    }
    return result;
}

} // namespace

// CanonicalText implementation
size_t CanonicalText::erase_all(const std::u32string& word) {
    if (word.empty() || text.size() < word.size()) {
        return 0;
    }

    std::u32string kept_text;
    std::vector<int32_t> kept_indexes;
    kept_text.reserve(text.size());
    if (tracked) {
        kept_indexes.reserve(indexes.size());
    }

    size_t removed = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t found = text.find(word, pos);
        size_t end = (found == std::u32string::npos) ? text.size() : found;

        kept_text.append(text, pos, end - pos);
        if (tracked) {
            kept_indexes.insert(kept_indexes.end(),
                                indexes.begin() + static_cast<std::ptrdiff_t>(pos),
                                indexes.begin() + static_cast<std::ptrdiff_t>(end));
        }

        if (found == std::u32string::npos) {
            break;
        }
        pos = found + word.size();
        removed++;
    }

    if (removed > 0) {
        text.swap(kept_text);
        if (tracked) {
            indexes.swap(kept_indexes);
        }
    }
    return removed;
}

int32_t CanonicalText::original_index(size_t pos) const {
    if (!tracked || pos >= indexes.size()) {
        return -1;
    }
    return indexes[pos];
}

std::string CanonicalText::to_utf8() const {
    return common::StringUtils::to_utf8(text);
}

// Sanitizer implementation
Sanitizer::Sanitizer(const DetectorOptions& options, const ReplacementTable& replacements)
    : options_(options)
    , replacements_(replacements) {
}

CanonicalText Sanitizer::sanitize(const std::string& input, bool track_indexes) const {
    CanonicalText result;
    result.tracked = track_indexes;

    std::u32string text = common::StringUtils::to_lower(common::StringUtils::to_utf32(input));
    if (text.empty()) {
        return result;
    }

    // Smiley-like "()" collapses to a letter. Skipped when tracking indexes:
    // the two-to-one substitution would shift every later position.
    if (options_.sanitize_leet_speak && options_.sanitize_special_characters && !track_indexes) {
        text = common::StringUtils::replace_all(text, U"()", U"o");
    }

    // Per-character replacement keeps a one-to-one mapping
    text = fold_characters(text);

    std::vector<int32_t> origins;
    std::u32string folded;
    if (options_.sanitize_accents) {
        folded = fold_accents(text, origins);
    } else {
        folded = text;
        origins.reserve(text.size());
        for (size_t i = 0; i < text.size(); i++) {
            origins.push_back(static_cast<int32_t>(i));
        }
    }

    // Record indexes and drop blanks in the same pass so both stay aligned.
    // With spaces preserved, blanks keep their slot.
    result.text.reserve(folded.size());
    if (track_indexes) {
        result.indexes.reserve(folded.size());
    }
    for (size_t i = 0; i < folded.size(); i++) {
        if (folded[i] == BLANK && options_.sanitize_spaces) {
            continue;
        }
        result.text.push_back(folded[i]);
        if (track_indexes) {
            result.indexes.push_back(origins[i]);
        }
    }

    return result;
}

std::u32string Sanitizer::fold_characters(const std::u32string& text) const {
    std::u32string result;
    result.reserve(text.size());
    for (char32_t ch : text) {
        result.push_back(fold_character(ch));
    }
    return result;
}

char32_t Sanitizer::fold_character(char32_t ch) const {
    char32_t replacement;
    if (!replacements_.lookup(ch, replacement)) {
        return ch;
    }
    if (replacement == BLANK && options_.sanitize_special_characters) {
        return replacement;
    }
    if (replacement != BLANK && options_.sanitize_leet_speak) {
        return replacement;
    }
    return ch;
}

std::u32string Sanitizer::fold_accents(const std::u32string& text, std::vector<int32_t>& origins) const {
    std::u32string result;
    origins.clear();
    result.reserve(text.size());
    origins.reserve(text.size());

    bool ascii = is_printable_ascii(text);
    for (size_t i = 0; i < text.size(); i++) {
        if (ascii || in_supported_range(text[i])) {
            result.push_back(text[i]);
            origins.push_back(static_cast<int32_t>(i));
            continue;
        }
        // Each produced character inherits its source position
        for (char32_t ch : fold_accent(text[i])) {
            result.push_back(ch);
            origins.push_back(static_cast<int32_t>(i));
        }
    }
    return result;
}

std::u32string Sanitizer::fold_accent(char32_t ch) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfd = icu::Normalizer2::getNFDInstance(status);
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status)) {
        LOG_WARNING(std::string("Unicode normalizer unavailable: ") + u_errorName(status));
        return std::u32string(1, ch);
    }

    icu::UnicodeString decomposed = nfd->normalize(icu::UnicodeString(static_cast<UChar32>(ch)), status);
    if (U_FAILURE(status)) {
        LOG_WARNING(std::string("Failed to decompose character: ") + u_errorName(status));
        return std::u32string(1, ch);
    }

    // Remove diacritical marks
    icu::UnicodeString stripped;
    for (int32_t i = 0; i < decomposed.length(); i = decomposed.moveIndex32(i, 1)) {
        UChar32 cp = decomposed.char32At(i);
        if (u_charType(cp) != U_NON_SPACING_MARK) {
            stripped.append(cp);
        }
    }

    icu::UnicodeString recomposed = nfc->normalize(stripped, status);
    if (U_FAILURE(status)) {
        LOG_WARNING(std::string("Failed to recompose character: ") + u_errorName(status));
        return to_code_points(stripped);
    }
    return to_code_points(recomposed);
}

bool Sanitizer::is_printable_ascii(const std::u32string& text) {
    for (char32_t ch : text) {
        if (!in_supported_range(ch)) {
            return false;
        }
    }
    return true;
}

} // namespace wordguard
