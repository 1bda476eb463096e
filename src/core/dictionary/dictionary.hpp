#pragma once

#include <string>
#include <vector>

namespace wordguard {

// Word lists driving detection. Order determines scan order and the
// first-match tie-break.
struct Dictionary {
    std::vector<std::string> profanities;
    std::vector<std::string> false_positives;   // Excised before matching
    std::vector<std::string> false_negatives;   // Always profane, checked first

    // Built-in English word lists
    static const Dictionary& defaults();
};

// Lowercased code point form used by the matcher and censor engine.
// Empty entries are dropped.
struct CompiledDictionary {
    std::vector<std::u32string> profanities;
    std::vector<std::u32string> false_positives;
    std::vector<std::u32string> false_negatives;

    static CompiledDictionary compile(const Dictionary& dictionary);
};

} // namespace wordguard
