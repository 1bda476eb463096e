#include "dictionary.hpp"
#include "../../common/logging.hpp"
#include "../../common/utils.hpp"

namespace wordguard {

namespace {

std::vector<std::u32string> compile_list(const std::vector<std::string>& words, const char* list_name) {
    std::vector<std::u32string> compiled;
    compiled.reserve(words.size());
    for (const auto& word : words) {
        std::u32string entry = common::StringUtils::to_lower(common::StringUtils::to_utf32(word));
        if (entry.empty()) {
            LOG_WARNING(std::string("Skipping empty entry in ") + list_name);
            continue;
        }
        compiled.push_back(std::move(entry));
    }
    return compiled;
}

} // namespace

CompiledDictionary CompiledDictionary::compile(const Dictionary& dictionary) {
    CompiledDictionary compiled;
    compiled.profanities = compile_list(dictionary.profanities, "profanities");
    compiled.false_positives = compile_list(dictionary.false_positives, "false positives");
    compiled.false_negatives = compile_list(dictionary.false_negatives, "false negatives");

    LOG_DEBUG("Compiled dictionary: " + std::to_string(compiled.profanities.size()) + " profanities, " +
              std::to_string(compiled.false_positives.size()) + " false positives, " +
              std::to_string(compiled.false_negatives.size()) + " false negatives");
    return compiled;
}

} // namespace wordguard
