#include "wordguard.hpp"
#include "../../../core/config/config_manager.hpp"
#include "../../../core/dictionary/dictionary.hpp"
#include "../../../core/replacement/replacement_table.hpp"
#include "../../../core/sanitizer/sanitizer.hpp"
#include "../../../core/matcher/matcher.hpp"
#include "../../../core/censor/censor_engine.hpp"
#include "../../../common/error.hpp"
#include "../../../common/logging.hpp"
#include "../../../common/utils.hpp"

namespace wordguard {
namespace api {

// Detector implementation class
class ProfanityDetector::Impl {
public:
    Impl()
        : replacements_(ReplacementTable::defaults())
        , dictionary_(Dictionary::defaults())
        , compiled_(CompiledDictionary::compile(dictionary_)) {
    }

    explicit Impl(const DetectorConfig& config)
        : options_(config.options)
        , custom_replacements_(config.use_custom_replacements)
        , dictionary_(Dictionary::defaults())
        , compiled_(CompiledDictionary::compile(dictionary_)) {
        options_.validate();
        if (custom_replacements_) {
            replacements_ = config.custom_replacements;
        } else {
            rebuild_character_replacements();
        }
    }

    void set_sanitize_leet_speak(bool sanitize) {
        options_.sanitize_leet_speak = sanitize;
        rebuild_character_replacements();
    }

    void set_sanitize_special_characters(bool sanitize) {
        options_.sanitize_special_characters = sanitize;
        rebuild_character_replacements();
    }

    void set_sanitize_accents(bool sanitize) {
        options_.sanitize_accents = sanitize;
    }

    void set_sanitize_spaces(bool sanitize) {
        options_.sanitize_spaces = sanitize;
        if (sanitize && options_.exact_word) {
            LOG_DEBUG("Space removal enabled, disabling exact-word matching");
            options_.exact_word = false;
        }
    }

    void set_exact_word(bool exact_word) {
        options_.exact_word = exact_word;
        if (exact_word && options_.sanitize_spaces) {
            LOG_DEBUG("Exact-word matching enabled, disabling space removal");
            options_.sanitize_spaces = false;
        }
    }

    void set_dictionary(const Dictionary& dictionary) {
        dictionary_ = dictionary;
        compiled_ = CompiledDictionary::compile(dictionary_);
    }

    void set_custom_replacements(const CharacterReplacements& replacements) {
        replacements_ = ReplacementTable(ReplacementTable::Map(replacements.begin(), replacements.end()));
        custom_replacements_ = true;
        LOG_DEBUG("Using custom character replacements (" + std::to_string(replacements_.size()) + " entries)");
    }

    void reset_replacements() {
        custom_replacements_ = false;
        rebuild_character_replacements();
    }

    // Derived table follows the folding flags; a caller-supplied table is kept
    void rebuild_character_replacements() {
        if (custom_replacements_) {
            LOG_DEBUG("Keeping custom character replacements");
            return;
        }
        replacements_ = ReplacementTable::build(options_.sanitize_special_characters,
                                                options_.sanitize_leet_speak);
        LOG_DEBUG("Rebuilt character replacements (" + std::to_string(replacements_.size()) + " entries)");
    }

    std::string extract_profanity(const std::string& text) const {
        Sanitizer sanitizer(options_, replacements_);
        Matcher matcher(compiled_, options_.exact_word);
        return matcher.extract(sanitizer.sanitize(text, false));
    }

    std::string censor(const std::string& text) const {
        Sanitizer sanitizer(options_, replacements_);
        CensorEngine engine(sanitizer, compiled_);
        return engine.censor(text);
    }

    std::string sanitize(const std::string& text) const {
        Sanitizer sanitizer(options_, replacements_);
        return sanitizer.sanitize(text, false).to_utf8();
    }

    const DetectorOptions& options() const { return options_; }
    const ReplacementTable& replacements() const { return replacements_; }
    bool has_custom_replacements() const { return custom_replacements_; }
    const Dictionary& dictionary() const { return dictionary_; }

private:
    DetectorOptions options_;
    ReplacementTable replacements_;
    bool custom_replacements_ = false;
    Dictionary dictionary_;
    CompiledDictionary compiled_;
};

ProfanityDetector::ProfanityDetector()
    : impl_(std::make_unique<Impl>()) {
}

ProfanityDetector::~ProfanityDetector() = default;

ProfanityDetector::ProfanityDetector(const ProfanityDetector& other)
    : impl_(std::make_unique<Impl>(other.impl())) {
}

ProfanityDetector& ProfanityDetector::operator=(const ProfanityDetector& other) {
    if (this != &other) {
        impl_ = std::make_unique<Impl>(other.impl());
    }
    return *this;
}

ProfanityDetector::ProfanityDetector(ProfanityDetector&& other) noexcept = default;
ProfanityDetector& ProfanityDetector::operator=(ProfanityDetector&& other) noexcept = default;

ProfanityDetector::Impl& ProfanityDetector::impl() {
    CHECK_STATE(impl_ != nullptr, "ProfanityDetector used after being moved from");
    return *impl_;
}

const ProfanityDetector::Impl& ProfanityDetector::impl() const {
    CHECK_STATE(impl_ != nullptr, "ProfanityDetector used after being moved from");
    return *impl_;
}

ProfanityDetector ProfanityDetector::from_config_file(const std::string& path) {
    CHECK_ARG(!path.empty(), "Config file path must not be empty");
    ConfigManager manager;
    manager.load_from_file(path);
    manager.apply_logging();

    ProfanityDetector detector;
    detector.impl_ = std::make_unique<Impl>(manager.get_config());
    return detector;
}

ProfanityDetector ProfanityDetector::from_config_string(const std::string& content) {
    ConfigManager manager;
    manager.load_from_string(content);
    manager.apply_logging();

    ProfanityDetector detector;
    detector.impl_ = std::make_unique<Impl>(manager.get_config());
    return detector;
}

ProfanityDetector& ProfanityDetector::with_sanitize_leet_speak(bool sanitize) {
    impl().set_sanitize_leet_speak(sanitize);
    return *this;
}

ProfanityDetector& ProfanityDetector::with_sanitize_special_characters(bool sanitize) {
    impl().set_sanitize_special_characters(sanitize);
    return *this;
}

ProfanityDetector& ProfanityDetector::with_sanitize_accents(bool sanitize) {
    impl().set_sanitize_accents(sanitize);
    return *this;
}

ProfanityDetector& ProfanityDetector::with_sanitize_spaces(bool sanitize) {
    impl().set_sanitize_spaces(sanitize);
    return *this;
}

ProfanityDetector& ProfanityDetector::with_exact_word(bool exact_word) {
    impl().set_exact_word(exact_word);
    return *this;
}

ProfanityDetector& ProfanityDetector::with_custom_dictionary(const std::vector<std::string>& profanities,
                                                             const std::vector<std::string>& false_positives,
                                                             const std::vector<std::string>& false_negatives) {
    Dictionary dictionary;
    dictionary.profanities = profanities;
    dictionary.false_positives = false_positives;
    dictionary.false_negatives = false_negatives;
    impl().set_dictionary(dictionary);
    return *this;
}

ProfanityDetector& ProfanityDetector::with_custom_character_replacements(const CharacterReplacements& replacements) {
    impl().set_custom_replacements(replacements);
    return *this;
}

ProfanityDetector& ProfanityDetector::with_default_character_replacements() {
    impl().reset_replacements();
    return *this;
}

bool ProfanityDetector::is_profane(const std::string& text) const {
    return !impl().extract_profanity(text).empty();
}

std::string ProfanityDetector::extract_profanity(const std::string& text) const {
    return impl().extract_profanity(text);
}

std::string ProfanityDetector::censor(const std::string& text) const {
    return impl().censor(text);
}

std::string ProfanityDetector::sanitize(const std::string& text) const {
    return impl().sanitize(text);
}

bool ProfanityDetector::sanitize_special_characters() const {
    return impl().options().sanitize_special_characters;
}

bool ProfanityDetector::sanitize_leet_speak() const {
    return impl().options().sanitize_leet_speak;
}

bool ProfanityDetector::sanitize_accents() const {
    return impl().options().sanitize_accents;
}

bool ProfanityDetector::sanitize_spaces() const {
    return impl().options().sanitize_spaces;
}

bool ProfanityDetector::exact_word() const {
    return impl().options().exact_word;
}

bool ProfanityDetector::has_custom_character_replacements() const {
    return impl().has_custom_replacements();
}

CharacterReplacements ProfanityDetector::character_replacements() const {
    const auto& entries = impl().replacements().entries();
    return CharacterReplacements(entries.begin(), entries.end());
}

const std::vector<std::string>& ProfanityDetector::profanities() const {
    return impl().dictionary().profanities;
}

const std::vector<std::string>& ProfanityDetector::false_positives() const {
    return impl().dictionary().false_positives;
}

const std::vector<std::string>& ProfanityDetector::false_negatives() const {
    return impl().dictionary().false_negatives;
}

// Shared default detector
const ProfanityDetector& default_detector() {
    static const ProfanityDetector detector;
    return detector;
}

bool is_profane(const std::string& text) {
    return default_detector().is_profane(text);
}

std::string extract_profanity(const std::string& text) {
    return default_detector().extract_profanity(text);
}

std::string censor(const std::string& text) {
    return default_detector().censor(text);
}

// Version information
std::string version() {
    return "1.0.0";
}

} // namespace api
} // namespace wordguard
