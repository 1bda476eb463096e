#include "dictionary.hpp"

namespace wordguard {

namespace {

Dictionary build_default_dictionary() {
    Dictionary dictionary;

    dictionary.profanities = {
        "anal", "anus", "arse", "ass", "ballsack", "bastard", "bitch", "biatch",
        "blowjob", "bollock", "bollok", "boner", "boob", "bugger", "butt", "buttplug",
        "clitoris", "cock", "coon", "crap", "cum", "cunt", "dick", "dildo",
        "douche", "ejaculat", "fellatio", "felching", "fuck", "fudgepacker", "handjob", "horny",
        "jizz", "labia", "masturbat", "motherfuck", "nazi", "nigga", "nigger", "nipple",
        "nude", "orgasm", "pedophile", "penis", "piss", "porn", "prick", "pube",
        "pussy", "rape", "rapist", "retard", "rimjob", "scrotum", "semen", "sex",
        "shit", "slut", "tits", "titt", "turd", "twat", "vagina", "wank",
        "whore", "wtf"
    };

    dictionary.false_positives = {
        "analog", "analy", "banal", "canal",
        "janus", "manus",
        "arsenal", "arsenic", "coarse", "hearse", "hoarse", "parse",
        "amass", "assassin", "assault", "assemb", "assert", "asset", "assign", "assist",
        "associat", "assum", "assur", "bass", "brass", "class", "compass", "embarrass",
        "embassy", "glass", "grass", "harass", "lass", "mass", "pass", "sass", "wass",
        "button", "butter", "buttress", "rebutt",
        "cockatoo", "cockpit", "cockroach", "cocktail", "hancock", "peacock", "shuttlecock",
        "cocoon", "raccoon", "tycoon",
        "scrap",
        "accumul", "circum", "cucumber", "cumb", "cumul", "document", "magnacumlaude", "scum",
        "scunthorpe",
        "dickens",
        "thorny",
        "snigger",
        "penistone",
        "drape", "grape", "parapet", "scrape", "therapist", "trapez",
        "retardant",
        "prickl",
        "pubert",
        "basement", "casement",
        "essex", "sextant", "sexton", "sussex",
        "shitake",
        "swank"
    };

    dictionary.false_negatives = {
        "asshole",
        "dumbass"
    };

    return dictionary;
}

} // namespace

const Dictionary& Dictionary::defaults() {
    static const Dictionary dictionary = build_default_dictionary();
    return dictionary;
}

} // namespace wordguard
