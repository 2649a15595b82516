#ifndef CORVID_SERIALIZATION_CONFIG_JSON_HPP
#define CORVID_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <lexer/lexer_config.hpp>

namespace corvid::lexer {

NLOHMANN_JSON_SERIALIZE_ENUM(KeywordMatch, {
    {KeywordMatch::Exact, "exact"},
    {KeywordMatch::Prefix, "prefix"},
})

inline void to_json(nlohmann::json& j, const LexerConfig& config) {
    j = {
        {"keyword_match", config.keyword_match},
        {"capacity_hint", config.capacity_hint},
        {"max_nesting_depth", config.max_nesting_depth}
    };
}

inline void from_json(const nlohmann::json& j, LexerConfig& config) {
    LexerConfig defaults;
    config.keyword_match = j.value("keyword_match", defaults.keyword_match);
    config.capacity_hint = j.value("capacity_hint", defaults.capacity_hint);
    config.max_nesting_depth = j.value("max_nesting_depth", defaults.max_nesting_depth);
}

// Reads the optional "lexer" section of a configuration document
inline LexerConfig lexer_config_from_document(const nlohmann::json& document) {
    if (document.contains("lexer")) {
        return document["lexer"].get<LexerConfig>();
    }
    return LexerConfig{};
}

}  // namespace corvid::lexer

#endif // CORVID_SERIALIZATION_CONFIG_JSON_HPP
