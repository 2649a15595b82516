#ifndef CORVID_SERIALIZATION_TOKEN_JSON_HPP
#define CORVID_SERIALIZATION_TOKEN_JSON_HPP

#include <nlohmann/json.hpp>
#include <lexer/lex_error.hpp>
#include <lexer/token_kind.hpp>
#include <lexer/token_stream.hpp>
#include <stdexcept>
#include <string>

namespace corvid::lexer {

// TokenKind serializes as its enumerator name
inline void to_json(nlohmann::json& j, const TokenKind& kind) {
    j = std::string(token_kind_name(kind));
}

inline void from_json(const nlohmann::json& j, TokenKind& kind) {
    auto name = j.get<std::string>();
    auto parsed = token_kind_from_name(name);
    if (!parsed) {
        throw std::runtime_error("Unknown token kind: " + name);
    }
    kind = *parsed;
}

NLOHMANN_JSON_SERIALIZE_ENUM(LexErrorKind, {
    {LexErrorKind::UnterminatedInterpolatedString, "UnterminatedInterpolatedString"},
    {LexErrorKind::UnterminatedString, "UnterminatedString"},
    {LexErrorKind::UnterminatedChar, "UnterminatedChar"},
    {LexErrorKind::UnclosedParenthesis, "UnclosedParenthesis"},
    {LexErrorKind::UnclosedBracket, "UnclosedBracket"},
    {LexErrorKind::UnclosedBrace, "UnclosedBrace"},
    {LexErrorKind::UnrecognizedToken, "UnrecognizedToken"},
    {LexErrorKind::NestingTooDeep, "NestingTooDeep"},
})

inline nlohmann::json token_to_json(const Token& token) {
    return {
        {"kind", token.kind},
        {"text", std::string(token.text)},
        {"line", token.line},
        {"column", token.column},
        {"offset", token.offset}
    };
}

inline nlohmann::json token_stream_to_json(const TokenStream& tokens) {
    nlohmann::json j;
    j["line_breaks"] = tokens.line_breaks().to_vector();

    nlohmann::json list = nlohmann::json::array();
    for (size_t i = 0; i < tokens.size(); ++i) {
        list.push_back(token_to_json(tokens[i]));
    }
    j["tokens"] = std::move(list);
    return j;
}

inline nlohmann::json lex_error_to_json(const LexError& error) {
    return {
        {"kind", error.kind},
        {"file", error.file_name},
        {"line", error.position.line},
        {"column", error.position.column},
        {"offset", error.position.offset},
        {"message", error.message()}
    };
}

}  // namespace corvid::lexer

#endif // CORVID_SERIALIZATION_TOKEN_JSON_HPP
