#include "token_kind.hpp"
#include <array>

namespace corvid {
namespace lexer {

namespace {

constexpr size_t KIND_COUNT = static_cast<size_t>(TokenKind::Num) + 1;

constexpr std::array<std::string_view, KIND_COUNT> KIND_NAMES = {
    "And", "Or", "Xor", "Not",
    "Equals", "NotEquals", "LessThan", "GreaterThan", "LessEqual", "GreaterEqual",
    "Feather", "Arrow",
    "Ampersand", "Pipe", "Caret", "Tilde", "LShift", "RShift",
    "Incr", "Decr", "Plus", "Minus", "Mul", "Div", "Pow", "Modulo",
    "Pub",
    "Packed", "Struct", "Enum", "Union",
    "Fn", "Defer", "If", "Then", "Else", "While", "Do", "Loop", "Continue", "Break",
    "Equal", "Semi", "Colon", "Comma", "Dot",
    "LParens", "RParens", "LBracket", "RBracket", "LBrace", "RBrace",
    "String", "StringInterpBeg", "StringInterpMid", "StringInterpEnd",
    "Char", "Ident", "Num",
};

struct Spelling {
    std::string_view text;
    TokenKind kind;
};

constexpr std::array<Spelling, 11> TWO_BYTE_OPERATORS = {{
    {"==", TokenKind::Equals},
    {"!=", TokenKind::NotEquals},
    {"<=", TokenKind::LessEqual},
    {">=", TokenKind::GreaterEqual},
    {">-", TokenKind::Feather},
    {"->", TokenKind::Arrow},
    {"<<", TokenKind::LShift},
    {">>", TokenKind::RShift},
    {"++", TokenKind::Incr},
    {"--", TokenKind::Decr},
    {"**", TokenKind::Pow},
}};

constexpr std::array<Spelling, 22> ONE_BYTE_OPERATORS = {{
    {"%", TokenKind::Modulo},
    {"<", TokenKind::LessThan},
    {">", TokenKind::GreaterThan},
    {"&", TokenKind::Ampersand},
    {"|", TokenKind::Pipe},
    {"^", TokenKind::Caret},
    {"~", TokenKind::Tilde},
    {"+", TokenKind::Plus},
    {"-", TokenKind::Minus},
    {"*", TokenKind::Mul},
    {"/", TokenKind::Div},
    {"=", TokenKind::Equal},
    {";", TokenKind::Semi},
    {":", TokenKind::Colon},
    {",", TokenKind::Comma},
    {".", TokenKind::Dot},
    {"(", TokenKind::LParens},
    {")", TokenKind::RParens},
    {"[", TokenKind::LBracket},
    {"]", TokenKind::RBracket},
    {"{", TokenKind::LBrace},
    {"}", TokenKind::RBrace},
}};

// Ordered from the longest keyword down; match_keyword relies on it.
constexpr std::array<Spelling, 19> KEYWORDS = {{
    {"continue", TokenKind::Continue},
    {"packed", TokenKind::Packed},
    {"struct", TokenKind::Struct},
    {"union", TokenKind::Union},
    {"defer", TokenKind::Defer},
    {"while", TokenKind::While},
    {"break", TokenKind::Break},
    {"enum", TokenKind::Enum},
    {"then", TokenKind::Then},
    {"else", TokenKind::Else},
    {"loop", TokenKind::Loop},
    {"and", TokenKind::And},
    {"xor", TokenKind::Xor},
    {"not", TokenKind::Not},
    {"pub", TokenKind::Pub},
    {"or", TokenKind::Or},
    {"fn", TokenKind::Fn},
    {"if", TokenKind::If},
    {"do", TokenKind::Do},
}};

template <size_t N>
std::optional<TokenKind> lookup(const std::array<Spelling, N>& table, std::string_view text) {
    for (const auto& entry : table) {
        if (entry.text == text) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

bool in_range(TokenKind kind, TokenKind first, TokenKind last) {
    return kind >= first && kind <= last;
}

}  // namespace

std::string_view token_kind_name(TokenKind kind) {
    auto index = static_cast<size_t>(kind);
    if (index >= KIND_COUNT) {
        return "Unknown";
    }
    return KIND_NAMES[index];
}

std::optional<TokenKind> token_kind_from_name(std::string_view name) {
    for (size_t i = 0; i < KIND_COUNT; ++i) {
        if (KIND_NAMES[i] == name) {
            return static_cast<TokenKind>(i);
        }
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, TokenKind kind) {
    return os << token_kind_name(kind);
}

std::optional<OperatorMatch> match_operator(std::string_view input) {
    if (input.size() >= 2) {
        if (auto kind = lookup(TWO_BYTE_OPERATORS, input.substr(0, 2))) {
            return OperatorMatch{*kind, 2};
        }
    }
    if (!input.empty()) {
        if (auto kind = lookup(ONE_BYTE_OPERATORS, input.substr(0, 1))) {
            return OperatorMatch{*kind, 1};
        }
    }
    return std::nullopt;
}

std::optional<TokenKind> match_keyword(std::string_view ident, KeywordMatch policy) {
    if (policy == KeywordMatch::Exact) {
        return lookup(KEYWORDS, ident);
    }

    // Prefix policy: the first (longest) keyword whose bytes lead the
    // identifier wins, regardless of what follows.
    for (const auto& entry : KEYWORDS) {
        if (ident.size() >= entry.text.size() &&
            ident.substr(0, entry.text.size()) == entry.text) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

bool is_keyword(TokenKind kind) {
    return in_range(kind, TokenKind::And, TokenKind::Not) ||
           in_range(kind, TokenKind::Pub, TokenKind::Break);
}

bool is_operator(TokenKind kind) {
    return in_range(kind, TokenKind::Equals, TokenKind::Modulo) ||
           in_range(kind, TokenKind::Equal, TokenKind::RBrace);
}

bool is_literal(TokenKind kind) {
    return in_range(kind, TokenKind::String, TokenKind::Char) || kind == TokenKind::Num;
}

}  // namespace lexer
}  // namespace corvid
