#ifndef CORVID_LEXER_TOKEN_KIND_HPP
#define CORVID_LEXER_TOKEN_KIND_HPP

#include "lexer_config.hpp"
#include <cstddef>
#include <optional>
#include <ostream>
#include <string_view>

namespace corvid {
namespace lexer {

enum class TokenKind {
    // Logical keywords
    And, Or, Xor, Not,

    // Comparison
    Equals,         // ==
    NotEquals,      // !=
    LessThan,       // <
    GreaterThan,    // >
    LessEqual,      // <=
    GreaterEqual,   // >=

    Feather,        // >-
    Arrow,          // ->

    // Bitwise
    Ampersand, Pipe, Caret, Tilde,
    LShift,         // <<
    RShift,         // >>

    // Arithmetic
    Incr,           // ++
    Decr,           // --
    Plus, Minus, Mul, Div,
    Pow,            // **
    Modulo,         // %

    // Declaration keywords
    Pub,
    Packed, Struct, Enum, Union,

    // Control-flow keywords
    Fn, Defer, If, Then, Else, While, Do, Loop, Continue, Break,

    // Punctuation
    Equal, Semi, Colon, Comma, Dot,
    LParens, RParens, LBracket, RBracket, LBrace, RBrace,

    // Literals
    String,
    StringInterpBeg,
    StringInterpMid,
    StringInterpEnd,
    Char,
    Ident,
    Num
};

// Enumerator spelling, e.g. "LShift".
std::string_view token_kind_name(TokenKind kind);

// Inverse of token_kind_name.
std::optional<TokenKind> token_kind_from_name(std::string_view name);

std::ostream& operator<<(std::ostream& os, TokenKind kind);

struct OperatorMatch {
    TokenKind kind;
    size_t length;
};

// Longest operator/punctuation at the start of input. Two-byte operators
// win over their one-byte prefixes.
std::optional<OperatorMatch> match_operator(std::string_view input);

// Keyword kind for an identifier, or nullopt for a plain identifier.
std::optional<TokenKind> match_keyword(std::string_view ident, KeywordMatch policy);

bool is_keyword(TokenKind kind);
bool is_operator(TokenKind kind);
bool is_literal(TokenKind kind);

}  // namespace lexer
}  // namespace corvid

#endif // CORVID_LEXER_TOKEN_KIND_HPP
