#ifndef CORVID_LEXER_LEX_ERROR_HPP
#define CORVID_LEXER_LEX_ERROR_HPP

#include "token.hpp"
#include <ostream>
#include <string>
#include <string_view>

namespace corvid {
namespace lexer {

enum class LexErrorKind {
    UnterminatedInterpolatedString,
    UnterminatedString,
    UnterminatedChar,
    UnclosedParenthesis,
    UnclosedBracket,
    UnclosedBrace,
    UnrecognizedToken,
    NestingTooDeep
};

// Enumerator spelling, e.g. "UnterminatedString".
std::string_view lex_error_kind_name(LexErrorKind kind);

// Human readable text, e.g. "Unfinished string".
std::string_view lex_error_description(LexErrorKind kind);

// A fatal lexical error, positioned at the origin of the offending construct
// (opening quote, opening delimiter, or the unrecognized byte).
struct LexError {
    LexErrorKind kind;
    std::string file_name;
    SourcePosition position;

    // "<file>:<line>:<col>: <description>", with a 1-based column.
    std::string message() const;
};

std::ostream& operator<<(std::ostream& os, const LexError& error);

}  // namespace lexer
}  // namespace corvid

#endif // CORVID_LEXER_LEX_ERROR_HPP
