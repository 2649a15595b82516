#include "lex_error.hpp"
#include <sstream>

namespace corvid {
namespace lexer {

std::string_view lex_error_kind_name(LexErrorKind kind) {
    switch (kind) {
        case LexErrorKind::UnterminatedInterpolatedString: return "UnterminatedInterpolatedString";
        case LexErrorKind::UnterminatedString: return "UnterminatedString";
        case LexErrorKind::UnterminatedChar: return "UnterminatedChar";
        case LexErrorKind::UnclosedParenthesis: return "UnclosedParenthesis";
        case LexErrorKind::UnclosedBracket: return "UnclosedBracket";
        case LexErrorKind::UnclosedBrace: return "UnclosedBrace";
        case LexErrorKind::UnrecognizedToken: return "UnrecognizedToken";
        case LexErrorKind::NestingTooDeep: return "NestingTooDeep";
    }
    return "Unknown";
}

std::string_view lex_error_description(LexErrorKind kind) {
    switch (kind) {
        case LexErrorKind::UnterminatedInterpolatedString: return "Unfinished interpolated string";
        case LexErrorKind::UnterminatedString: return "Unfinished string";
        case LexErrorKind::UnterminatedChar: return "Unfinished char";
        case LexErrorKind::UnclosedParenthesis: return "Unclosed parenthesis";
        case LexErrorKind::UnclosedBracket: return "Unclosed bracket";
        case LexErrorKind::UnclosedBrace: return "Unclosed brace";
        case LexErrorKind::UnrecognizedToken: return "Cannot parse token";
        case LexErrorKind::NestingTooDeep: return "Nesting too deep";
    }
    return "Unknown error";
}

std::string LexError::message() const {
    std::ostringstream oss;
    oss << file_name << ":" << position.line << ":" << (position.column + 1) << ": "
        << lex_error_description(kind);
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const LexError& error) {
    return os << error.message();
}

}  // namespace lexer
}  // namespace corvid
