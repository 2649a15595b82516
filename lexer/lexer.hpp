#ifndef CORVID_LEXER_LEXER_HPP
#define CORVID_LEXER_LEXER_HPP

#include "cursor.hpp"
#include "lex_error.hpp"
#include "lexer_config.hpp"
#include "token_stream.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace corvid {
namespace lexer {

// Outcome of one Scanner::step.
struct Progress {};             // whitespace or a comment, nothing emitted
struct TokensEmitted {
    size_t count;               // including tokens of nested constructs
};
using StepResult = std::variant<Progress, TokensEmitted, LexError>;

// Either a complete token stream or the first lexical error.
class LexResult {
public:
    LexResult(TokenStream tokens) : value_(std::move(tokens)) {}
    LexResult(LexError error) : value_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<TokenStream>(value_); }
    explicit operator bool() const { return ok(); }

    // Throw std::logic_error when called on the wrong alternative.
    const TokenStream& tokens() const;
    TokenStream take_tokens();
    const LexError& error() const;

private:
    std::variant<TokenStream, LexError> value_;
};

// The scanning engine. step() consumes one unit of input: trivia, a single
// token, or a whole nested construct (bracket group, interpolated string),
// recursing into itself for the nested content. All mutable state lives in
// the cursor and the sink passed in.
class Scanner {
public:
    Scanner(std::string_view file_name, const LexerConfig& config);

    StepResult step(Cursor& cursor, TokenStream& sink, uint32_t depth = 0) const;

    const std::string& file_name() const { return file_name_; }
    const LexerConfig& config() const { return config_; }

private:
    std::string file_name_;
    LexerConfig config_;

    void skip_comment(Cursor& cursor) const;
    void skip_trivia(Cursor& cursor, TokenStream& sink) const;
    bool nesting_exceeded(uint32_t depth) const;
    LexError error_at(LexErrorKind kind, const SourcePosition& position) const;

    StepResult scan_group(Cursor& cursor, TokenStream& sink, uint32_t depth) const;
    StepResult scan_operator(Cursor& cursor, TokenStream& sink) const;
    StepResult scan_interpolated_string(Cursor& cursor, TokenStream& sink, uint32_t depth) const;
    StepResult scan_quoted(Cursor& cursor, TokenStream& sink, size_t prefix_len, char quote,
                           TokenKind kind, LexErrorKind unterminated) const;
    StepResult scan_identifier(Cursor& cursor, TokenStream& sink) const;
    StepResult scan_number(Cursor& cursor, TokenStream& sink) const;
};

// Tokenizes a whole file. file_name is only used in diagnostics; code must
// outlive the returned stream.
LexResult lex(std::string_view file_name, std::string_view code,
              const LexerConfig& config = LexerConfig{});

}  // namespace lexer
}  // namespace corvid

#endif // CORVID_LEXER_LEXER_HPP
