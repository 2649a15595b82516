#include "lexer.hpp"
#include "logging.hpp"
#include <stdexcept>
#include <utility>

namespace corvid {
namespace lexer {

namespace {

TokenSpan span_from(const Cursor& cursor, const SourcePosition& start) {
    return TokenSpan{cursor.text_from(start.offset), start.line, start.column, start.offset};
}

const LexError* as_error(const StepResult& result) {
    return std::get_if<LexError>(&result);
}

bool is_hex_digit(char c) {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool is_octal_digit(char c) {
    return c >= '0' && c <= '7';
}

bool is_binary_digit(char c) {
    return c == '0' || c == '1';
}

template <typename Pred>
void skip_digits(Cursor& cursor, Pred is_digit_of_radix) {
    while (cursor.current() == '_' || is_digit_of_radix(cursor.current())) {
        cursor.advance();
    }
}

}  // namespace

// === LexResult ===

const TokenStream& LexResult::tokens() const {
    if (!ok()) {
        throw std::logic_error("No token stream: " + error().message());
    }
    return std::get<TokenStream>(value_);
}

TokenStream LexResult::take_tokens() {
    if (!ok()) {
        throw std::logic_error("No token stream: " + error().message());
    }
    return std::move(std::get<TokenStream>(value_));
}

const LexError& LexResult::error() const {
    if (ok()) {
        throw std::logic_error("Lexing succeeded, there is no error");
    }
    return std::get<LexError>(value_);
}

// === Scanner ===

Scanner::Scanner(std::string_view file_name, const LexerConfig& config)
    : file_name_(file_name), config_(config) {}

LexError Scanner::error_at(LexErrorKind kind, const SourcePosition& position) const {
    return LexError{kind, file_name_, position};
}

bool Scanner::nesting_exceeded(uint32_t depth) const {
    return config_.max_nesting_depth != 0 && depth >= config_.max_nesting_depth;
}

void Scanner::skip_comment(Cursor& cursor) const {
    // The terminating newline is left for the whitespace pass
    cursor.advance(2);
    while (!cursor.at_end() && cursor.current() != '\n') {
        cursor.advance();
    }
}

void Scanner::skip_trivia(Cursor& cursor, TokenStream& sink) const {
    while (true) {
        cursor.skip_whitespace(sink);
        if (!cursor.starts_with("//")) {
            return;
        }
        skip_comment(cursor);
    }
}

StepResult Scanner::step(Cursor& cursor, TokenStream& sink, uint32_t depth) const {
    cursor.skip_whitespace(sink);
    if (cursor.at_end()) {
        return Progress{};
    }

    if (cursor.starts_with("//")) {
        skip_comment(cursor);
        return Progress{};
    }

    char c = cursor.current();

    if (c == '(' || c == '[' || c == '{') {
        return scan_group(cursor, sink, depth);
    }

    if (match_operator(cursor.remaining())) {
        return scan_operator(cursor, sink);
    }

    if (cursor.starts_with("$\"")) {
        return scan_interpolated_string(cursor, sink, depth);
    }

    if (cursor.starts_with("b\"") || cursor.starts_with("c\"")) {
        return scan_quoted(cursor, sink, 2, '"', TokenKind::String, LexErrorKind::UnterminatedString);
    }
    if (c == '"') {
        return scan_quoted(cursor, sink, 1, '"', TokenKind::String, LexErrorKind::UnterminatedString);
    }

    if (cursor.starts_with("b'")) {
        return scan_quoted(cursor, sink, 2, '\'', TokenKind::Char, LexErrorKind::UnterminatedChar);
    }
    if (c == '\'') {
        return scan_quoted(cursor, sink, 1, '\'', TokenKind::Char, LexErrorKind::UnterminatedChar);
    }

    if (is_ident_start(c)) {
        return scan_identifier(cursor, sink);
    }

    if (is_digit(c)) {
        return scan_number(cursor, sink);
    }

    return error_at(LexErrorKind::UnrecognizedToken, cursor.position());
}

StepResult Scanner::scan_group(Cursor& cursor, TokenStream& sink, uint32_t depth) const {
    SourcePosition opener = cursor.position();
    size_t before = sink.size();

    char closer;
    LexErrorKind unclosed;
    switch (cursor.current()) {
        case '(':
            closer = ')';
            unclosed = LexErrorKind::UnclosedParenthesis;
            break;
        case '[':
            closer = ']';
            unclosed = LexErrorKind::UnclosedBracket;
            break;
        default:
            closer = '}';
            unclosed = LexErrorKind::UnclosedBrace;
            break;
    }

    if (nesting_exceeded(depth)) {
        return error_at(LexErrorKind::NestingTooDeep, opener);
    }

    logging::get_logger()->trace("Group '{}' opened at {}:{} (depth {})",
                                 cursor.current(), opener.line, opener.column, depth);

    StepResult open = scan_operator(cursor, sink);
    if (const LexError* error = as_error(open)) {
        return *error;
    }

    while (true) {
        skip_trivia(cursor, sink);
        if (cursor.at_end()) {
            return error_at(unclosed, opener);
        }
        if (cursor.current() == closer) {
            break;
        }

        StepResult inner = step(cursor, sink, depth + 1);
        if (const LexError* error = as_error(inner)) {
            return *error;
        }
    }

    StepResult close = scan_operator(cursor, sink);
    if (const LexError* error = as_error(close)) {
        return *error;
    }

    return TokensEmitted{sink.size() - before};
}

StepResult Scanner::scan_operator(Cursor& cursor, TokenStream& sink) const {
    auto op = match_operator(cursor.remaining());
    if (!op) {
        return error_at(LexErrorKind::UnrecognizedToken, cursor.position());
    }

    SourcePosition start = cursor.position();
    cursor.advance(op->length);
    sink.push(op->kind, span_from(cursor, start));
    return TokensEmitted{1};
}

StepResult Scanner::scan_interpolated_string(Cursor& cursor, TokenStream& sink, uint32_t depth) const {
    SourcePosition start = cursor.position();
    size_t before = sink.size();

    cursor.advance(2);  // $"
    SourcePosition segment = cursor.position();
    bool has_interpolation = false;

    while (!cursor.at_end()) {
        char c = cursor.current();

        if (c == '\\') {
            // Escape unit: backslash plus the escaped byte
            cursor.advance();
            cursor.advance_tracked(sink);
            continue;
        }

        if (c == '"') {
            if (has_interpolation) {
                sink.push(TokenKind::StringInterpEnd, span_from(cursor, segment));
                cursor.advance();
            } else {
                cursor.advance();
                sink.push(TokenKind::String, span_from(cursor, start));
            }
            return TokensEmitted{sink.size() - before};
        }

        if (c == '{') {
            sink.push(has_interpolation ? TokenKind::StringInterpMid : TokenKind::StringInterpBeg,
                      span_from(cursor, segment));
            has_interpolation = true;

            if (nesting_exceeded(depth)) {
                return error_at(LexErrorKind::NestingTooDeep, cursor.position());
            }
            cursor.advance();

            while (true) {
                skip_trivia(cursor, sink);
                if (cursor.at_end()) {
                    return error_at(LexErrorKind::UnterminatedInterpolatedString, start);
                }
                if (cursor.current() == '}') {
                    break;
                }

                StepResult inner = step(cursor, sink, depth + 1);
                if (const LexError* error = as_error(inner)) {
                    return *error;
                }
            }

            cursor.advance();  // }
            segment = cursor.position();
            continue;
        }

        cursor.advance_tracked(sink);
    }

    return error_at(LexErrorKind::UnterminatedInterpolatedString, start);
}

StepResult Scanner::scan_quoted(Cursor& cursor, TokenStream& sink, size_t prefix_len, char quote,
                                TokenKind kind, LexErrorKind unterminated) const {
    SourcePosition start = cursor.position();
    cursor.advance(prefix_len);

    while (!cursor.at_end()) {
        char c = cursor.current();

        if (c == '\\') {
            cursor.advance();
            cursor.advance_tracked(sink);
            continue;
        }

        if (c == quote) {
            cursor.advance();
            sink.push(kind, span_from(cursor, start));
            return TokensEmitted{1};
        }

        // Literals may span lines
        cursor.advance_tracked(sink);
    }

    return error_at(unterminated, start);
}

StepResult Scanner::scan_identifier(Cursor& cursor, TokenStream& sink) const {
    SourcePosition start = cursor.position();

    cursor.advance();
    while (is_ident_continue(cursor.current())) {
        cursor.advance();
    }

    TokenSpan span = span_from(cursor, start);
    auto keyword = match_keyword(span.slice, config_.keyword_match);
    sink.push(keyword.value_or(TokenKind::Ident), span);
    return TokensEmitted{1};
}

StepResult Scanner::scan_number(Cursor& cursor, TokenStream& sink) const {
    SourcePosition start = cursor.position();

    if (cursor.starts_with("0x")) {
        cursor.advance(2);
        skip_digits(cursor, is_hex_digit);
    } else if (cursor.starts_with("0o")) {
        cursor.advance(2);
        skip_digits(cursor, is_octal_digit);
    } else if (cursor.starts_with("0b")) {
        cursor.advance(2);
        skip_digits(cursor, is_binary_digit);
    } else {
        // whole part
        cursor.advance();
        skip_digits(cursor, is_digit);

        // fractional part
        if (cursor.current() == '.') {
            cursor.advance();
            skip_digits(cursor, is_digit);
        }

        // exponent
        if (cursor.current() == 'e' || cursor.current() == 'E') {
            cursor.advance();
            if (cursor.current() == '+' || cursor.current() == '-') {
                cursor.advance();
            }
            skip_digits(cursor, is_digit);
        }
    }

    sink.push(TokenKind::Num, span_from(cursor, start));
    return TokensEmitted{1};
}

// === Driver ===

LexResult lex(std::string_view file_name, std::string_view code, const LexerConfig& config) {
    auto log = logging::get_logger();
    log->debug("Lexing {} ({} bytes)", file_name, code.size());

    TokenStream tokens(code, config.capacity_hint);
    Cursor cursor(code);
    Scanner scanner(file_name, config);

    while (!cursor.at_end()) {
        StepResult result = scanner.step(cursor, tokens);
        if (const LexError* error = as_error(result)) {
            log->debug("Lexing stopped: {}", error->message());
            return LexResult(*error);
        }
    }

    log->debug("Lexed {}: {} tokens, {} lines", file_name, tokens.size(), tokens.line_count());
    return LexResult(std::move(tokens));
}

}  // namespace lexer
}  // namespace corvid
