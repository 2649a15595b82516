#ifndef CORVID_LEXER_CURSOR_HPP
#define CORVID_LEXER_CURSOR_HPP

#include "token.hpp"
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace corvid {
namespace lexer {

class TokenStream;

// Scan position within an immutable source buffer. The unconsumed input is
// always the tail code().substr(offset()); positions are plain offsets.
class Cursor {
public:
    explicit Cursor(std::string_view code);

    std::string_view code() const { return code_; }
    std::string_view remaining() const { return code_.substr(pos_); }

    bool at_end() const { return pos_ >= code_.size(); }
    char current() const;                    // '\0' at end of input
    char peek(size_t offset = 1) const;      // '\0' past the end
    bool starts_with(std::string_view prefix) const;

    size_t offset() const { return pos_; }
    uint32_t line() const { return line_; }
    size_t line_start() const { return line_start_; }
    uint32_t column() const { return static_cast<uint32_t>(pos_ - line_start_); }
    SourcePosition position() const { return SourcePosition{pos_, line_, column()}; }

    // Moves past n bytes that are known not to be line breaks.
    void advance(size_t n = 1);

    // Moves past one byte; a '\n' is recorded in the stream's line breaks
    // and starts a new line.
    void advance_tracked(TokenStream& sink);

    // Skips whitespace (tracking line breaks). Returns true if anything was
    // consumed.
    bool skip_whitespace(TokenStream& sink);

    // Source text from start up to the current position.
    std::string_view text_from(size_t start) const { return code_.substr(start, pos_ - start); }

private:
    std::string_view code_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    size_t line_start_ = 0;
};

bool is_whitespace(char c);
bool is_ident_start(char c);
bool is_ident_continue(char c);
bool is_digit(char c);

}  // namespace lexer
}  // namespace corvid

#endif // CORVID_LEXER_CURSOR_HPP
