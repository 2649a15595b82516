#ifndef CORVID_LEXER_TOKEN_HPP
#define CORVID_LEXER_TOKEN_HPP

#include "token_kind.hpp"
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace corvid {
namespace lexer {

// Location of a byte in the source buffer.
struct SourcePosition {
    size_t offset = 0;    // absolute byte offset
    uint32_t line = 1;    // 1-based
    uint32_t column = 0;  // 0-based, bytes from the start of the line

    bool operator==(const SourcePosition&) const = default;
};

// Exact source text of a token and where it starts. The slice borrows the
// source buffer, which must outlive it.
struct TokenSpan {
    std::string_view slice;
    uint32_t line = 1;
    uint32_t column = 0;
    size_t offset = 0;

    SourcePosition position() const { return SourcePosition{offset, line, column}; }
};

// Read-only view of one entry of a TokenStream.
struct Token {
    TokenKind kind;
    std::string_view text;
    uint32_t line;
    uint32_t column;
    size_t offset;
};

}  // namespace lexer
}  // namespace corvid

#endif // CORVID_LEXER_TOKEN_HPP
