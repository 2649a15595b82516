#ifndef CORVID_LEXER_TOKEN_STREAM_HPP
#define CORVID_LEXER_TOKEN_STREAM_HPP

#include "token.hpp"
#include <common/append_vec.hpp>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace corvid {
namespace lexer {

// Tokens of one source file, stored as three index-aligned append-only
// sequences: spans()[i] and kinds()[i] describe token i. line_breaks() holds
// the offset of every '\n' the lexer went over, in increasing order.
class TokenStream {
public:
    explicit TokenStream(std::string_view code, size_t capacity_hint = 4096);

    TokenStream(TokenStream&&) noexcept = default;
    TokenStream& operator=(TokenStream&&) noexcept = default;

    std::string_view code() const { return code_; }

    const AppendVec<size_t>& line_breaks() const { return line_breaks_; }
    const AppendVec<TokenSpan>& spans() const { return spans_; }
    const AppendVec<TokenKind>& kinds() const { return kinds_; }

    size_t size() const { return kinds_.size(); }
    bool empty() const { return kinds_.empty(); }

    // Number of physical lines seen so far (line breaks + 1).
    size_t line_count() const { return line_breaks_.size() + 1; }

    Token operator[](size_t index) const;
    Token at(size_t index) const;

    void push(TokenKind kind, const TokenSpan& span);
    void add_line_break(size_t offset);

    // One line per token: "<line>:<col>   <kind>   <slice>", padded to the
    // widest line, column and kind in the stream.
    std::string to_string() const;

private:
    std::string_view code_;
    AppendVec<size_t> line_breaks_;
    AppendVec<TokenSpan> spans_;
    AppendVec<TokenKind> kinds_;
};

std::ostream& operator<<(std::ostream& os, const TokenStream& tokens);

}  // namespace lexer
}  // namespace corvid

#endif // CORVID_LEXER_TOKEN_STREAM_HPP
