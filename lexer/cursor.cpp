#include "cursor.hpp"
#include "token_stream.hpp"
#include <algorithm>

namespace corvid {
namespace lexer {

bool is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\f' || c == '\r';
}

bool is_ident_start(char c) {
    return c == '_' || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool is_ident_continue(char c) {
    return is_ident_start(c) || is_digit(c);
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

Cursor::Cursor(std::string_view code) : code_(code) {}

char Cursor::current() const {
    if (at_end()) return '\0';
    return code_[pos_];
}

char Cursor::peek(size_t offset) const {
    if (pos_ + offset >= code_.size()) return '\0';
    return code_[pos_ + offset];
}

bool Cursor::starts_with(std::string_view prefix) const {
    return remaining().substr(0, prefix.size()) == prefix;
}

void Cursor::advance(size_t n) {
    pos_ = std::min(pos_ + n, code_.size());
}

void Cursor::advance_tracked(TokenStream& sink) {
    if (at_end()) return;
    if (code_[pos_] == '\n') {
        sink.add_line_break(pos_);
        ++pos_;
        ++line_;
        line_start_ = pos_;
    } else {
        ++pos_;
    }
}

bool Cursor::skip_whitespace(TokenStream& sink) {
    size_t start = pos_;
    while (!at_end() && is_whitespace(current())) {
        advance_tracked(sink);
    }
    return pos_ != start;
}

}  // namespace lexer
}  // namespace corvid
