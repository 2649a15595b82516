#include "token_stream.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace corvid {
namespace lexer {

namespace {

size_t decimal_width(size_t n) {
    size_t width = 1;
    while (n >= 10) {
        n /= 10;
        ++width;
    }
    return width;
}

}  // namespace

TokenStream::TokenStream(std::string_view code, size_t capacity_hint)
    : code_(code),
      line_breaks_(capacity_hint),
      spans_(capacity_hint),
      kinds_(capacity_hint) {}

Token TokenStream::operator[](size_t index) const {
    const TokenSpan& span = spans_[index];
    return Token{kinds_[index], span.slice, span.line, span.column, span.offset};
}

Token TokenStream::at(size_t index) const {
    if (index >= size()) {
        throw std::out_of_range("Token index " + std::to_string(index) +
                                " out of range (size " + std::to_string(size()) + ")");
    }
    return (*this)[index];
}

void TokenStream::push(TokenKind kind, const TokenSpan& span) {
    kinds_.push_back(kind);
    spans_.push_back(span);
}

void TokenStream::add_line_break(size_t offset) {
    if (!line_breaks_.empty() && offset <= line_breaks_.back()) {
        throw std::logic_error("Line break offsets must be strictly increasing");
    }
    line_breaks_.push_back(offset);
}

std::string TokenStream::to_string() const {
    size_t line_width = 1;
    size_t col_width = 1;
    size_t kind_width = 0;
    for (size_t i = 0; i < size(); ++i) {
        const TokenSpan& span = spans_[i];
        line_width = std::max(line_width, decimal_width(span.line));
        col_width = std::max(col_width, decimal_width(span.column));
        kind_width = std::max(kind_width, token_kind_name(kinds_[i]).size());
    }

    std::ostringstream ss;
    for (size_t i = 0; i < size(); ++i) {
        const TokenSpan& span = spans_[i];
        ss << std::right << std::setw(static_cast<int>(line_width)) << span.line << ':'
           << std::left << std::setw(static_cast<int>(col_width)) << span.column << "   "
           << std::left << std::setw(static_cast<int>(kind_width)) << token_kind_name(kinds_[i])
           << "   " << span.slice << '\n';
    }
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const TokenStream& tokens) {
    return os << tokens.to_string();
}

}  // namespace lexer
}  // namespace corvid
