#ifndef CORVID_LEXER_LEXER_CONFIG_HPP
#define CORVID_LEXER_LEXER_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace corvid {
namespace lexer {

// How an identifier is compared against the keyword table.
enum class KeywordMatch {
    Exact,   // identifier length must equal the keyword length
    Prefix   // leading bytes only; "ifx" lexes as `if` (legacy behaviour)
};

struct LexerConfig {
    KeywordMatch keyword_match = KeywordMatch::Exact;

    // Elements per storage chunk of each token stream sequence
    size_t capacity_hint = 4096;

    // Maximum group/interpolation nesting, 0 for unlimited
    uint32_t max_nesting_depth = 0;
};

}  // namespace lexer
}  // namespace corvid

#endif // CORVID_LEXER_LEXER_CONFIG_HPP
