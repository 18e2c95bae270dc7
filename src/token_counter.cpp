#include "code_atlas/token_counter.hpp"
#include <cctype>

namespace code_atlas {

namespace {

bool is_word_char(unsigned char c) {
    // UTF-8 continuation / lead bytes are treated as word characters
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

} // namespace

std::size_t estimate_tokens(std::string_view text) {
    std::size_t tokens = 0;
    std::size_t i = 0;
    const std::size_t n = text.size();

    while (i < n) {
        unsigned char c = static_cast<unsigned char>(text[i]);

        if (is_word_char(c)) {
            std::size_t start = i;
            while (i < n && is_word_char(static_cast<unsigned char>(text[i]))) ++i;
            tokens += (i - start + 3) / 4;
        } else if (c == '\n' || c == '\r') {
            while (i < n && (text[i] == '\n' || text[i] == '\r')) ++i;
            ++tokens;
        } else if (std::isspace(c)) {
            ++i;
        } else {
            ++tokens;
            ++i;
        }
    }
    return tokens;
}

} // namespace code_atlas
