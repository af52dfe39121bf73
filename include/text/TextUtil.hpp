#pragma once
#include <cstddef>
#include <string>

namespace textutil {

constexpr char32_t kReplacement = 0xFFFD;

// decode one UTF-8 code point at byte offset pos; malformed input yields U+FFFD.
// *len receives the number of bytes consumed (always >= 1 when pos < s.size()).
char32_t decode_at(const std::string& s, size_t pos, size_t* len = nullptr);

// byte offset of the glyph after / before the one at pos
size_t next_pos(const std::string& s, size_t pos);
size_t prev_pos(const std::string& s, size_t pos);

// last code point before byte offset end (0 if end == 0)
char32_t last_before(const std::string& s, size_t end);

size_t glyph_count(const std::string& s);
size_t glyph_count(const std::string& s, size_t begin, size_t end);

bool is_hangul(char32_t c);       // precomposed syllables only
bool is_ascii_digit(char32_t c);
bool is_ascii_alpha(char32_t c);
bool is_space(char32_t c);        // ASCII whitespace, NBSP, ideographic space
bool is_hyphen(char32_t c);       // '-' and the Unicode dash family
bool is_word(char32_t c);         // hangul, latin letter or digit

bool starts_with_at(const std::string& s, size_t pos, const std::string& w);
bool ends_with(const std::string& s, const std::string& suffix);
bool ends_with_at(const std::string& s, size_t end, const std::string& suffix);

size_t skip_spaces(const std::string& s, size_t pos);

// end of the run of glyphs starting at pos for which pred holds
template <typename Pred>
size_t scan_while(const std::string& s, size_t pos, Pred pred) {
    while (pos < s.size()) {
        size_t len = 0;
        char32_t c = decode_at(s, pos, &len);
        if (!pred(c)) break;
        pos += len;
    }
    return pos;
}

// trim unicode whitespace at both ends
std::string trim(const std::string& s);

// every whitespace run becomes a single ' ', ends trimmed
std::string collapse_spaces(const std::string& s);

}
