#pragma once
#include "addr/Lexicon.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace addr {

constexpr size_t kNoMatch = std::string::npos;

// Token scanners shared by the address matcher and the region summarizer.
// Every scanner starts at byte offset pos and returns the offset just past the
// token, or kNoMatch. None of them consume whitespace on their own; see spaced().
class Grammar {
public:
    using Scanner = size_t (Grammar::*)(const std::string&, size_t) const;

    explicit Grammar(const Lexicon& lex) : m_lex(lex) {}

    // offset past leading whitespace and an ordinal ("1. ")
    size_t skip_ordinal(const std::string& s) const;
    // skip_ordinal plus any bracket tags ("[공매] ", "1. [재공매] ")
    size_t skip_prefix(const std::string& s) const;

    // non-Sejong province/metro; must be followed by whitespace
    size_t province(const std::string& s, size_t pos, std::string* surface) const;
    // Sejong token; must end on a word boundary
    size_t sejong(const std::string& s, size_t pos, std::string* surface) const;

    // korean run ending in 시/군/구, followed by whitespace or end of text
    size_t district(const std::string& s, size_t pos) const;
    // suffix-less city name (2+ korean letters) followed by whitespace
    size_t raw_city(const std::string& s, size_t pos) const;
    // 읍/면/동/가/리 token; the part before the suffix needs a korean letter
    size_t town(const std::string& s, size_t pos) const;
    size_t plan_district(const std::string& s, size_t pos) const;
    size_t road(const std::string& s, size_t pos) const;
    // lot list, optional whitespace in front: "산 12-3", "408-3 일원", "123, 124-1"
    size_t lot_list(const std::string& s, size_t pos) const;

    // whitespace (at least one glyph) followed by tok; *token_begin gets the token start
    size_t spaced(const std::string& s, size_t pos, Scanner tok, size_t* token_begin = nullptr) const;

    const Lexicon& lexicon() const { return m_lex; }

private:
    // longest prefix of the korean/digit run at pos that ends in one of suffixes
    size_t suffixed(const std::string& s, size_t pos, const std::vector<std::string>& suffixes,
                    bool body_needs_hangul) const;
    size_t bracket_tag(const std::string& s, size_t pos) const;
    static size_t digits(const std::string& s, size_t pos);
    // "12" or "12-3"; pushes both ends (shorter first) onto ends
    static bool lot_number(const std::string& s, size_t pos, std::vector<size_t>& ends);
    // a lot may end before "외" but not inside a longer word ("3필지")
    bool lot_boundary(const std::string& s, size_t end) const;

    const Lexicon& m_lex;
};

}  // namespace addr
