#include "addr/Grammar.hpp"
#include "text/TextUtil.hpp"

namespace addr {

using textutil::decode_at;

static bool is_hangul_or_digit(char32_t c) {
    return textutil::is_hangul(c) || textutil::is_ascii_digit(c);
}

static bool followed_by_space(const std::string& s, size_t end) {
    return end < s.size() && textutil::is_space(decode_at(s, end));
}

size_t Grammar::digits(const std::string& s, size_t pos) {
    size_t e = textutil::scan_while(s, pos, textutil::is_ascii_digit);
    return e == pos ? kNoMatch : e;
}

size_t Grammar::bracket_tag(const std::string& s, size_t pos) const {
    if (!textutil::starts_with_at(s, pos, "[") && !textutil::starts_with_at(s, pos, "【")) return kNoMatch;

    size_t p = textutil::next_pos(s, pos);
    while (p < s.size()) {
        size_t close = m_lex.close_bracket_at(s, p);
        if (close) return p + close;
        p = textutil::next_pos(s, p);
    }
    return kNoMatch;
}

size_t Grammar::skip_ordinal(const std::string& s) const {
    size_t pos = textutil::skip_spaces(s, 0);
    size_t d = digits(s, pos);
    if (d != kNoMatch && d < s.size() && s[d] == '.') pos = textutil::skip_spaces(s, d + 1);
    return pos;
}

size_t Grammar::skip_prefix(const std::string& s) const {
    size_t pos = textutil::skip_spaces(s, 0);

    bool changed = true;
    while (changed && pos < s.size()) {
        changed = false;

        size_t d = digits(s, pos);
        if (d != kNoMatch && d < s.size() && s[d] == '.') {
            pos = textutil::skip_spaces(s, d + 1);
            changed = true;
            continue;
        }

        size_t b = bracket_tag(s, pos);
        if (b != kNoMatch) {
            pos = textutil::skip_spaces(s, b);
            changed = true;
        }
    }
    return pos;
}

size_t Grammar::province(const std::string& s, size_t pos, std::string* surface) const {
    for (const auto& form : m_lex.provinces_at(s, pos, ProvinceKind::Other)) {
        size_t end = pos + form.size();
        if (followed_by_space(s, end)) {
            if (surface) *surface = form;
            return end;
        }
    }
    return kNoMatch;
}

size_t Grammar::sejong(const std::string& s, size_t pos, std::string* surface) const {
    for (const auto& form : m_lex.provinces_at(s, pos, ProvinceKind::Sejong)) {
        size_t end = pos + form.size();
        if (end >= s.size() || !textutil::is_word(decode_at(s, end))) {
            if (surface) *surface = form;
            return end;
        }
    }
    return kNoMatch;
}

size_t Grammar::district(const std::string& s, size_t pos) const {
    size_t end = textutil::scan_while(s, pos, textutil::is_hangul);
    if (end == pos) return kNoMatch;
    if (end < s.size() && !textutil::is_space(decode_at(s, end))) return kNoMatch;
    if (textutil::glyph_count(s, pos, end) < 2) return kNoMatch;

    for (const auto& suf : m_lex.district_suffixes()) {
        if (textutil::ends_with_at(s, end, suf)) return end;
    }
    return kNoMatch;
}

size_t Grammar::raw_city(const std::string& s, size_t pos) const {
    size_t end = textutil::scan_while(s, pos, textutil::is_hangul);
    if (textutil::glyph_count(s, pos, end) < 2) return kNoMatch;
    if (!followed_by_space(s, end)) return kNoMatch;
    return end;
}

size_t Grammar::suffixed(const std::string& s, size_t pos, const std::vector<std::string>& suffixes,
                         bool body_needs_hangul) const {
    const size_t run_end = textutil::scan_while(s, pos, is_hangul_or_digit);

    for (size_t e = run_end; e > pos; e = textutil::prev_pos(s, e)) {
        for (const auto& suf : suffixes) {
            if (!textutil::ends_with_at(s, e, suf)) continue;
            const size_t body_end = e - suf.size();
            if (body_end <= pos) continue;

            if (body_needs_hangul) {
                size_t first_hangul = textutil::scan_while(s, pos, textutil::is_ascii_digit);
                if (first_hangul >= body_end) continue;
            }
            return e;
        }
    }
    return kNoMatch;
}

size_t Grammar::town(const std::string& s, size_t pos) const {
    return suffixed(s, pos, m_lex.town_suffixes(), true);
}

size_t Grammar::plan_district(const std::string& s, size_t pos) const {
    return suffixed(s, pos, m_lex.plan_district_suffixes(), false);
}

size_t Grammar::road(const std::string& s, size_t pos) const {
    return suffixed(s, pos, m_lex.road_suffixes(), false);
}

bool Grammar::lot_number(const std::string& s, size_t pos, std::vector<size_t>& ends) {
    size_t d = digits(s, pos);
    if (d == kNoMatch) return false;
    ends.push_back(d);

    size_t len = 0;
    if (d < s.size() && textutil::is_hyphen(decode_at(s, d, &len))) {
        size_t d2 = digits(s, d + len);
        if (d2 != kNoMatch) ends.push_back(d2);
    }
    return true;
}

bool Grammar::lot_boundary(const std::string& s, size_t end) const {
    if (end >= s.size()) return true;
    if (textutil::starts_with_at(s, end, m_lex.besides_word())) return true;
    char32_t c = decode_at(s, end);
    return !textutil::is_word(c) && !textutil::is_hyphen(c);
}

size_t Grammar::lot_list(const std::string& s, size_t pos) const {
    size_t p = textutil::skip_spaces(s, pos);

    const std::string& mountain = m_lex.mountain_marker();
    if (textutil::starts_with_at(s, p, mountain)) {
        size_t q = textutil::skip_spaces(s, p + mountain.size());
        if (digits(s, q) != kNoMatch) p = q;
    }

    // every place the lot list could stop, in the order it was extended
    std::vector<size_t> ends;
    if (!lot_number(s, p, ends)) return kNoMatch;

    size_t cur = ends.back();
    size_t q = textutil::skip_spaces(s, cur);
    for (const auto& qual : m_lex.lot_qualifiers()) {
        if (textutil::starts_with_at(s, q, qual)) {
            cur = q + qual.size();
            ends.push_back(cur);
            break;
        }
    }

    for (;;) {
        size_t c = textutil::skip_spaces(s, cur);
        if (c >= s.size() || s[c] != ',') break;
        size_t n = textutil::skip_spaces(s, c + 1);
        if (!lot_number(s, n, ends)) break;
        cur = ends.back();
    }

    // prefer the longest list whose last number is not glued to a following word
    for (size_t i = ends.size(); i-- > 0;) {
        if (lot_boundary(s, ends[i])) return ends[i];
    }
    return kNoMatch;
}

size_t Grammar::spaced(const std::string& s, size_t pos, Scanner tok, size_t* token_begin) const {
    if (pos == kNoMatch) return kNoMatch;
    size_t q = textutil::skip_spaces(s, pos);
    if (q == pos || q >= s.size()) return kNoMatch;

    size_t e = (this->*tok)(s, q);
    if (e != kNoMatch && token_begin) *token_begin = q;
    return e;
}

}  // namespace addr
