#include "text/TextUtil.hpp"

namespace textutil {

char32_t decode_at(const std::string& s, size_t pos, size_t* len) {
    if (pos >= s.size()) {
        if (len) *len = 0;
        return 0;
    }

    unsigned char b0 = (unsigned char)s[pos];
    size_t need = 0;
    char32_t cp = 0;

    if (b0 < 0x80) {
        if (len) *len = 1;
        return b0;
    } else if ((b0 & 0xE0) == 0xC0) {
        need = 1; cp = b0 & 0x1F;
    } else if ((b0 & 0xF0) == 0xE0) {
        need = 2; cp = b0 & 0x0F;
    } else if ((b0 & 0xF8) == 0xF0) {
        need = 3; cp = b0 & 0x07;
    } else {
        if (len) *len = 1;
        return kReplacement;
    }

    if (pos + need >= s.size()) {
        if (len) *len = 1;
        return kReplacement;
    }

    for (size_t k = 1; k <= need; ++k) {
        unsigned char b = (unsigned char)s[pos + k];
        if ((b & 0xC0) != 0x80) {
            if (len) *len = 1;
            return kReplacement;
        }
        cp = (cp << 6) | (b & 0x3F);
    }

    // overlong forms and surrogates are not valid scalar values
    bool overlong = (need == 1 && cp < 0x80) || (need == 2 && cp < 0x800) || (need == 3 && cp < 0x10000);
    if (overlong || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
        if (len) *len = 1;
        return kReplacement;
    }

    if (len) *len = need + 1;
    return cp;
}

size_t next_pos(const std::string& s, size_t pos) {
    if (pos >= s.size()) return s.size();
    size_t len = 0;
    decode_at(s, pos, &len);
    return pos + len;
}

size_t prev_pos(const std::string& s, size_t pos) {
    if (pos == 0) return 0;
    if (pos > s.size()) pos = s.size();

    // walk back over continuation bytes (at most 3), then verify the lead decodes to reach pos
    size_t start = pos - 1;
    size_t steps = 0;
    while (start > 0 && steps < 3 && (((unsigned char)s[start]) & 0xC0) == 0x80) {
        --start;
        ++steps;
    }
    size_t len = 0;
    decode_at(s, start, &len);
    if (start + len == pos) return start;
    return pos - 1;
}

char32_t last_before(const std::string& s, size_t end) {
    if (end == 0) return 0;
    return decode_at(s, prev_pos(s, end));
}

size_t glyph_count(const std::string& s) {
    return glyph_count(s, 0, s.size());
}

size_t glyph_count(const std::string& s, size_t begin, size_t end) {
    size_t n = 0;
    size_t pos = begin;
    while (pos < end && pos < s.size()) {
        pos = next_pos(s, pos);
        ++n;
    }
    return n;
}

bool is_hangul(char32_t c) {
    return c >= 0xAC00 && c <= 0xD7A3;
}

bool is_ascii_digit(char32_t c) {
    return c >= '0' && c <= '9';
}

bool is_ascii_alpha(char32_t c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_space(char32_t c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v' ||
           c == 0x00A0 || c == 0x3000;
}

bool is_hyphen(char32_t c) {
    switch (c) {
        case '-':
        case 0x2010: // hyphen
        case 0x2011: // non-breaking hyphen
        case 0x2012: // figure dash
        case 0x2013: // en dash
        case 0x2014: // em dash
        case 0x2015: // horizontal bar
        case 0x2212: // minus sign
        case 0xFE63: // small hyphen-minus
        case 0xFF0D: // fullwidth hyphen-minus
            return true;
        default:
            return false;
    }
}

bool is_word(char32_t c) {
    return is_hangul(c) || is_ascii_alpha(c) || is_ascii_digit(c);
}

bool starts_with_at(const std::string& s, size_t pos, const std::string& w) {
    if (w.empty() || pos > s.size() || s.size() - pos < w.size()) return false;
    return s.compare(pos, w.size(), w) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return ends_with_at(s, s.size(), suffix);
}

bool ends_with_at(const std::string& s, size_t end, const std::string& suffix) {
    if (suffix.empty() || end > s.size() || end < suffix.size()) return false;
    return s.compare(end - suffix.size(), suffix.size(), suffix) == 0;
}

size_t skip_spaces(const std::string& s, size_t pos) {
    return scan_while(s, pos, is_space);
}

std::string trim(const std::string& s) {
    size_t i = skip_spaces(s, 0);
    size_t j = s.size();
    while (j > i) {
        size_t p = prev_pos(s, j);
        if (!is_space(decode_at(s, p))) break;
        j = p;
    }
    return s.substr(i, j - i);
}

std::string collapse_spaces(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    size_t pos = 0;
    while (pos < s.size()) {
        size_t len = 0;
        char32_t c = decode_at(s, pos, &len);
        if (is_space(c)) {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
        } else {
            out.append(s, pos, len);
            prev_space = false;
        }
        pos += len;
    }

    // trim trailing space
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

}
