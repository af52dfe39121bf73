#include "listing/BuildingNameExtractor.hpp"
#include "text/TextUtil.hpp"

namespace listing {

using textutil::decode_at;

static bool is_candidate_glyph(char32_t c) {
    return textutil::is_word(c) || textutil::is_hyphen(c) || c == 0x00B7;
}

static bool is_trimmed_glyph(char32_t c) {
    return textutil::is_hyphen(c) || c == 0x00B7;
}

static bool is_unit_glyph(char32_t c) {
    return textutil::is_ascii_digit(c) || textutil::is_ascii_alpha(c) || c == '-';
}

static void blank(std::string& work, size_t b, size_t e) {
    for (size_t i = b; i < e && i < work.size(); ++i) work[i] = ' ';
}

// keyword match where a ' ' in the keyword stands for optional whitespace
static size_t keyword_at(const std::string& s, size_t pos, const std::string& kw) {
    size_t i = 0;
    while (i < kw.size()) {
        size_t sp = kw.find(' ', i);
        std::string piece = kw.substr(i, sp == std::string::npos ? std::string::npos : sp - i);
        if (i > 0) pos = textutil::skip_spaces(s, pos);
        if (!piece.empty()) {
            if (!textutil::starts_with_at(s, pos, piece)) return std::string::npos;
            pos += piece.size();
        }
        if (sp == std::string::npos) break;
        i = sp + 1;
    }
    return pos;
}

bool BuildingCandidate::outranks(const BuildingCandidate& other) const {
    if (has_suffix != other.has_suffix) return has_suffix;
    return length > other.length;
}

BuildingNameExtractor::BuildingNameExtractor(const addr::Lexicon& lex, const addr::AddressMatcher& matcher,
                                             BuildingConfig cfg)
    : m_lex(lex), m_matcher(matcher), m_cfg(cfg) {}

std::string BuildingNameExtractor::blank_asides(const std::string& title, size_t from) const {
    std::string work = title;

    size_t pos = from;
    while (pos < work.size()) {
        size_t open = m_lex.open_bracket_at(work, pos);
        if (!open) {
            pos = textutil::next_pos(work, pos);
            continue;
        }

        // nearest closing bracket of any kind
        size_t q = pos + open;
        size_t close_end = std::string::npos;
        while (q < work.size()) {
            size_t close = m_lex.close_bracket_at(work, q);
            if (close) {
                close_end = q + close;
                break;
            }
            q = textutil::next_pos(work, q);
        }

        if (close_end == std::string::npos) {
            pos += open;
            continue;
        }
        blank(work, pos, close_end);
        pos = close_end;
    }
    return work;
}

std::vector<std::pair<size_t, size_t>> BuildingNameExtractor::blank_units(std::string& work, size_t from) const {
    std::vector<std::pair<size_t, size_t>> spans;
    const std::string& ordinal = m_lex.unit_ordinal();

    size_t pos = from;
    while (pos < work.size()) {
        size_t len = 0;
        char32_t c = decode_at(work, pos, &len);
        if (!is_unit_glyph(c)) {
            pos += len;
            continue;
        }

        size_t run_end = textutil::scan_while(work, pos, is_unit_glyph);
        size_t unit_end = std::string::npos;
        for (const auto& marker : m_lex.unit_markers()) {
            if (textutil::starts_with_at(work, run_end, marker)) {
                unit_end = run_end + marker.size();
                break;
            }
        }
        if (unit_end == std::string::npos) {
            pos = run_end;
            continue;
        }

        size_t begin = pos;
        if (pos >= from + ordinal.size() && textutil::ends_with_at(work, pos, ordinal)) begin = pos - ordinal.size();

        blank(work, begin, unit_end);
        spans.emplace_back(begin, unit_end);
        pos = unit_end;
    }
    return spans;
}

size_t BuildingNameExtractor::find_sale_keyword(const std::string& work, size_t from, size_t* kw_end) const {
    for (size_t pos = from; pos < work.size(); pos = textutil::next_pos(work, pos)) {
        for (const auto& kw : m_lex.sale_keywords()) {
            size_t e = keyword_at(work, pos, kw);
            if (e != std::string::npos) {
                if (kw_end) *kw_end = e;
                return pos;
            }
        }
    }
    return std::string::npos;
}

std::vector<std::pair<size_t, size_t>> BuildingNameExtractor::split_segments(const std::string& work, size_t from,
                                                                             size_t to) const {
    std::vector<std::pair<size_t, size_t>> segs;
    const std::string& besides = m_lex.besides_word();

    size_t seg_begin = from;
    size_t pos = from;
    while (pos < to) {
        size_t sep = m_lex.separator_at(work, pos);
        if (sep) {
            segs.emplace_back(seg_begin, pos);
            pos += sep;
            seg_begin = pos;
            continue;
        }

        if (textutil::is_space(decode_at(work, pos))) {
            size_t q = textutil::skip_spaces(work, pos);
            // " 외 " on its own splits like a comma
            if (q < to && textutil::starts_with_at(work, q, besides)) {
                size_t after = q + besides.size();
                size_t r = textutil::skip_spaces(work, after);
                if (r > after && r <= to) {
                    segs.emplace_back(seg_begin, pos);
                    pos = r;
                    seg_begin = pos;
                    continue;
                }
            }
            pos = q;
            continue;
        }

        pos = textutil::next_pos(work, pos);
    }
    segs.emplace_back(seg_begin, to);
    return segs;
}

bool BuildingNameExtractor::is_quantity_token(const std::string& token) const {
    const std::string& besides = m_lex.besides_word();

    size_t p = 0;
    if (textutil::starts_with_at(token, 0, besides) &&
        textutil::is_ascii_digit(decode_at(token, besides.size()))) {
        p = besides.size();
    }

    size_t d = textutil::scan_while(token, p, textutil::is_ascii_digit);
    if (d == p) {
        // a bare unit word such as 호실 or 필지
        for (const auto& unit : m_lex.quantity_units()) {
            if (token == unit) return true;
        }
        return false;
    }

    size_t len = 0;
    if (d < token.size() && textutil::is_hyphen(decode_at(token, d, &len))) {
        size_t d2 = textutil::scan_while(token, d + len, textutil::is_ascii_digit);
        if (d2 > d + len) d = d2;
    }

    if (d == token.size()) return true;
    for (const auto& unit : m_lex.quantity_units()) {
        if (textutil::starts_with_at(token, d, unit)) return true;
    }

    // lot numbers glued to a qualifier and/or "외": 123외, 12-3일원, 123번지외
    for (const auto& qual : m_lex.lot_qualifiers()) {
        if (textutil::starts_with_at(token, d, qual)) {
            d += qual.size();
            break;
        }
    }
    if (d == token.size()) return true;
    return token.compare(d, std::string::npos, besides) == 0;
}

bool BuildingNameExtractor::is_administrative_token(const std::string& token) const {
    if (m_lex.is_province(token)) return true;
    for (const auto& suf : m_lex.admin_suffixes()) {
        if (textutil::ends_with(token, suf)) return true;
    }
    return false;
}

void BuildingNameExtractor::collect(const std::string& title, const std::string& work, size_t from, size_t to,
                                    BuildingScan& out) const {
    for (const auto& seg : split_segments(work, from, to)) {
        size_t pos = seg.first;
        while (pos < seg.second) {
            size_t len = 0;
            char32_t c = decode_at(work, pos, &len);
            if (!is_candidate_glyph(c)) {
                pos += len;
                continue;
            }

            size_t b = pos;
            size_t e = pos;
            while (e < seg.second) {
                size_t l = 0;
                if (!is_candidate_glyph(decode_at(work, e, &l))) break;
                e += l;
            }
            pos = e;

            // hyphens and middle dots never start or end a name
            while (b < e && is_trimmed_glyph(decode_at(work, b))) b = textutil::next_pos(work, b);
            while (e > b && is_trimmed_glyph(textutil::last_before(work, e))) e = textutil::prev_pos(work, e);
            if (b >= e) continue;

            BuildingCandidate cand;
            cand.text = title.substr(b, e - b);
            cand.begin = b;
            cand.end = e;
            cand.length = textutil::glyph_count(cand.text);

            if (cand.length < m_cfg.min_length || is_quantity_token(cand.text) ||
                is_administrative_token(cand.text)) {
                out.rejected.push_back(cand.text);
                continue;
            }

            cand.has_suffix = m_lex.has_building_suffix(cand.text);

            // swallow unit designations that follow the name directly
            cand.designation_end = e;
            for (;;) {
                size_t q = textutil::skip_spaces(title, cand.designation_end);
                bool extended = false;
                for (const auto& span : out.unit_spans) {
                    if (span.first == q) {
                        cand.designation_end = span.second;
                        extended = true;
                        break;
                    }
                }
                if (!extended) break;
            }

            out.accepted.push_back(std::move(cand));
        }
    }
}

BuildingScan BuildingNameExtractor::scan(const std::string& title) const {
    BuildingScan out;

    auto addr = m_matcher.match(title);
    const size_t from = addr ? addr->end : m_matcher.grammar().skip_prefix(title);
    out.region_begin = from;

    std::string work = blank_asides(title, from);
    out.unit_spans = blank_units(work, from);

    size_t stop = find_sale_keyword(work, from);
    out.region_end = (stop == std::string::npos) ? work.size() : stop;

    collect(title, work, from, out.region_end, out);
    return out;
}

std::optional<BuildingCandidate> BuildingNameExtractor::extract(const std::string& title) const {
    BuildingScan sc = scan(title);

    const BuildingCandidate* best = nullptr;
    for (const auto& c : sc.accepted) {
        if (!best || c.outranks(*best)) best = &c;
    }
    if (!best) return std::nullopt;
    return *best;
}

}  // namespace listing
