#include "listing/SaleContentReducer.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace listing {

using Span = std::pair<size_t, size_t>;

static bool overlaps(const Span& a, const Span& b) {
    return a.first < b.second && b.first < a.second;
}

// first occurrence of needle at or after from that does not touch an existing cut
static size_t find_outside(const std::string& s, const std::string& needle, size_t from,
                           const std::vector<Span>& cuts) {
    size_t at = s.find(needle, from);
    while (at != std::string::npos) {
        Span cand{at, at + needle.size()};
        bool clash = false;
        for (const auto& c : cuts) {
            if (overlaps(cand, c)) {
                clash = true;
                break;
            }
        }
        if (!clash) return at;
        at = s.find(needle, at + 1);
    }
    return std::string::npos;
}

SaleContentReducer::SaleContentReducer(const addr::Lexicon& lex,
                                       const addr::AddressMatcher& matcher,
                                       const addr::RegionSummarizer& summarizer,
                                       const BuildingNameExtractor& buildings)
    : m_lex(lex), m_matcher(matcher), m_summarizer(summarizer), m_buildings(buildings) {}

std::string SaleContentReducer::reduce(const std::string& title) const {
    const size_t start = m_matcher.grammar().skip_prefix(title);

    std::vector<Span> cuts;

    auto address = m_matcher.match(title);
    if (address) cuts.emplace_back(address->begin, address->end);

    // the summary is computed on the original title, then removed from what is left
    const std::string summary = m_summarizer.province_district(title, true);
    if (!summary.empty()) {
        size_t at = find_outside(title, summary, start, cuts);
        if (at != std::string::npos) cuts.emplace_back(at, at + summary.size());
    }

    auto building = m_buildings.extract(title);
    if (building) cuts.emplace_back(building->begin, building->designation_end);

    std::sort(cuts.begin(), cuts.end());

    std::string out;
    out.reserve(title.size());
    size_t pos = start;
    for (const auto& c : cuts) {
        if (c.second <= pos) continue;
        if (c.first > pos) out.append(title, pos, c.first - pos);
        out.push_back(' ');
        pos = std::max(pos, c.second);
    }
    if (pos < title.size()) out.append(title, pos, std::string::npos);

    return normalize(drop_leading_besides(textutil::trim(out)));
}

std::string SaleContentReducer::drop_leading_besides(const std::string& s) const {
    const std::string& besides = m_lex.besides_word();
    if (!textutil::starts_with_at(s, 0, besides)) return s;

    size_t d = textutil::skip_spaces(s, besides.size());
    size_t e = textutil::scan_while(s, d, textutil::is_ascii_digit);
    if (e == d) return s;

    return s.substr(d);
}

std::string SaleContentReducer::normalize(const std::string& s) const {
    const std::string t = textutil::collapse_spaces(s);

    std::string out;
    out.reserve(t.size());
    bool last_sep = false;

    size_t pos = 0;
    while (pos < t.size()) {
        size_t sep = m_lex.separator_at(t, pos);
        if (sep) {
            if (!out.empty() && out.back() == ' ') out.pop_back();
            if (!last_sep) out.append(t, pos, sep);
            last_sep = true;
            pos = textutil::skip_spaces(t, pos + sep);
            continue;
        }

        size_t len = 0;
        textutil::decode_at(t, pos, &len);
        out.append(t, pos, len);
        last_sep = false;
        pos += len;
    }

    // separators left dangling at either end
    size_t b = 0;
    for (size_t sep = m_lex.separator_at(out, b); sep; sep = m_lex.separator_at(out, b)) b += sep;

    size_t e = out.size();
    while (e > b) {
        size_t p = textutil::prev_pos(out, e);
        if (!m_lex.separator_at(out, p) || m_lex.separator_at(out, p) != e - p) break;
        e = p;
    }

    return textutil::trim(out.substr(b, e - b));
}

}  // namespace listing
