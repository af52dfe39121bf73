#include "addr/RegionSummarizer.hpp"

namespace addr {

const char* shape_name(RegionShape s) {
    switch (s) {
        case RegionShape::None: return "none";
        case RegionShape::ProvinceDistrict: return "province_district";
        case RegionShape::Sejong: return "sejong";
        case RegionShape::DistrictOnly: return "district_only";
        case RegionShape::ProvinceRawCity: return "province_raw_city";
        case RegionShape::ProvinceOnly: return "province_only";
        default: return "unknown";
    }
}

static std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += ' ';
        out += parts[i];
    }
    return out;
}

std::string RegionSummary::province_district() const {
    switch (shape) {
        case RegionShape::ProvinceDistrict: return province + " " + join(districts);
        case RegionShape::Sejong:           return province;
        case RegionShape::DistrictOnly:     return join(districts);
        case RegionShape::ProvinceRawCity:  return province + " " + raw_city;
        case RegionShape::ProvinceOnly:     return province;
        default:                            return "";
    }
}

std::string RegionSummary::district_only() const {
    switch (shape) {
        case RegionShape::ProvinceDistrict:
        case RegionShape::DistrictOnly:     return join(districts);
        case RegionShape::ProvinceRawCity:  return raw_city;
        default:                            return "";
    }
}

RegionSummarizer::RegionSummarizer(const Lexicon& lex, const AddressMatcher& matcher)
    : m_lex(lex), m_matcher(matcher), m_grammar(matcher.grammar()) {}

bool RegionSummarizer::province_districts(const std::string& s, size_t pos, RegionSummary& out) const {
    std::string surface;
    size_t e = m_grammar.province(s, pos, &surface);
    if (e == kNoMatch) return false;

    size_t b = 0;
    size_t d1 = m_grammar.spaced(s, e, &Grammar::district, &b);
    if (d1 == kNoMatch) return false;

    out.shape = RegionShape::ProvinceDistrict;
    out.province = m_lex.canonicalize(surface);
    out.districts.push_back(s.substr(b, d1 - b));

    size_t d2 = m_grammar.spaced(s, d1, &Grammar::district, &b);
    if (d2 != kNoMatch) out.districts.push_back(s.substr(b, d2 - b));
    return true;
}

bool RegionSummarizer::sejong_only(const std::string& s, size_t pos, RegionSummary& out) const {
    std::string surface;
    if (m_grammar.sejong(s, pos, &surface) == kNoMatch) return false;

    out.shape = RegionShape::Sejong;
    out.province = m_lex.canonicalize(surface);
    return true;
}

bool RegionSummarizer::districts_only(const std::string& s, size_t pos, RegionSummary& out) const {
    size_t d1 = m_grammar.district(s, pos);
    if (d1 == kNoMatch) return false;

    out.shape = RegionShape::DistrictOnly;
    out.districts.push_back(s.substr(pos, d1 - pos));

    size_t b = 0;
    size_t d2 = m_grammar.spaced(s, d1, &Grammar::district, &b);
    if (d2 != kNoMatch) out.districts.push_back(s.substr(b, d2 - b));
    return true;
}

bool RegionSummarizer::province_raw_city(const std::string& s, size_t pos, RegionSummary& out) const {
    std::string surface;
    size_t e = m_grammar.province(s, pos, &surface);
    if (e == kNoMatch) return false;

    size_t b = 0;
    size_t c = m_grammar.spaced(s, e, &Grammar::raw_city, &b);
    if (c == kNoMatch) return false;
    if (m_grammar.spaced(s, c, &Grammar::town) == kNoMatch) return false;

    out.shape = RegionShape::ProvinceRawCity;
    out.province = m_lex.canonicalize(surface);
    out.raw_city = s.substr(b, c - b);
    return true;
}

bool RegionSummarizer::province_town(const std::string& s, size_t pos, RegionSummary& out) const {
    std::string surface;
    size_t e = m_grammar.province(s, pos, &surface);
    if (e == kNoMatch) return false;
    if (m_grammar.spaced(s, e, &Grammar::town) == kNoMatch) return false;

    out.shape = RegionShape::ProvinceOnly;
    out.province = m_lex.canonicalize(surface);
    return true;
}

RegionSummary RegionSummarizer::summarize(const std::string& title, bool use_address_fallback) const {
    static const Rule rules[] = {
        &RegionSummarizer::province_districts,
        &RegionSummarizer::sejong_only,
        &RegionSummarizer::districts_only,
        &RegionSummarizer::province_raw_city,
        &RegionSummarizer::province_town,
    };

    // raw-title rules only know the ordinal; bracket tags are left to the address fallback
    const size_t start = m_grammar.skip_ordinal(title);

    // the address is only needed once a rule misses on the raw title
    std::string address;
    bool address_ready = false;

    for (Rule rule : rules) {
        RegionSummary out;
        if ((this->*rule)(title, start, out)) return out;

        if (!use_address_fallback) continue;
        if (!address_ready) {
            address = m_matcher.extract(title);
            address_ready = true;
        }
        if (address.empty()) continue;

        out = RegionSummary{};
        if ((this->*rule)(address, 0, out)) {
            out.from_address = true;
            return out;
        }
    }
    return RegionSummary{};
}

std::string RegionSummarizer::province_district(const std::string& title, bool use_address_fallback) const {
    return summarize(title, use_address_fallback).province_district();
}

std::string RegionSummarizer::district_only(const std::string& title, bool use_address_fallback) const {
    return summarize(title, use_address_fallback).district_only();
}

}  // namespace addr
