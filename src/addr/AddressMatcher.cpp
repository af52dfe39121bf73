#include "addr/AddressMatcher.hpp"
#include "text/TextUtil.hpp"

namespace addr {

static constexpr int kMaxTowns = 3;

static const AddressBranch kBranchOrder[] = {
    AddressBranch::Sejong,
    AddressBranch::General,
    AddressBranch::DistrictOnly,
    AddressBranch::ProvinceRawCityTown,
    AddressBranch::ProvinceTown,
};

const char* branch_name(AddressBranch b) {
    switch (b) {
        case AddressBranch::Sejong: return "sejong";
        case AddressBranch::General: return "general";
        case AddressBranch::DistrictOnly: return "district_only";
        case AddressBranch::ProvinceRawCityTown: return "province_raw_city_town";
        case AddressBranch::ProvinceTown: return "province_town";
        default: return "unknown";
    }
}

static std::string slice(const std::string& s, size_t b, size_t e) {
    return s.substr(b, e - b);
}

AddressMatcher::AddressMatcher(const Lexicon& lex) : m_lex(lex), m_grammar(lex) {}

size_t AddressMatcher::more_districts(const std::string& s, size_t pos, AddressMatch& m) const {
    for (;;) {
        size_t b = 0;
        size_t e = m_grammar.spaced(s, pos, &Grammar::district, &b);
        if (e == kNoMatch) break;
        m.districts.push_back(slice(s, b, e));
        pos = e;
    }
    return pos;
}

bool AddressMatcher::tail(const std::string& s, size_t pos, int min_towns, AddressMatch& m) const {
    size_t b = 0;
    size_t e = kNoMatch;

    int towns = 0;
    while (towns < kMaxTowns) {
        e = m_grammar.spaced(s, pos, &Grammar::town, &b);
        if (e == kNoMatch) break;
        m.towns.push_back(slice(s, b, e));
        pos = e;
        ++towns;
    }
    if (towns < min_towns) return false;

    e = m_grammar.spaced(s, pos, &Grammar::plan_district, &b);
    if (e != kNoMatch) {
        m.plan_district = slice(s, b, e);
        pos = e;
    }

    e = m_grammar.spaced(s, pos, &Grammar::road, &b);
    if (e != kNoMatch) {
        m.road = slice(s, b, e);
        pos = e;
    }

    e = m_grammar.lot_list(s, pos);
    if (e != kNoMatch) {
        m.lots = textutil::trim(slice(s, pos, e));
        pos = e;
    }

    m.end = pos;
    return true;
}

bool AddressMatcher::match_sejong(const std::string& s, size_t pos, AddressMatch& m) const {
    size_t e = m_grammar.sejong(s, pos, &m.province);
    if (e == kNoMatch) return false;
    return tail(s, e, 0, m);
}

bool AddressMatcher::match_general(const std::string& s, size_t pos, AddressMatch& m) const {
    size_t e = m_grammar.province(s, pos, &m.province);
    if (e == kNoMatch) return false;

    e = more_districts(s, e, m);
    if (m.districts.empty()) return false;
    return tail(s, e, 0, m);
}

bool AddressMatcher::match_district_only(const std::string& s, size_t pos, AddressMatch& m) const {
    size_t e = m_grammar.district(s, pos);
    if (e == kNoMatch) return false;
    m.districts.push_back(slice(s, pos, e));

    e = more_districts(s, e, m);
    return tail(s, e, 0, m);
}

bool AddressMatcher::match_province_raw_city(const std::string& s, size_t pos, AddressMatch& m) const {
    size_t e = m_grammar.province(s, pos, &m.province);
    if (e == kNoMatch) return false;

    size_t b = 0;
    e = m_grammar.spaced(s, e, &Grammar::raw_city, &b);
    if (e == kNoMatch) return false;
    m.raw_city = slice(s, b, e);

    return tail(s, e, 1, m);
}

bool AddressMatcher::match_province_town(const std::string& s, size_t pos, AddressMatch& m) const {
    size_t e = m_grammar.province(s, pos, &m.province);
    if (e == kNoMatch) return false;
    return tail(s, e, 1, m);
}

std::optional<AddressMatch> AddressMatcher::match_branch(const std::string& title, AddressBranch branch) const {
    const size_t start = m_grammar.skip_prefix(title);
    if (start >= title.size()) return std::nullopt;

    AddressMatch m;
    m.branch = branch;
    m.begin = start;

    bool ok = false;
    switch (branch) {
        case AddressBranch::Sejong:              ok = match_sejong(title, start, m); break;
        case AddressBranch::General:             ok = match_general(title, start, m); break;
        case AddressBranch::DistrictOnly:        ok = match_district_only(title, start, m); break;
        case AddressBranch::ProvinceRawCityTown: ok = match_province_raw_city(title, start, m); break;
        case AddressBranch::ProvinceTown:        ok = match_province_town(title, start, m); break;
    }
    if (!ok || m.end <= m.begin) return std::nullopt;

    m.text = slice(title, m.begin, m.end);
    return m;
}

std::optional<AddressMatch> AddressMatcher::match(const std::string& title) const {
    for (AddressBranch b : kBranchOrder) {
        auto m = match_branch(title, b);
        if (m) return m;
    }
    return std::nullopt;
}

std::string AddressMatcher::extract(const std::string& title) const {
    auto m = match(title);
    return m ? m->text : std::string();
}

}  // namespace addr
