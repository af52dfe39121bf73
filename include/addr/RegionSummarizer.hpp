#pragma once
#include "addr/AddressMatcher.hpp"
#include "addr/Grammar.hpp"
#include "addr/Lexicon.hpp"

#include <string>
#include <vector>

namespace addr {

enum class RegionShape {
    None,
    ProvinceDistrict,  // 경기도 수원시 팔달구
    Sejong,            // 세종특별자치시
    DistrictOnly,      // 전주시 완산구
    ProvinceRawCity,   // 경기도 파주
    ProvinceOnly       // 인천광역시
};

const char* shape_name(RegionShape s);

struct RegionSummary {
    RegionShape shape = RegionShape::None;
    std::string province;                // canonical form
    std::vector<std::string> districts;  // at most two
    std::string raw_city;
    bool from_address = false;           // matched only on the extracted address

    // "canonical-province district..." and friends; "" for None
    std::string province_district() const;
    // districts / raw city; "" for Sejong, ProvinceOnly and None
    std::string district_only() const;
};

class RegionSummarizer {
public:
    RegionSummarizer(const Lexicon& lex, const AddressMatcher& matcher);

    RegionSummary summarize(const std::string& title, bool use_address_fallback = true) const;

    std::string province_district(const std::string& title, bool use_address_fallback = true) const;
    std::string district_only(const std::string& title, bool use_address_fallback = true) const;

private:
    using Rule = bool (RegionSummarizer::*)(const std::string&, size_t, RegionSummary&) const;

    bool province_districts(const std::string& s, size_t pos, RegionSummary& out) const;
    bool sejong_only(const std::string& s, size_t pos, RegionSummary& out) const;
    bool districts_only(const std::string& s, size_t pos, RegionSummary& out) const;
    bool province_raw_city(const std::string& s, size_t pos, RegionSummary& out) const;
    bool province_town(const std::string& s, size_t pos, RegionSummary& out) const;

    const Lexicon& m_lex;
    const AddressMatcher& m_matcher;
    const Grammar& m_grammar;
};

}  // namespace addr
