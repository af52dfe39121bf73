#pragma once
#include "addr/Grammar.hpp"
#include "addr/Lexicon.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace addr {

// Tried in declaration order; the first branch that accepts the title wins.
enum class AddressBranch {
    Sejong,               // 세종 [towns] [plan] [road] [lots]
    General,              // province district+ [towns] ...
    DistrictOnly,         // district+ [towns] ...
    ProvinceRawCityTown,  // province raw-city town{1,3} ...
    ProvinceTown          // province town{1,3} ...
};

const char* branch_name(AddressBranch b);

struct AddressMatch {
    AddressBranch branch = AddressBranch::General;

    // byte span in the title passed to match(); text == title.substr(begin, end - begin)
    size_t begin = 0;
    size_t end = 0;
    std::string text;

    std::string province;                 // surface form as written, empty for DistrictOnly
    std::vector<std::string> districts;
    std::string raw_city;
    std::vector<std::string> towns;
    std::string plan_district;
    std::string road;
    std::string lots;
};

class AddressMatcher {
public:
    explicit AddressMatcher(const Lexicon& lex);

    // longest administrative-to-lot span anchored after the title prefix
    std::optional<AddressMatch> match(const std::string& title) const;

    // one branch in isolation, ignoring priority
    std::optional<AddressMatch> match_branch(const std::string& title, AddressBranch branch) const;

    // match()->text, or "" when nothing matches
    std::string extract(const std::string& title) const;

    const Grammar& grammar() const { return m_grammar; }
    const Lexicon& lexicon() const { return m_lex; }

private:
    bool match_sejong(const std::string& s, size_t pos, AddressMatch& m) const;
    bool match_general(const std::string& s, size_t pos, AddressMatch& m) const;
    bool match_district_only(const std::string& s, size_t pos, AddressMatch& m) const;
    bool match_province_raw_city(const std::string& s, size_t pos, AddressMatch& m) const;
    bool match_province_town(const std::string& s, size_t pos, AddressMatch& m) const;

    // district tokens after pos (whitespace separated); returns the new end
    size_t more_districts(const std::string& s, size_t pos, AddressMatch& m) const;

    // towns{min_towns,3} [plan] [road] [lots]; sets m.end, false if too few towns
    bool tail(const std::string& s, size_t pos, int min_towns, AddressMatch& m) const;

    const Lexicon& m_lex;
    Grammar m_grammar;
};

}  // namespace addr
