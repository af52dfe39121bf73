#pragma once
#include "addr/AddressMatcher.hpp"
#include "addr/Lexicon.hpp"
#include "addr/RegionSummarizer.hpp"
#include "listing/BuildingNameExtractor.hpp"

#include <string>

namespace listing {

class SaleContentReducer {
public:
    SaleContentReducer(const addr::Lexicon& lex,
                       const addr::AddressMatcher& matcher,
                       const addr::RegionSummarizer& summarizer,
                       const BuildingNameExtractor& buildings);

    // title minus address, region summary and building name; never fails
    std::string reduce(const std::string& title) const;

    // "외 8개 ..." -> "8개 ..."
    std::string drop_leading_besides(const std::string& s) const;

    // whitespace runs, spaces around separators, repeated and dangling separators
    std::string normalize(const std::string& s) const;

private:
    const addr::Lexicon& m_lex;
    const addr::AddressMatcher& m_matcher;
    const addr::RegionSummarizer& m_summarizer;
    const BuildingNameExtractor& m_buildings;
};

}  // namespace listing
