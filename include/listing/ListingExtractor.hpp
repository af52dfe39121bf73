#pragma once
#include "addr/AddressMatcher.hpp"
#include "addr/Lexicon.hpp"
#include "addr/RegionSummarizer.hpp"
#include "listing/BuildingNameExtractor.hpp"
#include "listing/SaleContentReducer.hpp"

#include <string>

namespace listing {

// Every derived field of one title.
struct ListingFields {
    std::string address;
    std::string province_district;  // "city" column downstream
    std::string district_only;
    std::string building;
    std::string sale_content;
    std::string purpose;
};

struct ExtractorConfig {
    bool use_address_fallback = true;
    BuildingConfig building;
};

// Owns the matcher chain over one lexicon. The lexicon must outlive the extractor.
// Not copyable: the components hold references to each other.
class ListingExtractor {
public:
    explicit ListingExtractor(const addr::Lexicon& lex = addr::Lexicon::standard(), ExtractorConfig cfg = {});

    ListingExtractor(const ListingExtractor&) = delete;
    ListingExtractor& operator=(const ListingExtractor&) = delete;

    std::string extract_address(const std::string& title) const;
    std::string extract_province_district(const std::string& title, bool use_address_fallback = true) const;
    std::string extract_district_only(const std::string& title, bool use_address_fallback = true) const;
    std::string extract_building_name(const std::string& title) const;
    std::string extract_sale_content(const std::string& title) const;

    // "오피스텔" when the title mentions one
    std::string purpose(const std::string& title) const;

    ListingFields extract_all(const std::string& title) const;

    const addr::Lexicon& lexicon() const { return m_lex; }
    const addr::AddressMatcher& address_matcher() const { return m_matcher; }
    const addr::RegionSummarizer& region_summarizer() const { return m_summarizer; }
    const BuildingNameExtractor& building_extractor() const { return m_buildings; }
    const SaleContentReducer& sale_reducer() const { return m_reducer; }

private:
    const addr::Lexicon& m_lex;
    ExtractorConfig m_cfg;

    // declaration order is construction order
    addr::AddressMatcher m_matcher;
    addr::RegionSummarizer m_summarizer;
    BuildingNameExtractor m_buildings;
    SaleContentReducer m_reducer;
};

}  // namespace listing
