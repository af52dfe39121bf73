#include "listing/ListingExtractor.hpp"

namespace listing {

ListingExtractor::ListingExtractor(const addr::Lexicon& lex, ExtractorConfig cfg)
    : m_lex(lex),
      m_cfg(cfg),
      m_matcher(lex),
      m_summarizer(lex, m_matcher),
      m_buildings(lex, m_matcher, cfg.building),
      m_reducer(lex, m_matcher, m_summarizer, m_buildings) {}

std::string ListingExtractor::extract_address(const std::string& title) const {
    return m_matcher.extract(title);
}

std::string ListingExtractor::extract_province_district(const std::string& title, bool use_address_fallback) const {
    return m_summarizer.province_district(title, use_address_fallback);
}

std::string ListingExtractor::extract_district_only(const std::string& title, bool use_address_fallback) const {
    return m_summarizer.district_only(title, use_address_fallback);
}

std::string ListingExtractor::extract_building_name(const std::string& title) const {
    auto b = m_buildings.extract(title);
    return b ? b->text : std::string();
}

std::string ListingExtractor::extract_sale_content(const std::string& title) const {
    return m_reducer.reduce(title);
}

std::string ListingExtractor::purpose(const std::string& title) const {
    const std::string& word = m_lex.officetel_word();
    return title.find(word) != std::string::npos ? word : std::string();
}

ListingFields ListingExtractor::extract_all(const std::string& title) const {
    ListingFields f;
    f.address = extract_address(title);

    addr::RegionSummary region = m_summarizer.summarize(title, m_cfg.use_address_fallback);
    f.province_district = region.province_district();
    f.district_only = region.district_only();

    f.building = extract_building_name(title);
    f.sale_content = extract_sale_content(title);
    f.purpose = purpose(title);
    return f;
}

}  // namespace listing
