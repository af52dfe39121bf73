#pragma once
#include "addr/AddressMatcher.hpp"
#include "addr/Lexicon.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace listing {

struct BuildingConfig {
    size_t min_length = 3;  // in code points
};

struct BuildingCandidate {
    std::string text;

    // byte span of text in the title
    size_t begin = 0;
    size_t end = 0;

    // end of the unit designations (101동, 제3층, 202호) right after the name
    size_t designation_end = 0;

    bool has_suffix = false;
    size_t length = 0;  // code points

    // compares (has_suffix, length)
    bool outranks(const BuildingCandidate& other) const;
};

// Everything the extractor looked at, for diagnostics.
struct BuildingScan {
    size_t region_begin = 0;   // first byte after the address (or the title prefix)
    size_t region_end = 0;     // sale keyword or end of title
    std::vector<std::pair<size_t, size_t>> unit_spans;
    std::vector<BuildingCandidate> accepted;
    std::vector<std::string> rejected;
};

class BuildingNameExtractor {
public:
    BuildingNameExtractor(const addr::Lexicon& lex, const addr::AddressMatcher& matcher,
                          BuildingConfig cfg = {});

    std::optional<BuildingCandidate> extract(const std::string& title) const;
    BuildingScan scan(const std::string& title) const;

    bool is_quantity_token(const std::string& token) const;
    bool is_administrative_token(const std::string& token) const;

    const BuildingConfig& config() const { return m_cfg; }

private:
    // same-length copy of title with asides and unit tokens overwritten by spaces
    std::string blank_asides(const std::string& title, size_t from) const;
    std::vector<std::pair<size_t, size_t>> blank_units(std::string& work, size_t from) const;
    size_t find_sale_keyword(const std::string& work, size_t from, size_t* kw_end = nullptr) const;
    std::vector<std::pair<size_t, size_t>> split_segments(const std::string& work, size_t from, size_t to) const;
    void collect(const std::string& title, const std::string& work, size_t from, size_t to, BuildingScan& out) const;

    const addr::Lexicon& m_lex;
    const addr::AddressMatcher& m_matcher;
    BuildingConfig m_cfg;
};

}  // namespace listing
