#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace addr {

enum class ProvinceKind {
    Sejong,
    Other
};

// Closed vocabulary used by every grammar in the engine.
// The default constructor fills in the standard Korean tables; callers may extend
// a copy (see io/JsonIO.hpp) before handing it to the matchers, which only ever
// read from it.
class Lexicon {
public:
    Lexicon();

    // process-wide standard instance
    static const Lexicon& standard();

    // ---- administrative names ----

    // surface forms of the given kind that occur at byte offset pos, longest first
    std::vector<std::string> provinces_at(const std::string& s, size_t pos, ProvinceKind kind) const;

    // any known surface or canonical province/metro name
    bool is_province(const std::string& token) const;

    // abbreviation -> official name; unknown forms come back unchanged
    std::string canonicalize(const std::string& surface) const;

    const std::string& sejong_canonical() const { return m_sejong_canonical; }

    // ---- suffix classes ----
    const std::vector<std::string>& district_suffixes() const { return m_district_suffixes; }
    const std::vector<std::string>& town_suffixes() const { return m_town_suffixes; }
    const std::vector<std::string>& road_suffixes() const { return m_road_suffixes; }
    const std::vector<std::string>& plan_district_suffixes() const { return m_plan_suffixes; }
    const std::vector<std::string>& lot_qualifiers() const { return m_lot_qualifiers; }
    const std::string& mountain_marker() const { return m_mountain_marker; }

    // ---- building / sale vocabulary ----
    const std::vector<std::string>& building_suffixes() const { return m_building_suffixes; }
    const std::vector<std::string>& sale_keywords() const { return m_sale_keywords; }
    const std::vector<std::string>& quantity_units() const { return m_quantity_units; }
    const std::vector<std::string>& unit_markers() const { return m_unit_markers; }
    const std::vector<std::string>& admin_suffixes() const { return m_admin_suffixes; }
    const std::string& unit_ordinal() const { return m_unit_ordinal; }
    const std::string& besides_word() const { return m_besides_word; }
    const std::string& officetel_word() const { return m_officetel_word; }

    bool has_building_suffix(const std::string& token) const;

    // byte length of a separator glyph (comma, slash, middle dots) at pos, 0 if none
    size_t separator_at(const std::string& s, size_t pos) const;

    // byte length of an opening / closing bracket at pos, 0 if none
    size_t open_bracket_at(const std::string& s, size_t pos) const;
    size_t close_bracket_at(const std::string& s, size_t pos) const;

    // ---- extension ----
    void add_province_alias(const std::string& surface, const std::string& canonical);
    void add_building_suffix(const std::string& suffix);
    void add_sale_keyword(const std::string& keyword);

private:
    static size_t any_at(const std::vector<std::string>& words, const std::string& s, size_t pos);

    std::vector<std::string> m_sejong;
    std::vector<std::string> m_provinces;
    std::unordered_map<std::string, std::string> m_canonical;
    std::string m_sejong_canonical;

    std::vector<std::string> m_district_suffixes;
    std::vector<std::string> m_town_suffixes;
    std::vector<std::string> m_road_suffixes;
    std::vector<std::string> m_plan_suffixes;
    std::vector<std::string> m_lot_qualifiers;
    std::string m_mountain_marker;

    std::vector<std::string> m_building_suffixes;
    std::vector<std::string> m_sale_keywords;
    std::vector<std::string> m_quantity_units;
    std::vector<std::string> m_unit_markers;
    std::vector<std::string> m_admin_suffixes;
    std::string m_unit_ordinal;
    std::string m_besides_word;
    std::string m_officetel_word;

    std::vector<std::string> m_separators;
    std::vector<std::string> m_open_brackets;
    std::vector<std::string> m_close_brackets;
};

}  // namespace addr
