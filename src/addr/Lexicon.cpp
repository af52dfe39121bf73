#include "addr/Lexicon.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>

namespace addr {

static void add_unique(std::vector<std::string>& v, const std::string& item) {
    if (item.empty()) return;
    if (std::find(v.begin(), v.end(), item) == v.end()) v.push_back(item);
}

Lexicon::Lexicon() {
    m_sejong_canonical = "세종특별자치시";
    m_sejong = {"세종특별자치시", "세종시", "세종"};

    // official form first, then the common abbreviations
    m_provinces = {
        "서울특별시", "서울시", "서울",
        "부산광역시", "부산시", "부산",
        "대구광역시", "대구시", "대구",
        "인천광역시", "인천시", "인천",
        "광주광역시", "광주시", "광주",
        "대전광역시", "대전시", "대전",
        "울산광역시", "울산시", "울산",
        "경기도", "경기",
        "강원특별자치도", "강원도", "강원",
        "충청북도", "충북",
        "충청남도", "충남",
        "전북특별자치도", "전라북도", "전북",
        "전라남도", "전남",
        "경상북도", "경북",
        "경상남도", "경남",
        "제주특별자치도", "제주도", "제주",
    };

    m_canonical = {
        {"서울", "서울특별시"}, {"서울시", "서울특별시"},
        {"부산", "부산광역시"}, {"부산시", "부산광역시"},
        {"대구", "대구광역시"}, {"대구시", "대구광역시"},
        {"인천", "인천광역시"}, {"인천시", "인천광역시"},
        {"광주", "광주광역시"}, {"광주시", "광주광역시"},
        {"대전", "대전광역시"}, {"대전시", "대전광역시"},
        {"울산", "울산광역시"}, {"울산시", "울산광역시"},
        {"경기", "경기도"},
        {"강원", "강원특별자치도"}, {"강원도", "강원특별자치도"},
        {"충북", "충청북도"},
        {"충남", "충청남도"},
        {"전북", "전북특별자치도"}, {"전라북도", "전북특별자치도"},
        {"전남", "전라남도"},
        {"경북", "경상북도"},
        {"경남", "경상남도"},
        {"제주", "제주특별자치도"}, {"제주도", "제주특별자치도"},
        {"세종", "세종특별자치시"}, {"세종시", "세종특별자치시"},
    };

    m_district_suffixes = {"시", "군", "구"};
    m_town_suffixes = {"읍", "면", "동", "가", "리"};
    m_road_suffixes = {"대로", "번길", "로", "길"};
    m_plan_suffixes = {"지구", "구역"};
    m_lot_qualifiers = {"일원", "번지"};
    m_mountain_marker = "산";

    // longer forms before their own tails so has_building_suffix reads naturally
    m_building_suffixes = {
        "해링턴타워", "캐슬플러스", "힐스테이트", "스포츠몰", "연립주택", "주건축물",
        "아이파크", "오피스텔", "해링턴", "팰리스", "팰리움", "스퀘어", "에버빌",
        "프라자", "프라임", "스카이", "아파트", "빌리지",
        "타워", "캐슬", "밸리", "시티", "힐스", "자이", "더힐", "빌라",
        "블록", "블럭", "롯트", "로트", "몰",
    };

    // a space inside a keyword matches any run of whitespace, including none
    m_sale_keywords = {
        "후 개별수의계약 공고",
        "일괄매각", "개별매각", "매각 공고", "재공매", "재매각", "입찰공고", "공고",
    };

    m_quantity_units = {"번지", "개", "호실", "호", "세대", "필지", "동", "층", "평", "건"};
    m_unit_markers = {"동", "층", "호"};
    m_admin_suffixes = {"시", "군", "구", "도"};
    m_unit_ordinal = "제";
    m_besides_word = "외";
    m_officetel_word = "오피스텔";

    m_separators = {",", "/", "·", "ㆍ", "・", "，"};
    m_open_brackets = {"[", "(", "【", "（"};
    m_close_brackets = {"]", ")", "】", "）"};
}

const Lexicon& Lexicon::standard() {
    static const Lexicon lex;
    return lex;
}

std::vector<std::string> Lexicon::provinces_at(const std::string& s, size_t pos, ProvinceKind kind) const {
    const std::vector<std::string>& forms = (kind == ProvinceKind::Sejong) ? m_sejong : m_provinces;

    std::vector<std::string> out;
    for (const auto& f : forms) {
        if (textutil::starts_with_at(s, pos, f)) out.push_back(f);
    }
    std::stable_sort(out.begin(), out.end(), [](const std::string& a, const std::string& b) {
        return a.size() > b.size();
    });
    return out;
}

bool Lexicon::is_province(const std::string& token) const {
    if (std::find(m_provinces.begin(), m_provinces.end(), token) != m_provinces.end()) return true;
    if (std::find(m_sejong.begin(), m_sejong.end(), token) != m_sejong.end()) return true;
    for (const auto& kv : m_canonical) {
        if (kv.second == token) return true;
    }
    return false;
}

std::string Lexicon::canonicalize(const std::string& surface) const {
    auto it = m_canonical.find(surface);
    return it == m_canonical.end() ? surface : it->second;
}

bool Lexicon::has_building_suffix(const std::string& token) const {
    for (const auto& suf : m_building_suffixes) {
        if (textutil::ends_with(token, suf)) return true;
    }
    return false;
}

size_t Lexicon::any_at(const std::vector<std::string>& words, const std::string& s, size_t pos) {
    for (const auto& w : words) {
        if (textutil::starts_with_at(s, pos, w)) return w.size();
    }
    return 0;
}

size_t Lexicon::separator_at(const std::string& s, size_t pos) const {
    return any_at(m_separators, s, pos);
}

size_t Lexicon::open_bracket_at(const std::string& s, size_t pos) const {
    return any_at(m_open_brackets, s, pos);
}

size_t Lexicon::close_bracket_at(const std::string& s, size_t pos) const {
    return any_at(m_close_brackets, s, pos);
}

void Lexicon::add_province_alias(const std::string& surface, const std::string& canonical) {
    if (surface.empty()) return;

    const std::string target = canonical.empty() ? surface : canonicalize(canonical);
    const bool sejong = (target == m_sejong_canonical);

    add_unique(sejong ? m_sejong : m_provinces, surface);
    add_unique(sejong ? m_sejong : m_provinces, target);
    if (surface != target) m_canonical[surface] = target;
}

void Lexicon::add_building_suffix(const std::string& suffix) {
    add_unique(m_building_suffixes, suffix);
}

void Lexicon::add_sale_keyword(const std::string& keyword) {
    add_unique(m_sale_keywords, keyword);
}

}  // namespace addr
