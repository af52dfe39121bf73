#include "io/JsonIO.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static std::vector<std::string> require_string_array(const json& j, const char* key, const std::string& where) {
    const json& arr = j.at(key);
    require_array(arr, where + "." + key);

    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "." << key << "[" << i << "] must be a string";
            throw std::runtime_error(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

// missing and null both mean "no title"
static std::string optional_title(const json& obj, const std::string& where) {
    if (!obj.contains("title") || obj.at("title").is_null()) return "";
    if (!obj.at("title").is_string()) {
        throw std::runtime_error(where + ".title must be a string");
    }
    return obj.at("title").get<std::string>();
}

static listing::TitleRecord record_from_json(const json& j, size_t index, const std::string& where) {
    listing::TitleRecord rec;
    rec.id = std::to_string(index + 1);

    if (j.is_null()) {
        rec.source = json::object();
    } else if (j.is_string()) {
        rec.title = j.get<std::string>();
        rec.source = json::object();
    } else {
        require_object(j, where);
        rec.title = optional_title(j, where);
        rec.source = j;
    }
    return rec;
}

static std::ifstream open_in(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("failed to open input file: " + path);
    }
    return in;
}

void applyLexiconOverrides(const json& j, addr::Lexicon& lex) {
    require_object(j, "root");

    if (j.contains("building_suffixes")) {
        for (const auto& s : require_string_array(j, "building_suffixes", "root")) lex.add_building_suffix(s);
    }

    if (j.contains("sale_keywords")) {
        for (const auto& s : require_string_array(j, "sale_keywords", "root")) lex.add_sale_keyword(s);
    }

    if (j.contains("province_aliases")) {
        const json& aliases = j.at("province_aliases");
        require_object(aliases, "root.province_aliases");
        for (auto it = aliases.begin(); it != aliases.end(); ++it) {
            if (!it.value().is_string()) {
                throw std::runtime_error("root.province_aliases." + it.key() + " must be a string");
            }
            lex.add_province_alias(it.key(), it.value().get<std::string>());
        }
    }
}

void loadLexiconOverrides(const std::string& path, addr::Lexicon& lex) {
    std::ifstream in = open_in(path);

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }
    applyLexiconOverrides(j, lex);
}

std::vector<listing::TitleRecord> parseTitleLines(std::istream& in) {
    std::vector<listing::TitleRecord> out;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        listing::TitleRecord rec;
        rec.id = std::to_string(out.size() + 1);
        rec.title = line;
        rec.source = json::object();
        out.push_back(std::move(rec));
    }
    return out;
}

std::vector<listing::TitleRecord> parseTitleJsonl(std::istream& in) {
    std::vector<listing::TitleRecord> out;
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;

        const std::string where = "line " + std::to_string(lineno);
        json j;
        try {
            j = json::parse(line);
        } catch (const std::exception& e) {
            throw std::runtime_error("failed to parse JSON at " + where + ": " + e.what());
        }
        out.push_back(record_from_json(j, out.size(), where));
    }
    return out;
}

std::vector<listing::TitleRecord> parseTitleJson(const json& root) {
    require_array(root, "root");

    std::vector<listing::TitleRecord> out;
    out.reserve(root.size());
    for (size_t i = 0; i < root.size(); ++i) {
        std::ostringstream oss;
        oss << "root[" << i << "]";
        out.push_back(record_from_json(root.at(i), i, oss.str()));
    }
    return out;
}

std::vector<listing::TitleRecord> loadTitleRecords(const std::string& path) {
    std::ifstream in = open_in(path);
    const std::string ext = fs::path(path).extension().string();

    if (ext == ".jsonl") return parseTitleJsonl(in);

    if (ext == ".json") {
        json j;
        try {
            in >> j;
        } catch (const std::exception& e) {
            throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
        }
        return parseTitleJson(j);
    }

    return parseTitleLines(in);
}

json listingRecordToJson(const listing::TitleRecord& rec, const listing::ListingFields& f) {
    json j = rec.source.is_object() ? rec.source : json::object();

    j["title"] = rec.title;
    j["address"] = f.address;
    j["city"] = f.province_district;
    j["district"] = f.district_only;
    j["building"] = f.building;
    j["sale_content"] = f.sale_content;
    j["purpose"] = f.purpose;
    return j;
}
