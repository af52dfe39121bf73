#include "commands/extract.hpp"

#include "io/JsonIO.hpp"
#include "listing/ListingExtractor.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static bool open_out(std::ofstream& out, const std::string& out_path) {
    if (out_path.empty() || out_path == "-") return false;
    try {
        fs::path p(out_path);
        if (p.has_parent_path()) fs::create_directories(p.parent_path());
        out.open(p, std::ios::out | std::ios::trunc | std::ios::binary);
        return (bool)out;
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return false;
    }
}

static int extract_usage() {
    std::cerr
        << "usage:\n"
        << "  listing-parser extract --in <path> [--out <path>] [--lexicon <path>]\n"
        << "                         [--no_fallback] [--min_building_len <n>]\n";
    return 1;
}

int cmd_extract(int argc, char** argv) {
    const std::string in_path      = get_arg(argc, argv, "--in", "");
    const std::string out_path     = get_arg(argc, argv, "--out", "-");
    const std::string lexicon_path = get_arg(argc, argv, "--lexicon", "");
    const std::string min_len_arg  = get_arg(argc, argv, "--min_building_len", "3");

    if (in_path.empty()) {
        std::cerr << "error: missing --in\n";
        return extract_usage();
    }

    listing::ExtractorConfig cfg;
    cfg.use_address_fallback = !has_flag(argc, argv, "--no_fallback");
    try {
        int n = std::stoi(min_len_arg);
        if (n < 1) throw std::out_of_range("must be positive");
        cfg.building.min_length = (size_t)n;
    } catch (const std::exception&) {
        std::cerr << "error: --min_building_len expects a positive integer, got '" << min_len_arg << "'\n";
        return extract_usage();
    }

    addr::Lexicon lex;
    std::vector<listing::TitleRecord> records;
    try {
        if (!lexicon_path.empty()) loadLexiconOverrides(lexicon_path, lex);
        records = loadTitleRecords(in_path);
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }

    std::ofstream file;
    const bool to_file = open_out(file, out_path);
    if (!to_file && out_path != "-") {
        std::cerr << "[error] failed to open output file: " << out_path << "\n";
        return 1;
    }
    std::ostream& out = to_file ? static_cast<std::ostream&>(file) : std::cout;

    const listing::ListingExtractor extractor(lex, cfg);

    size_t no_title = 0;
    size_t no_address = 0;
    size_t with_building = 0;

    for (const auto& rec : records) {
        if (rec.title.empty()) {
            ++no_title;
            std::cerr << "[warn] record " << rec.id << " has no title\n";
        }

        const listing::ListingFields f = extractor.extract_all(rec.title);
        if (f.address.empty()) ++no_address;
        if (!f.building.empty()) ++with_building;

        out << listingRecordToJson(rec, f).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    }
    out.flush();

    std::cerr << "[info] processed " << records.size() << " titles"
              << " (" << no_address << " without address, " << with_building << " with building, "
              << no_title << " empty)";
    if (to_file) std::cerr << " -> " << out_path;
    std::cerr << "\n";

    return 0;
}
