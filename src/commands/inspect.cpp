#include "commands/inspect.hpp"

#include "io/JsonIO.hpp"
#include "listing/ListingExtractor.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

// first argument that is neither a flag nor a flag's value
static std::string positional(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--", 0) == 0) {
            ++i;
            continue;
        }
        return a;
    }
    return "";
}

struct Printer {
    std::ostream* a = nullptr;
    std::ostream* b = nullptr;
    template <typename T>
    Printer& operator<<(const T& v) {
        if (a) (*a) << v;
        if (b) (*b) << v;
        return *this;
    }
};

static bool open_out(std::ofstream& out, const std::string& out_path) {
    if (out_path.empty()) return false;
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

static std::string join(const std::vector<std::string>& v) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += ", ";
        out += v[i];
    }
    return out;
}

static int inspect_usage() {
    std::cerr
        << "usage:\n"
        << "  listing-parser inspect [--lexicon <path>] [--out <path>] \"<title>\"\n";
    return 1;
}

int cmd_inspect(int argc, char** argv) {
    const std::string lexicon_path = get_arg(argc, argv, "--lexicon", "");
    const std::string out_path     = get_arg(argc, argv, "--out", "");
    const std::string title        = get_arg(argc, argv, "--title", positional(argc, argv));

    if (title.empty()) {
        std::cerr << "error: missing title\n";
        return inspect_usage();
    }

    addr::Lexicon lex;
    if (!lexicon_path.empty()) {
        try {
            loadLexiconOverrides(lexicon_path, lex);
        } catch (const std::exception& e) {
            std::cerr << "[error] " << e.what() << "\n";
            return 1;
        }
    }

    std::ofstream file;
    Printer pr;
    pr.a = &std::cout;
    if (open_out(file, out_path)) pr.b = &file;
    else if (!out_path.empty()) std::cerr << "[warn] could not open " << out_path << ", printing to stdout only\n";

    const listing::ListingExtractor ex(lex);
    const addr::AddressMatcher& matcher = ex.address_matcher();

    const size_t start = matcher.grammar().skip_prefix(title);
    pr << "title:        " << title << "\n";
    pr << "stripped:     " << title.substr(start) << "\n";

    // every branch that accepts the title on its own, in priority order
    const addr::AddressBranch branches[] = {
        addr::AddressBranch::Sejong,
        addr::AddressBranch::General,
        addr::AddressBranch::DistrictOnly,
        addr::AddressBranch::ProvinceRawCityTown,
        addr::AddressBranch::ProvinceTown,
    };
    std::vector<std::string> accepting;
    for (auto b : branches) {
        auto m = matcher.match_branch(title, b);
        if (m) accepting.push_back(std::string(addr::branch_name(b)) + " -> \"" + m->text + "\"");
    }

    auto m = matcher.match(title);
    if (m) {
        pr << "address:      " << m->text << "  [" << addr::branch_name(m->branch)
           << ", bytes " << m->begin << ".." << m->end << "]\n";
        if (!m->province.empty())      pr << "  province:   " << m->province << " -> " << lex.canonicalize(m->province) << "\n";
        if (!m->districts.empty())     pr << "  districts:  " << join(m->districts) << "\n";
        if (!m->raw_city.empty())      pr << "  raw city:   " << m->raw_city << "\n";
        if (!m->towns.empty())         pr << "  towns:      " << join(m->towns) << "\n";
        if (!m->plan_district.empty()) pr << "  plan:       " << m->plan_district << "\n";
        if (!m->road.empty())          pr << "  road:       " << m->road << "\n";
        if (!m->lots.empty())          pr << "  lots:       " << m->lots << "\n";
    } else {
        pr << "address:      (none)\n";
    }
    if (accepting.size() > 1) {
        std::cerr << "[warn] " << accepting.size() << " branches accept this title:\n";
        for (const auto& a : accepting) std::cerr << "  " << a << "\n";
    }

    const addr::RegionSummary region = ex.region_summarizer().summarize(title, true);
    pr << "region:       " << addr::shape_name(region.shape)
       << (region.from_address ? " (via address)" : "") << "\n";
    pr << "  province+district: " << region.province_district() << "\n";
    pr << "  district only:     " << region.district_only() << "\n";

    const listing::BuildingScan scan = ex.building_extractor().scan(title);
    pr << "building region: bytes " << scan.region_begin << ".." << scan.region_end << "\n";
    for (const auto& c : scan.accepted) {
        pr << "  candidate:  " << c.text << "  (suffix=" << (c.has_suffix ? 1 : 0)
           << ", len=" << c.length << ")\n";
    }
    for (const auto& r : scan.rejected) pr << "  rejected:   " << r << "\n";

    pr << "building:     " << ex.extract_building_name(title) << "\n";
    pr << "sale_content: " << ex.extract_sale_content(title) << "\n";
    pr << "purpose:      " << ex.purpose(title) << "\n";

    return 0;
}
