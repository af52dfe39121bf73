#include "io/JsonIO.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

// message of the runtime_error thrown by fn, "" if none
template <typename Fn>
std::string error_of(Fn fn) {
    try {
        fn();
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}

class TempFile {
public:
    TempFile(const std::string& name, const std::string& content)
        : m_path(fs::temp_directory_path() / ("listing_parser_test_" + name)) {
        std::ofstream out(m_path, std::ios::binary);
        out << content;
    }
    ~TempFile() {
        std::error_code ec;
        fs::remove(m_path, ec);
    }
    std::string path() const { return m_path.string(); }

private:
    fs::path m_path;
};

}  // namespace

TEST(JsonIO, ParsesJsonlRecords) {
    std::istringstream in(
        "{\"title\":\"경기 파주 야당동 한빛마을아파트 101동 일괄매각\",\"url\":\"https://example.test/1\"}\n"
        "\n"
        "{\"title\":null,\"no\":7}\r\n"
        "\"인천 만수동 3필지 외 2개 개별매각\"\n");

    auto recs = parseTitleJsonl(in);
    ASSERT_EQ(recs.size(), 3u);

    EXPECT_EQ(recs[0].id, "1");
    EXPECT_EQ(recs[0].title, "경기 파주 야당동 한빛마을아파트 101동 일괄매각");
    EXPECT_EQ(recs[0].source.at("url"), "https://example.test/1");

    EXPECT_EQ(recs[1].id, "2");
    EXPECT_EQ(recs[1].title, "");
    EXPECT_EQ(recs[1].source.at("no"), 7);

    EXPECT_EQ(recs[2].title, "인천 만수동 3필지 외 2개 개별매각");
    EXPECT_TRUE(recs[2].source.is_object());
}

TEST(JsonIO, JsonlErrorsNameTheLine) {
    std::istringstream bad_type("{\"title\":\"a\"}\n{\"title\":5}\n");
    EXPECT_EQ(error_of([&] { parseTitleJsonl(bad_type); }), "line 2.title must be a string");

    std::istringstream not_json("{\"title\":\n");
    EXPECT_NE(error_of([&] { parseTitleJsonl(not_json); }).find("failed to parse JSON at line 1"),
              std::string::npos);

    std::istringstream not_object("[1,2]\n");
    EXPECT_EQ(error_of([&] { parseTitleJsonl(not_object); }), "line 1 must be an object");
}

TEST(JsonIO, ParsesJsonArray) {
    json root = json::array({"서울 강남구 역삼동 123", {{"title", "b"}, {"id", "x"}}, nullptr});
    auto recs = parseTitleJson(root);
    ASSERT_EQ(recs.size(), 3u);
    EXPECT_EQ(recs[0].title, "서울 강남구 역삼동 123");
    EXPECT_EQ(recs[1].title, "b");
    EXPECT_EQ(recs[1].source.at("id"), "x");
    EXPECT_EQ(recs[2].title, "");
    EXPECT_EQ(recs[2].id, "3");

    EXPECT_EQ(error_of([] { parseTitleJson(json::object()); }), "root must be an array");
    EXPECT_EQ(error_of([] { parseTitleJson(json::array({json{{"title", true}}})); }), "root[0].title must be a string");
}

TEST(JsonIO, ParsesPlainLines) {
    std::istringstream in("경기 파주 야당동\r\n\n인천 만수동\n");
    auto recs = parseTitleLines(in);
    ASSERT_EQ(recs.size(), 2u);
    EXPECT_EQ(recs[0].title, "경기 파주 야당동");
    EXPECT_EQ(recs[1].title, "인천 만수동");
    EXPECT_EQ(recs[1].id, "2");
}

TEST(JsonIO, LoadsByExtension) {
    TempFile jsonl("titles.jsonl", "{\"title\":\"a\"}\n{\"title\":\"b\"}\n");
    TempFile arr("titles.json", "[\"a\", {\"title\": \"b\"}, \"c\"]");
    TempFile txt("titles.txt", "a\nb\nc\nd\n");

    EXPECT_EQ(loadTitleRecords(jsonl.path()).size(), 2u);
    EXPECT_EQ(loadTitleRecords(arr.path()).size(), 3u);
    EXPECT_EQ(loadTitleRecords(txt.path()).size(), 4u);

    const std::string missing = (fs::temp_directory_path() / "listing_parser_test_missing.jsonl").string();
    EXPECT_EQ(error_of([&] { loadTitleRecords(missing); }), "failed to open input file: " + missing);
}

TEST(JsonIO, AppliesLexiconOverrides) {
    addr::Lexicon lex;
    json j = {
        {"building_suffixes", {"하우스"}},
        {"sale_keywords", {"수의계약"}},
        {"province_aliases", {{"서울특별", "서울특별시"}}},
    };
    applyLexiconOverrides(j, lex);

    EXPECT_TRUE(lex.has_building_suffix("행복하우스"));
    EXPECT_EQ(lex.sale_keywords().back(), "수의계약");
    EXPECT_EQ(lex.canonicalize("서울특별"), "서울특별시");

    // every key is optional
    addr::Lexicon untouched;
    applyLexiconOverrides(json::object(), untouched);
    EXPECT_FALSE(untouched.has_building_suffix("행복하우스"));
}

TEST(JsonIO, OverrideErrorsNameThePath) {
    addr::Lexicon lex;
    EXPECT_EQ(error_of([&] { applyLexiconOverrides(json::array(), lex); }), "root must be an object");
    EXPECT_EQ(error_of([&] { applyLexiconOverrides(json{{"building_suffixes", "x"}}, lex); }),
              "root.building_suffixes must be an array");
    EXPECT_EQ(error_of([&] { applyLexiconOverrides(json{{"sale_keywords", {"a", 1}}}, lex); }),
              "root.sale_keywords[1] must be a string");
    EXPECT_EQ(error_of([&] { applyLexiconOverrides(json{{"province_aliases", {{"서울특별", 1}}}}, lex); }),
              "root.province_aliases.서울특별 must be a string");
}

TEST(JsonIO, LoadsOverridesFromFile) {
    TempFile good("lexicon.json", "{\"building_suffixes\": [\"하우스\"]}");
    TempFile broken("broken.json", "{\"building_suffixes\": [");

    addr::Lexicon lex;
    loadLexiconOverrides(good.path(), lex);
    EXPECT_TRUE(lex.has_building_suffix("행복하우스"));

    EXPECT_NE(error_of([&] { loadLexiconOverrides(broken.path(), lex); }).find("failed to parse JSON"),
              std::string::npos);
}

TEST(JsonIO, RecordJsonKeepsSourceFields) {
    listing::TitleRecord rec;
    rec.id = "1";
    rec.title = "경기 파주 야당동 한빛마을아파트 101동 일괄매각";
    rec.source = {{"url", "https://example.test/1"}, {"title", "stale"}};

    listing::ListingExtractor ex;
    json out = listingRecordToJson(rec, ex.extract_all(rec.title));

    EXPECT_EQ(out.at("url"), "https://example.test/1");
    EXPECT_EQ(out.at("title"), rec.title);
    EXPECT_EQ(out.at("address"), "경기 파주 야당동");
    EXPECT_EQ(out.at("city"), "경기도 파주");
    EXPECT_EQ(out.at("district"), "파주");
    EXPECT_EQ(out.at("building"), "한빛마을아파트");
    EXPECT_EQ(out.at("sale_content"), "일괄매각");
    EXPECT_EQ(out.at("purpose"), "");
}
