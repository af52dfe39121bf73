#include "addr/RegionSummarizer.hpp"

#include <gtest/gtest.h>

using addr::AddressMatcher;
using addr::Lexicon;
using addr::RegionShape;
using addr::RegionSummarizer;

namespace {

class RegionSummarizerTest : public ::testing::Test {
protected:
    RegionSummarizerTest() : matcher(Lexicon::standard()), summarizer(Lexicon::standard(), matcher) {}
    AddressMatcher matcher;
    RegionSummarizer summarizer;
};

}  // namespace

TEST_F(RegionSummarizerTest, ProvinceWithTwoDistricts) {
    auto r = summarizer.summarize("경기 수원시 팔달구 인계동 1000 센트럴타워");
    EXPECT_EQ(r.shape, RegionShape::ProvinceDistrict);
    EXPECT_EQ(r.province, "경기도");
    EXPECT_EQ(r.province_district(), "경기도 수원시 팔달구");
    EXPECT_EQ(r.district_only(), "수원시 팔달구");
    EXPECT_FALSE(r.from_address);
}

TEST_F(RegionSummarizerTest, ProvinceWithOneDistrict) {
    EXPECT_EQ(summarizer.province_district("서울 강남구 역삼동 123"), "서울특별시 강남구");
    EXPECT_EQ(summarizer.district_only("서울 강남구 역삼동 123"), "강남구");
    EXPECT_EQ(summarizer.province_district("경북 영덕군 강구면 오포리 123"), "경상북도 영덕군");
}

TEST_F(RegionSummarizerTest, Sejong) {
    auto r = summarizer.summarize("세종특별자치시 반곡동 123");
    EXPECT_EQ(r.shape, RegionShape::Sejong);
    EXPECT_EQ(r.province_district(), "세종특별자치시");
    EXPECT_EQ(r.district_only(), "");

    EXPECT_EQ(summarizer.province_district("세종시 조치원읍 123"), "세종특별자치시");
}

TEST_F(RegionSummarizerTest, DistrictsWithoutProvince) {
    auto r = summarizer.summarize("전주시 완산구 고사동 408-3");
    EXPECT_EQ(r.shape, RegionShape::DistrictOnly);
    EXPECT_EQ(r.province_district(), "전주시 완산구");
    EXPECT_EQ(r.district_only(), "전주시 완산구");
}

TEST_F(RegionSummarizerTest, ProvinceAndRawCity) {
    auto r = summarizer.summarize("경기 파주 야당동 한빛마을아파트 101동 일괄매각");
    EXPECT_EQ(r.shape, RegionShape::ProvinceRawCity);
    EXPECT_EQ(r.province_district(), "경기도 파주");
    EXPECT_EQ(r.district_only(), "파주");
}

TEST_F(RegionSummarizerTest, ProvinceOnly) {
    auto r = summarizer.summarize("인천 만수동 3필지 외 2개 개별매각");
    EXPECT_EQ(r.shape, RegionShape::ProvinceOnly);
    EXPECT_EQ(r.province_district(), "인천광역시");
    EXPECT_EQ(r.district_only(), "");
}

TEST_F(RegionSummarizerTest, OrdinalIsSkippedOnTheRawTitle) {
    auto r = summarizer.summarize("1. 서울 강남구 역삼동 123", false);
    EXPECT_EQ(r.shape, RegionShape::ProvinceDistrict);
    EXPECT_EQ(r.province_district(), "서울특별시 강남구");
}

TEST_F(RegionSummarizerTest, BracketTagNeedsAddressFallback) {
    const std::string title = "[공매] 경기 파주 야당동 한빛마을아파트";

    auto with = summarizer.summarize(title, true);
    EXPECT_TRUE(with.from_address);
    EXPECT_EQ(with.shape, RegionShape::ProvinceRawCity);
    EXPECT_EQ(with.province_district(), "경기도 파주");

    auto without = summarizer.summarize(title, false);
    EXPECT_EQ(without.shape, RegionShape::None);
    EXPECT_EQ(without.province_district(), "");
    EXPECT_EQ(summarizer.district_only(title, false), "");
}

TEST_F(RegionSummarizerTest, NothingToSummarize) {
    auto r = summarizer.summarize("공매 안내");
    EXPECT_EQ(r.shape, RegionShape::None);
    EXPECT_EQ(r.province_district(), "");
    EXPECT_EQ(r.district_only(), "");
    EXPECT_EQ(summarizer.province_district(""), "");
}

TEST_F(RegionSummarizerTest, ShapeNames) {
    EXPECT_STREQ(addr::shape_name(RegionShape::ProvinceRawCity), "province_raw_city");
    EXPECT_STREQ(addr::shape_name(RegionShape::None), "none");
}
