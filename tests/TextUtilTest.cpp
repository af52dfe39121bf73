#include "text/TextUtil.hpp"

#include <gtest/gtest.h>

using namespace textutil;

TEST(TextUtil, DecodesHangulAndAscii) {
    size_t len = 0;
    EXPECT_EQ(decode_at("가", 0, &len), U'\xAC00');
    EXPECT_EQ(len, 3u);

    EXPECT_EQ(decode_at("a가", 0, &len), U'a');
    EXPECT_EQ(len, 1u);
}

TEST(TextUtil, MalformedBytesBecomeReplacement) {
    size_t len = 0;
    EXPECT_EQ(decode_at("\xFF", 0, &len), kReplacement);
    EXPECT_EQ(len, 1u);

    // truncated three-byte sequence
    EXPECT_EQ(decode_at("\xEA\xB0", 0, &len), kReplacement);
    EXPECT_EQ(len, 1u);

    // overlong '/'
    EXPECT_EQ(decode_at("\xC0\xAF", 0, &len), kReplacement);
}

TEST(TextUtil, WalksGlyphsBothWays) {
    const std::string s = "a가b";
    EXPECT_EQ(next_pos(s, 0), 1u);
    EXPECT_EQ(next_pos(s, 1), 4u);
    EXPECT_EQ(prev_pos(s, 4), 1u);
    EXPECT_EQ(prev_pos(s, 1), 0u);
    EXPECT_EQ(last_before(s, 4), U'\xAC00');
    EXPECT_EQ(glyph_count(s), 3u);
    EXPECT_EQ(glyph_count("한빛마을아파트"), 7u);
}

TEST(TextUtil, ClassifiesCharacters) {
    EXPECT_TRUE(is_hangul(U'\xD7A3'));
    EXPECT_FALSE(is_hangul(U'\x3131'));  // compatibility jamo
    EXPECT_TRUE(is_space(U'\x3000'));
    EXPECT_TRUE(is_space(U'\x00A0'));
    EXPECT_TRUE(is_hyphen(U'\x2013'));
    EXPECT_TRUE(is_hyphen(U'\xFF0D'));
    EXPECT_FALSE(is_hyphen(U'_'));
    EXPECT_TRUE(is_word(U'7'));
    EXPECT_FALSE(is_word(U','));
}

TEST(TextUtil, MatchesAtOffsets) {
    const std::string s = "경기 파주";
    EXPECT_TRUE(starts_with_at(s, 0, "경기"));
    EXPECT_TRUE(starts_with_at(s, 7, "파주"));
    EXPECT_FALSE(starts_with_at(s, 7, "파주시"));
    EXPECT_FALSE(starts_with_at(s, 0, ""));
    EXPECT_TRUE(ends_with_at(s, 6, "경기"));
    EXPECT_TRUE(ends_with(s, "주"));
    EXPECT_FALSE(ends_with("주", "파주"));
}

TEST(TextUtil, TrimsAndCollapsesUnicodeSpace) {
    EXPECT_EQ(trim("\xE3\x80\x80 abc \t"), "abc");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(collapse_spaces("  a   b\t\nc  "), "a b c");
    EXPECT_EQ(collapse_spaces("일괄\xC2\xA0\xC2\xA0매각"), "일괄 매각");
}

TEST(TextUtil, ScanWhileStopsAtFirstMiss) {
    const std::string s = "408-3 일원";
    EXPECT_EQ(scan_while(s, 0, is_ascii_digit), 3u);
    EXPECT_EQ(skip_spaces(s, 5), 6u);
    EXPECT_EQ(scan_while(s, 6, is_hangul), s.size());
}
