#include <gtest/gtest.h>
#include "test_support.hpp"
#include <core/path_safety.hpp>
#include <core/constants.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// ── sanitize_name ───────────────────────────────────────────

TEST(SanitizeName, ReplacesInvalidCharacters) {
    EXPECT_EQ(sanitize_name("a<b>c:d\"e/f\\g|h?i*j", "_"), "a_b_c_d_e_f_g_h_i_j");
    EXPECT_EQ(sanitize_name("10.10.10.5/24", "-"), "10.10.10.5-24");
}

TEST(SanitizeName, ReplacesNul) {
    std::string raw("ab");
    raw.insert(1, 1, '\0');
    EXPECT_EQ(sanitize_name(raw, "_"), "a_b");
}

TEST(SanitizeName, CollapsesAndTrimsWhitespace) {
    EXPECT_EQ(sanitize_name("  my \t  box \n", "_"), "my box");
    EXPECT_EQ(sanitize_name("   ", "_"), "");
    EXPECT_EQ(sanitize_name("", "_"), "");
}

TEST(SanitizeName, FoldsUnicodeSpaces) {
    // NBSP, EM SPACE, IDEOGRAPHIC SPACE
    EXPECT_EQ(sanitize_name("my\xc2\xa0\xc2\xa0" "box", "_"), "my box");
    EXPECT_EQ(sanitize_name("\xe2\x80\x83" "web \xe3\x80\x80 app\xc2\xa0", "_"), "web app");
    // Other multi-byte characters are kept as they are
    EXPECT_EQ(sanitize_name("caf\xc3\xa9", "_"), "caf\xc3\xa9");
}

TEST(SanitizeName, TraversalBecomesLiteralSegment) {
    EXPECT_EQ(sanitize_name("../../etc", "-"), "..-..-etc");
    // ".." contains no invalid characters; containment has to catch it
    EXPECT_EQ(sanitize_name("..", "-"), "..");
}

TEST(SanitizeName, TruncatesTo255Bytes) {
    std::string long_name(400, 'a');
    EXPECT_EQ(sanitize_name(long_name, "_").size(), MAX_SEGMENT_LENGTH);
}

TEST(SanitizeName, TruncationKeepsUtf8Intact) {
    // 254 ASCII bytes then a 2-byte sequence that would straddle the limit
    std::string raw(254, 'a');
    raw += "\xc3\xa9\xc3\xa9";
    std::string out = sanitize_name(raw, "_");
    EXPECT_EQ(out.size(), 254u);
    EXPECT_EQ(out, std::string(254, 'a'));
}

TEST(SanitizeName, InvalidReplacementIsDropped) {
    EXPECT_EQ(sanitize_name("a/b", "/"), "ab");
}

TEST(SanitizeName, OutputNeverContainsSeparators) {
    for (const std::string raw : {"/", "\\\\server\\share", "a/../b", "x:y", "{target}/foo"}) {
        std::string out = sanitize_name(raw, "-");
        EXPECT_EQ(out.find('/'), std::string::npos) << raw;
        EXPECT_EQ(out.find('\\'), std::string::npos) << raw;
    }
}

TEST(SanitizeName, IsIdempotent) {
    for (const std::string& raw : std::vector<std::string>{"  a  b ", "x<y>z", "../../etc", std::string(300, 'q')}) {
        std::string once = sanitize_name(raw, "_");
        EXPECT_EQ(sanitize_name(once, "_"), once) << raw;
    }
}

// ── is_within_directory ─────────────────────────────────────

class ContainmentTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = unique_test_dir("penlab_containment_test");
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "b");
        fs::create_directories(test_dir / "bc");
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(ContainmentTest, BaseContainsItself) {
    EXPECT_TRUE(is_within_directory(test_dir, test_dir));
    EXPECT_FALSE(is_strictly_within_directory(test_dir, test_dir));
}

TEST_F(ContainmentTest, ChildIsContained) {
    EXPECT_TRUE(is_within_directory(test_dir, test_dir / "b"));
    EXPECT_TRUE(is_strictly_within_directory(test_dir, test_dir / "b" / "deeper"));
}

TEST_F(ContainmentTest, SiblingPrefixIsNotContained) {
    EXPECT_FALSE(is_within_directory(test_dir / "b", test_dir / "bc"));
    EXPECT_FALSE(is_within_directory(test_dir / "b", test_dir / "bc" / "x"));
}

TEST_F(ContainmentTest, ParentTraversalIsNotContained) {
    EXPECT_FALSE(is_within_directory(test_dir / "b", test_dir / "b" / ".."));
    EXPECT_FALSE(is_within_directory(test_dir / "b", test_dir / "b" / ".." / "bc"));
    EXPECT_FALSE(is_strictly_within_directory(test_dir / "b", test_dir / "b" / "."));
}

TEST_F(ContainmentTest, NonExistentTailResolvesLexically) {
    fs::path target = test_dir / "b" / "not" / "yet" / "created";
    EXPECT_TRUE(is_within_directory(test_dir / "b", target));
    EXPECT_FALSE(is_within_directory(test_dir / "b", test_dir / "b" / "missing" / ".." / ".." / "x"));
}

TEST_F(ContainmentTest, SymlinkEscapeIsDetected) {
    fs::path outside = test_dir / "bc";
    fs::path link = test_dir / "b" / "link";
    std::error_code ec;
    fs::create_directory_symlink(outside, link, ec);
    if (ec) GTEST_SKIP() << "symlinks unavailable: " << ec.message();

    EXPECT_FALSE(is_within_directory(test_dir / "b", link / "file"));
}
