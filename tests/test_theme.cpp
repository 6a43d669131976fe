#include <gtest/gtest.h>
#include <cli/theme.hpp>

TEST(Theme, ColorWrappersAlwaysReset) {
    EXPECT_EQ(theme::teal("recon/"), theme::color::TEAL + "recon/" + theme::color::RESET);
    EXPECT_EQ(theme::yellow(""), theme::color::YELLOW + theme::color::RESET);
}

TEST(Theme, StatusLinesEndWithNewline) {
    for (const auto& line : {theme::ok("a"), theme::fail("b"), theme::warn("c"),
                             theme::info("d"), theme::step("e")}) {
        ASSERT_FALSE(line.empty());
        EXPECT_EQ(line.back(), '\n');
    }
    EXPECT_NE(theme::fail("Template 'x' not found").find("Template 'x' not found"), std::string::npos);
}

TEST(Theme, KeyValueRowPadsLabel) {
    std::string row = theme::kv("Target", "10.10.10.5");
    EXPECT_NE(row.find("    Target      "), std::string::npos);
    EXPECT_NE(row.find("10.10.10.5\n"), std::string::npos);
}

TEST(Theme, BannerCarriesVersion) {
    EXPECT_NE(theme::banner().find(PENLAB_VERSION), std::string::npos);
}
