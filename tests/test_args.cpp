#include <gtest/gtest.h>
#include <cli/args.hpp>

static const std::set<std::string> kInitOptions = {"t", "template", "target", "your-ip", "var"};

TEST(ParseArgs, PositionalsOptionsAndFlags) {
    auto a = parse_args({"box", "-t", "web", "--target", "10.0.0.1", "--force", "-y"}, kInitOptions);

    ASSERT_EQ(a.positional.size(), 1u);
    EXPECT_EQ(a.positional[0], "box");
    EXPECT_EQ(a.get("template", "t"), "web");
    EXPECT_EQ(a.get("target"), "10.0.0.1");
    EXPECT_TRUE(a.has_flag("force"));
    EXPECT_TRUE(a.has_flag("yes", "y"));
    EXPECT_FALSE(a.has_flag("dry-run"));
    EXPECT_TRUE(a.errors.empty());
}

TEST(ParseArgs, InlineValues) {
    auto a = parse_args({"--your-ip=10.10.14.2", "--template=default"}, kInitOptions);
    EXPECT_EQ(a.get("your-ip"), "10.10.14.2");
    EXPECT_EQ(a.get("template", "t"), "default");
}

TEST(ParseArgs, RepeatedOptionKeepsAllValues) {
    auto a = parse_args({"--var", "domain=corp.local", "--var=vhost=admin"}, kInitOptions);
    auto vars = a.all("var");
    ASSERT_EQ(vars.size(), 2u);
    EXPECT_EQ(vars[0], "domain=corp.local");
    EXPECT_EQ(vars[1], "vhost=admin");
}

TEST(ParseArgs, MissingValueIsAnError) {
    auto a = parse_args({"box", "--target"}, kInitOptions);
    ASSERT_EQ(a.errors.size(), 1u);
    EXPECT_FALSE(a.has("target"));
}

TEST(ParseArgs, DoubleDashEndsOptions) {
    auto a = parse_args({"add", "--", "-rf is dangerous"}, {});
    ASSERT_EQ(a.positional.size(), 2u);
    EXPECT_EQ(a.positional[1], "-rf is dangerous");
}

TEST(ParseArgs, FallbackWhenAbsent) {
    auto a = parse_args({}, kInitOptions);
    EXPECT_EQ(a.get("template", "t", "default"), "default");
    EXPECT_TRUE(a.all("var").empty());
}
