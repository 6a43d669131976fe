#include <gtest/gtest.h>
#include "test_support.hpp"
#include <templates/template_catalog.hpp>
#include <templates/builtin_templates.hpp>
#include <templates/template_validator.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class TemplateCatalogTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path templates_dir;

    void SetUp() override {
        test_dir = unique_test_dir("penlab_catalog_test");
        templates_dir = test_dir / "templates";
        fs::remove_all(test_dir);
        fs::create_directories(templates_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_file(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
    }
};

TEST_F(TemplateCatalogTest, BuiltinTemplatesAreValid) {
    ASSERT_FALSE(builtin_templates().empty());
    ASSERT_NE(get_builtin_template("default"), nullptr);
    EXPECT_EQ(get_builtin_template("nope"), nullptr);

    for (const auto& builtin : builtin_templates()) {
        auto v = validate_template(YAML::Load(builtin.yaml));
        EXPECT_TRUE(v.valid) << builtin.name << ": " << (v.errors.empty() ? "" : v.errors[0]);
    }
}

TEST_F(TemplateCatalogTest, FindPrefersYamlOverYml) {
    write_file(templates_dir / "web.yml", "name: web\n");
    EXPECT_EQ(find_template_file(templates_dir, "web"), templates_dir / "web.yml");

    write_file(templates_dir / "web.yaml", "name: web\n");
    EXPECT_EQ(find_template_file(templates_dir, "web"), templates_dir / "web.yaml");

    EXPECT_TRUE(find_template_file(templates_dir, "missing").empty());
}

TEST_F(TemplateCatalogTest, LoadValidTemplate) {
    write_file(templates_dir / "box.yaml", "structure:\n  - dir: recon\n");

    auto load = load_template(templates_dir, "box");
    ASSERT_TRUE(load.ok());
    EXPECT_TRUE(load.errors.empty());
    EXPECT_EQ(load.document->name, "box");
    EXPECT_EQ(load.document->structure.size(), 1u);
}

TEST_F(TemplateCatalogTest, LoadReportsEveryValidationError) {
    write_file(templates_dir / "bad.yaml", "structure:\n  - files: []\n  - dir: ok\n    files: nope\n");

    auto load = load_template(templates_dir, "bad");
    EXPECT_FALSE(load.ok());
    EXPECT_EQ(load.errors.size(), 2u);
}

TEST_F(TemplateCatalogTest, LoadReportsSyntaxErrorsAndMissingFiles) {
    write_file(templates_dir / "broken.yaml", "structure: [\n");
    auto broken = load_template(templates_dir, "broken");
    EXPECT_FALSE(broken.ok());
    ASSERT_EQ(broken.errors.size(), 1u);

    auto missing = load_template(templates_dir, "missing");
    EXPECT_FALSE(missing.ok());
    ASSERT_EQ(missing.errors.size(), 1u);
    EXPECT_NE(missing.errors[0].find("not found"), std::string::npos);
}

TEST_F(TemplateCatalogTest, ListAndSummarize) {
    write_file(templates_dir / "zeta.yaml", "name: zeta\nversion: 2\ndescription: last\ntags: [a, b]\n");
    write_file(templates_dir / "alpha.yml", "description: first\n");
    write_file(templates_dir / "broken.yaml", "key: [\n");
    write_file(templates_dir / "notes.txt", "ignored");

    auto files = list_template_files(templates_dir);
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].filename(), "alpha.yml");
    EXPECT_EQ(files[1].filename(), "broken.yaml");
    EXPECT_EQ(files[2].filename(), "zeta.yaml");

    auto alpha = summarize_template(files[0]);
    EXPECT_EQ(alpha.name, "alpha");
    EXPECT_EQ(alpha.version, "1.0");
    EXPECT_EQ(alpha.description, "first");

    auto broken = summarize_template(files[1]);
    EXPECT_FALSE(broken.readable);
    EXPECT_EQ(broken.version, "?");

    auto zeta = summarize_template(files[2]);
    EXPECT_EQ(zeta.version, "2");
    EXPECT_EQ(zeta.tags.size(), 2u);
}

TEST_F(TemplateCatalogTest, ImportCopiesUnderSanitizedName) {
    fs::path source = test_dir / "incoming" / "file.yaml";
    write_file(source, "name: \"red/team\"\nstructure:\n  - dir: loot\n");

    auto result = import_template(source, templates_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value, templates_dir / "red_team.yaml");
    EXPECT_TRUE(fs::exists(templates_dir / "red_team.yaml"));
    EXPECT_TRUE(load_template(templates_dir, "red_team").ok());
}

TEST_F(TemplateCatalogTest, ImportFallsBackToFileStem) {
    fs::path source = test_dir / "ad-lab.yaml";
    write_file(source, "structure:\n  - dir: bloodhound\n");

    auto result = import_template(source, templates_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value, templates_dir / "ad-lab.yaml");
}

TEST_F(TemplateCatalogTest, ImportRejectsInvalidDocument) {
    fs::path source = test_dir / "bad.yaml";
    write_file(source, "name: bad\nstructure:\n  - files: []\n");

    auto result = import_template(source, templates_dir);
    EXPECT_TRUE(result.is_err());
    EXPECT_FALSE(fs::exists(templates_dir / "bad.yaml"));
}

TEST_F(TemplateCatalogTest, ImportRejectsTraversalName) {
    fs::path source = test_dir / "evil.yaml";
    write_file(source, "name: \"..\"\n");

    auto result = import_template(source, templates_dir);
    EXPECT_TRUE(result.is_err());
}

TEST_F(TemplateCatalogTest, ListingNonDirectoryDoesNotThrow) {
    write_file(test_dir / "plain.yaml", "name: plain\n");

    std::vector<fs::path> files;
    EXPECT_NO_THROW(files = list_template_files(test_dir / "plain.yaml"));
    EXPECT_TRUE(files.empty());
    EXPECT_TRUE(list_template_files(test_dir / "missing").empty());
}
