#include <gtest/gtest.h>
#include "test_support.hpp"
#include <managers/project_metadata.hpp>
#include <core/constants.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ProjectMetadataTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = unique_test_dir("penlab_metadata_test");
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(ProjectMetadataTest, BuiltFromVariables) {
    VariableMap vars = {
        {"project-name", "box"},
        {"target", "10.10.10.5"},
        {"your-ip", "10.10.14.2"},
        {"author", "alice"},
        {"date", "2024-05-01"},
    };

    auto meta = ProjectMetadata::from_variables(test_dir, vars, "web");
    EXPECT_EQ(meta.name, "box");
    EXPECT_EQ(meta.template_name, "web");
    EXPECT_EQ(meta.target, "10.10.10.5");
    EXPECT_EQ(meta.your_ip, "10.10.14.2");
    EXPECT_EQ(meta.author, "alice");
    EXPECT_TRUE(fs::path(meta.path).is_absolute());
    // YYYY-MM-DD HH:MM:SS
    ASSERT_EQ(meta.created.size(), 19u);
    EXPECT_EQ(meta.created[10], ' ');
}

TEST_F(ProjectMetadataTest, SaveWritesExpectedKeys) {
    ProjectMetadata meta;
    meta.name = "box";
    meta.template_name = "default";
    meta.target = "10.10.10.5";
    meta.your_ip = "10.10.14.2";
    meta.author = "alice";
    meta.created = "2024-05-01 12:00:00";
    meta.path = test_dir.string();

    ASSERT_TRUE(meta.save(test_dir).is_ok());

    YAML::Node root = YAML::LoadFile((test_dir / PROJECT_METADATA_FILE).string());
    EXPECT_EQ(root["name"].as<std::string>(), "box");
    EXPECT_EQ(root["template"].as<std::string>(), "default");
    EXPECT_EQ(root["your-ip"].as<std::string>(), "10.10.14.2");
    EXPECT_EQ(root["created"].as<std::string>(), "2024-05-01 12:00:00");
    EXPECT_EQ(root["path"].as<std::string>(), test_dir.string());

    auto loaded = ProjectMetadata::load(test_dir);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.target, "10.10.10.5");
    EXPECT_EQ(loaded.value.author, "alice");
}

TEST_F(ProjectMetadataTest, SaveOverwrites) {
    ProjectMetadata meta;
    meta.name = "first";
    ASSERT_TRUE(meta.save(test_dir).is_ok());
    meta.name = "second";
    ASSERT_TRUE(meta.save(test_dir).is_ok());

    auto loaded = ProjectMetadata::load(test_dir);
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value.name, "second");
}

TEST_F(ProjectMetadataTest, SaveIntoMissingDirectoryFails) {
    ProjectMetadata meta;
    auto result = meta.save(test_dir / "does-not-exist");
    EXPECT_TRUE(result.is_err());
}

TEST_F(ProjectMetadataTest, LoadMissingIsAnError) {
    EXPECT_TRUE(ProjectMetadata::load(test_dir).is_err());
}

TEST_F(ProjectMetadataTest, LoadCorruptIsAnError) {
    std::ofstream(test_dir / PROJECT_METADATA_FILE) << "name: [broken\n";
    EXPECT_TRUE(ProjectMetadata::load(test_dir).is_err());
}

TEST_F(ProjectMetadataTest, NullFieldsLoadAsEmpty) {
    std::ofstream(test_dir / PROJECT_METADATA_FILE)
        << "name: box\ntemplate: web\ntarget: null\nyour-ip: ~\nauthor:\ncreated: 2024-05-01 12:00:00\n";

    auto loaded = ProjectMetadata::load(test_dir);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.name, "box");
    EXPECT_EQ(loaded.value.target, "");
    EXPECT_EQ(loaded.value.your_ip, "");
    EXPECT_EQ(loaded.value.author, "");
    EXPECT_EQ(loaded.value.path, test_dir.string());
}
