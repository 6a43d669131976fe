#include <gtest/gtest.h>
#include <templates/template_validator.hpp>
#include <templates/template_document.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <string>

static bool has_error(const TemplateValidation& v, const std::string& needle) {
    return std::any_of(v.errors.begin(), v.errors.end(),
                       [&](const std::string& e) { return e.find(needle) != std::string::npos; });
}

TEST(TemplateValidator, EmptyDocumentIsValid) {
    auto v = validate_template(YAML::Load(""));
    EXPECT_TRUE(v.valid);
    EXPECT_TRUE(v.errors.empty());
}

TEST(TemplateValidator, MinimalTemplateIsValid) {
    auto v = validate_template(YAML::Load(R"(
name: box
version: 1.0
tags: [htb, 2024]
variables:
  domain: example.htb
structure:
  - dir: recon
    files:
      - name: notes.md
        content: "# {target}"
      - name: run.sh
        executable: yes
    subdirs:
      - dir: nmap
global_files:
  - name: README.md
)"));
    EXPECT_TRUE(v.valid) << (v.errors.empty() ? "" : v.errors[0]);
}

TEST(TemplateValidator, TopLevelMustBeMapping) {
    auto v = validate_template(YAML::Load("- a\n- b\n"));
    EXPECT_FALSE(v.valid);
    ASSERT_EQ(v.errors.size(), 1u);
    EXPECT_TRUE(has_error(v, "mapping at the top level"));
}

TEST(TemplateValidator, ScalarKinds) {
    EXPECT_EQ(classify_scalar(YAML::Load("~")), ScalarKind::Null);
    EXPECT_EQ(classify_scalar(YAML::Load("true")), ScalarKind::Bool);
    EXPECT_EQ(classify_scalar(YAML::Load("42")), ScalarKind::Integer);
    EXPECT_EQ(classify_scalar(YAML::Load("1.5")), ScalarKind::Float);
    EXPECT_EQ(classify_scalar(YAML::Load("recon")), ScalarKind::String);
    EXPECT_EQ(classify_scalar(YAML::Load("\"true\"")), ScalarKind::String);
    EXPECT_EQ(classify_scalar(YAML::Load("'42'")), ScalarKind::String);
}

TEST(TemplateValidator, NumericNamesAreAccepted) {
    auto v = validate_template(YAML::Load("name: 2024\nstructure:\n  - dir: 80\n"));
    EXPECT_TRUE(v.valid);
}

TEST(TemplateValidator, BooleanNameIsRejected) {
    auto v = validate_template(YAML::Load("name: true\n"));
    EXPECT_FALSE(v.valid);
    EXPECT_TRUE(has_error(v, "\"name\" must be text"));
}

TEST(TemplateValidator, CollectsEveryNestedError) {
    auto v = validate_template(YAML::Load(R"(
structure:
  - files:
      - name: a
        executable: "yes"
  - dir: ok
    subdirs:
      - dir: fine
        files:
          - content: 3
)"));
    EXPECT_FALSE(v.valid);
    EXPECT_TRUE(has_error(v, "structure[0] is missing \"dir\""));
    EXPECT_TRUE(has_error(v, "structure[0].files[0].executable must be a boolean"));
    EXPECT_TRUE(has_error(v, "structure[1].subdirs[0].files[0] is missing \"name\""));
    EXPECT_TRUE(has_error(v, "structure[1].subdirs[0].files[0].content must be text"));
    EXPECT_EQ(v.errors.size(), 4u);
}

TEST(TemplateValidator, WrongContainerTypes) {
    auto v = validate_template(YAML::Load(R"(
variables: [a, b]
structure: recon
global_files: {name: x}
tags: {a: b}
)"));
    EXPECT_FALSE(v.valid);
    EXPECT_TRUE(has_error(v, "\"variables\" must be a mapping"));
    EXPECT_TRUE(has_error(v, "\"structure\" must be a list"));
    EXPECT_TRUE(has_error(v, "global_files must be a list"));
    EXPECT_TRUE(has_error(v, "\"tags\""));
}

TEST(TemplateValidator, BadTagPositionIsReported) {
    auto v = validate_template(YAML::Load("tags: [ok, [nested], ~]\n"));
    EXPECT_FALSE(v.valid);
    EXPECT_TRUE(has_error(v, "Tag at position 1"));
    EXPECT_TRUE(has_error(v, "Tag at position 2"));
}

// ── TemplateDocument ────────────────────────────────────────

TEST(TemplateDocument, ReadsValidatedTree) {
    auto root = YAML::Load(R"(
name: web
tags: single
variables:
  domain: corp.local
  vhost: ""
structure:
  - dir: recon
    files:
      - name: run.sh
        executable: true
    subdirs:
      - dir: nmap
      - dir: web
global_files:
  - name: README.md
    content: hi
)");
    ASSERT_TRUE(validate_template(root).valid);

    auto doc = TemplateDocument::from_yaml(root);
    EXPECT_EQ(doc.name, "web");
    ASSERT_EQ(doc.tags.size(), 1u);
    EXPECT_EQ(doc.tags[0], "single");
    ASSERT_EQ(doc.variables.size(), 2u);
    EXPECT_EQ(doc.variables[0].first, "domain");
    EXPECT_EQ(doc.variable_defaults().at("domain"), "corp.local");
    ASSERT_EQ(doc.structure.size(), 1u);
    EXPECT_TRUE(doc.structure[0].files[0].executable);
    EXPECT_EQ(doc.structure[0].subdirs.size(), 2u);
    EXPECT_EQ(doc.count_dirs(), 3u);
    EXPECT_EQ(doc.count_files(), 2u);
    EXPECT_EQ(doc.global_files[0].content, "hi");
}
