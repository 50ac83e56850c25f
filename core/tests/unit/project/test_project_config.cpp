// tests/unit/project/test_project_config.cpp - frugal-ls.yaml loading
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "frugal_ls/project/project_config.hpp"

using namespace frugal_ls;
namespace fs = std::filesystem;

namespace
{

class TempDir
{
public:
  TempDir()
  {
    const auto * info = ::testing::UnitTest::GetInstance()->current_test_info();
    path_ = fs::temp_directory_path() / (std::string("frugal_ls_") + info->name());
    fs::remove_all(path_);
    fs::create_directories(path_);
  }
  ~TempDir()
  {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }

private:
  fs::path path_;
};

void write_file(const fs::path & path, const std::string & content)
{
  std::ofstream out(path);
  out << content;
}

}  // namespace

TEST(ProjectConfigTest, DefaultsWhenEmpty)
{
  const auto result = parse_project_config("");
  ASSERT_TRUE(result.success) << result.error;

  const ProjectConfig & cfg = result.config;
  ASSERT_EQ(cfg.files.extensions.size(), 1U);
  EXPECT_EQ(cfg.files.extensions[0], ".frugal");
  EXPECT_TRUE(cfg.diagnostics.naming_conventions);
  EXPECT_TRUE(cfg.diagnostics.type_references);
  EXPECT_EQ(cfg.diagnostics.max_syntax_errors, 0U);
  EXPECT_EQ(cfg.logging.level, "warn");
}

TEST(ProjectConfigTest, FullConfig)
{
  const auto result = parse_project_config(R"(
files:
  extensions: [".frugal", ".thrift"]
diagnostics:
  naming_conventions: false
  type_references: true
  max_syntax_errors: 20
logging:
  level: debug
)");
  ASSERT_TRUE(result.success) << result.error;

  const ProjectConfig & cfg = result.config;
  ASSERT_EQ(cfg.files.extensions.size(), 2U);
  EXPECT_EQ(cfg.files.extensions[1], ".thrift");
  EXPECT_FALSE(cfg.diagnostics.naming_conventions);
  EXPECT_TRUE(cfg.diagnostics.type_references);
  EXPECT_EQ(cfg.diagnostics.max_syntax_errors, 20U);
  EXPECT_EQ(cfg.logging.level, "debug");
}

TEST(ProjectConfigTest, RejectsWrongTypes)
{
  EXPECT_FALSE(parse_project_config("files:\n  extensions: .frugal\n").success);
  EXPECT_FALSE(parse_project_config("files:\n  extensions: []\n").success);
  EXPECT_FALSE(parse_project_config("diagnostics:\n  naming_conventions: maybe\n").success);
  EXPECT_FALSE(parse_project_config("diagnostics:\n  max_syntax_errors: -3\n").success);
  EXPECT_FALSE(parse_project_config("logging:\n  level: loud\n").success);
  EXPECT_FALSE(parse_project_config("- just\n- a list\n").success);
}

TEST(ProjectConfigTest, RejectsMalformedYaml)
{
  const auto result = parse_project_config("files: [unclosed\n");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("failed to parse YAML"), std::string::npos);
}

TEST(ProjectConfigTest, LoadFromFile)
{
  const TempDir dir;
  const fs::path config_path = dir.path() / k_project_config_file_name;
  write_file(config_path, "diagnostics:\n  type_references: false\n");

  const auto result = load_project_config(config_path);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_FALSE(result.config.diagnostics.type_references);
}

TEST(ProjectConfigTest, MissingFile)
{
  const TempDir dir;
  const auto result = load_project_config(dir.path() / "nope.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("not found"), std::string::npos);
}

TEST(ProjectConfigTest, FindSearchesUpward)
{
  const TempDir dir;
  const fs::path nested = dir.path() / "idl" / "v1";
  fs::create_directories(nested);
  write_file(dir.path() / k_project_config_file_name, "");

  const auto found = find_project_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(dir.path() / k_project_config_file_name));
}

TEST(ProjectConfigTest, LogLevels)
{
  EXPECT_TRUE(is_valid_log_level("trace"));
  EXPECT_TRUE(is_valid_log_level("off"));
  EXPECT_FALSE(is_valid_log_level("verbose"));
  EXPECT_FALSE(is_valid_log_level(""));
}
