// tests/unit/project/test_project_config.cpp - mtx.yaml loading
//

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "matrix_lang/project/project_config.hpp"

using namespace matrix_lang;
namespace fs = std::filesystem;

namespace
{

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

}  // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(ProjectConfig, FullDocument)
{
  const auto result = parse_project_config(
    "project:\n"
    "  name: demo\n"
    "  entry: src/app.mtx\n"
    "options:\n"
    "  verbose: true\n"
    "  color: false\n"
    "  max_call_depth: 250\n"
    "jit:\n"
    "  enabled: false\n"
    "  debug: true\n",
    "/work/demo");
  ASSERT_TRUE(result.success) << result.error;

  const auto & cfg = result.config;
  EXPECT_EQ(cfg.project.name, "demo");
  EXPECT_EQ(cfg.project.entry.generic_string(), "src/app.mtx");
  EXPECT_TRUE(cfg.options.verbose);
  EXPECT_FALSE(cfg.options.color);
  EXPECT_EQ(cfg.options.max_call_depth, 250U);
  EXPECT_FALSE(cfg.jit.enabled);
  EXPECT_TRUE(cfg.jit.debug);
  EXPECT_EQ(cfg.project_root.generic_string(), "/work/demo");
}

TEST(ProjectConfig, MissingSectionsKeepDefaults)
{
  const auto result = parse_project_config("project:\n  name: tiny\n", "/tmp");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.project.entry.generic_string(), "main.mtx");
  EXPECT_EQ(result.config.options.max_call_depth, 1000U);
  EXPECT_TRUE(result.config.options.color);
  EXPECT_TRUE(result.config.jit.enabled);

  EXPECT_TRUE(parse_project_config("", "/tmp").success);
}

TEST(ProjectConfig, RejectsMalformedYaml)
{
  const auto result = parse_project_config("project: [unclosed\n", "/tmp");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.rfind("failed to parse YAML", 0), 0U) << result.error;
}

TEST(ProjectConfig, RejectsWrongTypes)
{
  auto bad_bool = parse_project_config("jit:\n  enabled: sometimes\n", "/tmp");
  EXPECT_FALSE(bad_bool.success);
  EXPECT_EQ(bad_bool.error, "jit.enabled has the wrong type");

  auto bad_depth = parse_project_config("options:\n  max_call_depth: deep\n", "/tmp");
  EXPECT_FALSE(bad_depth.success);
  EXPECT_EQ(bad_depth.error, "options.max_call_depth has the wrong type");

  EXPECT_FALSE(parse_project_config("- a\n- b\n", "/tmp").success);
  EXPECT_FALSE(parse_project_config("options: 3\n", "/tmp").success);
}

TEST(ProjectConfig, RejectsNonPositiveDepth)
{
  auto result = parse_project_config("options:\n  max_call_depth: 0\n", "/tmp");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "options.max_call_depth must be positive, got 0");
}

TEST(ProjectConfig, DefaultTemplateParses)
{
  const auto result = parse_project_config(default_project_config("fresh"), "/tmp/fresh");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.project.name, "fresh");
  EXPECT_EQ(result.config.project.entry.generic_string(), "main.mtx");
}

// ============================================================================
// Files
// ============================================================================

TEST(ProjectConfig, FindWalksUpward)
{
  const fs::path root = make_temp_dir("mtx_config_find");
  const fs::path nested = root / "a" / "b";
  fs::create_directories(nested);
  write_all(root / k_project_config_file_name, default_project_config("walk"));

  const auto found = find_project_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_TRUE(fs::equivalent(*found, root / k_project_config_file_name));

  const auto loaded = load_project_config(*found);
  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_EQ(loaded.config.project.name, "walk");
  EXPECT_TRUE(fs::equivalent(loaded.config.project_root, root));

  fs::remove_all(root);
}

TEST(ProjectConfig, LoadMissingFile)
{
  const fs::path dir = make_temp_dir("mtx_config_missing");
  const auto result = load_project_config(dir / k_project_config_file_name);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("configuration file not found"), std::string::npos);
  fs::remove_all(dir);
}
