// matrix_lang/project/project_config.hpp - Project configuration (mtx.yaml)
//
// Parses and validates mtx.yaml project configuration files.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace matrix_lang
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Project metadata section.
 */
struct ProjectSection
{
  std::string name;

  /// Script run by `mtx run` without a file argument (relative to mtx.yaml)
  std::filesystem::path entry = "main.mtx";
};

/**
 * Driver and interpreter options.
 */
struct OptionsSection
{
  bool verbose = false;
  bool color = true;
  size_t max_call_depth = 1000;
};

/**
 * JIT-eligibility analysis settings.
 */
struct JitSection
{
  bool enabled = true;

  /// Print one line per analyzed binding
  bool debug = false;
};

/**
 * Complete project configuration (mtx.yaml).
 */
struct ProjectConfig
{
  ProjectSection project;
  OptionsSection options;
  JitSection jit;

  /// Directory containing mtx.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a mtx.yaml file.
 *
 * Never throws: unreadable files, invalid YAML and fields of the wrong
 * type are reported through ConfigLoadResult::error.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/// Parse configuration text (the loader without the file access).
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @return Path to mtx.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/// YAML text of a default configuration, as written by `mtx init`.
[[nodiscard]] std::string default_project_config(const std::string & project_name);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "mtx.yaml";

}  // namespace matrix_lang
