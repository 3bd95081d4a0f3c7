// matrix_lang/project/project_config.cpp - Project configuration implementation
//
#include "matrix_lang/project/project_config.hpp"

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <system_error>

namespace matrix_lang
{

namespace
{

/// Read `section.key` into `out` when present. Returns an error message on a type mismatch.
template <typename T>
std::optional<std::string> read_field(
  const YAML::Node & section, const char * section_name, const char * key, T & out)
{
  const YAML::Node node = section[key];
  if (!node) return std::nullopt;
  try {
    out = node.as<T>();
  } catch (const YAML::Exception &) {
    return fmt::format("{}.{} has the wrong type", section_name, key);
  }
  return std::nullopt;
}

ConfigLoadResult load_from_node(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'project' section
  if (const YAML::Node project = root["project"]) {
    if (!project.IsMap()) return ConfigLoadResult::fail("project must be a map");
    if (auto err = read_field(project, "project", "name", config.project.name)) {
      return ConfigLoadResult::fail(*err);
    }
    std::string entry = config.project.entry.string();
    if (auto err = read_field(project, "project", "entry", entry)) {
      return ConfigLoadResult::fail(*err);
    }
    config.project.entry = entry;
  }

  // Parse 'options' section
  if (const YAML::Node options = root["options"]) {
    if (!options.IsMap()) return ConfigLoadResult::fail("options must be a map");
    if (auto err = read_field(options, "options", "verbose", config.options.verbose)) {
      return ConfigLoadResult::fail(*err);
    }
    if (auto err = read_field(options, "options", "color", config.options.color)) {
      return ConfigLoadResult::fail(*err);
    }
    int64_t depth = static_cast<int64_t>(config.options.max_call_depth);
    if (auto err = read_field(options, "options", "max_call_depth", depth)) {
      return ConfigLoadResult::fail(*err);
    }
    if (depth <= 0) {
      return ConfigLoadResult::fail(
        fmt::format("options.max_call_depth must be positive, got {}", depth));
    }
    config.options.max_call_depth = static_cast<size_t>(depth);
  }

  // Parse 'jit' section
  if (const YAML::Node jit = root["jit"]) {
    if (!jit.IsMap()) return ConfigLoadResult::fail("jit must be a map");
    if (auto err = read_field(jit, "jit", "enabled", config.jit.enabled)) {
      return ConfigLoadResult::fail(*err);
    }
    if (auto err = read_field(jit, "jit", "debug", config.jit.debug)) {
      return ConfigLoadResult::fail(*err);
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return load_from_node(root, project_root);
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return load_from_node(root, fs::absolute(config_path).parent_path());
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::string default_project_config(const std::string & project_name)
{
  return fmt::format(
    "project:\n"
    "  name: {}\n"
    "  entry: main.mtx\n"
    "options:\n"
    "  verbose: false\n"
    "  color: true\n"
    "  max_call_depth: 1000\n"
    "jit:\n"
    "  enabled: true\n"
    "  debug: false\n",
    project_name);
}

}  // namespace matrix_lang
