// owncheck/project/project_config.cpp - Project configuration implementation
//
#include "owncheck/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace owncheck
{

namespace
{

/// Parse the 'check' section into `check`; returns an error message on failure.
std::optional<std::string> parse_check_section(const YAML::Node & node, CheckConfig & check)
{
  if (!node.IsMap()) {
    return std::string("'check' must be a map");
  }

  if (node["inputs"]) {
    if (!node["inputs"].IsSequence()) {
      return std::string("check.inputs must be a list");
    }
    for (const auto & input : node["inputs"]) {
      check.inputs.emplace_back(input.as<std::string>());
    }
  }

  if (node["max_value_chain_depth"]) {
    const auto depth = node["max_value_chain_depth"].as<long long>();
    if (depth < 1) {
      return "invalid check.max_value_chain_depth: " + std::to_string(depth) +
             " (must be at least 1)";
    }
    check.max_value_chain_depth = static_cast<size_t>(depth);
  }

  if (node["warnings_as_errors"]) {
    check.warnings_as_errors = node["warnings_as_errors"].as<bool>();
  }

  return std::nullopt;
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());

    // Parse 'package' section
    if (root["package"]) {
      const auto & pkg = root["package"];
      if (pkg["name"]) {
        config.package.name = pkg["name"].as<std::string>();
      }
      if (pkg["version"]) {
        config.package.version = pkg["version"].as<std::string>();
      }
    }

    // Parse 'check' section
    if (root["check"]) {
      if (auto error = parse_check_section(root["check"], config.check)) {
        return ConfigLoadResult::fail(*error);
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
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

}  // namespace owncheck
