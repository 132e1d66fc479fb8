// pddl/project/project_config.cpp - Project configuration implementation
//
#include "pddl/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace pddl
{

namespace
{

std::optional<std::string> parse_config(const YAML::Node & root, ProjectConfig & config)
{
  if (root["package"]) {
    const auto & pkg = root["package"];
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.package.version = pkg["version"].as<std::string>();
    }
  }

  if (root["completion"]) {
    const auto & completion = root["completion"];
    if (!completion.IsMap()) {
      return "completion must be a map";
    }
    if (completion["job_scheduling"]) {
      config.completion.job_scheduling = completion["job_scheduling"].as<bool>();
    }
  }

  if (root["files"]) {
    if (!root["files"].IsSequence()) {
      return "files must be a list";
    }
    for (const auto & file : root["files"]) {
      std::filesystem::path path = file.as<std::string>();
      if (path.is_relative()) {
        path = config.project_root / path;
      }
      config.files.push_back(path.lexically_normal());
    }
  }
  return std::nullopt;
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    if (auto error = parse_config(root, config)) {
      return ConfigLoadResult::fail(*error);
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
      break;
    }
    current = parent;
  }
  return std::nullopt;
}

}  // namespace pddl
