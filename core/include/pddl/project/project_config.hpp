// pddl/project/project_config.hpp - Project configuration (pddl.yaml)
//
// Shared by the CLI and the language server.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pddl
{

struct PackageConfig
{
  std::string name;
  std::string version;
};

/// `completion:` section
struct CompletionConfig
{
  /// Offer `:job` structures and the `:job-scheduling` requirement
  bool job_scheduling = false;
};

/// Complete project configuration (pddl.yaml)
struct ProjectConfig
{
  PackageConfig package;
  CompletionConfig completion;

  /// Domain and problem files checked together, resolved against project_root
  std::vector<std::filesystem::path> files;

  /// Directory containing pddl.yaml
  std::filesystem::path project_root;
};

struct ConfigLoadResult
{
  ProjectConfig config;
  bool success = false;
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
    return r;
  }
};

/**
 * Load a project configuration from a pddl.yaml file.
 *
 * @param config_path Path to pddl.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Search for pddl.yaml from start_dir (or the directory of a file) up to the
 * filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "pddl.yaml";

}  // namespace pddl
