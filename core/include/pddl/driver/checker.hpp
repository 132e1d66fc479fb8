// pddl/driver/checker.hpp - Structural check driver
//
// Single entry point for checking files from disk.
// Used by the CLI; the language server goes through lsp::Workspace instead.
//
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "pddl/basic/diagnostic.hpp"
#include "pddl/basic/source_manager.hpp"
#include "pddl/model/file_scope.hpp"
#include "pddl/project/project_config.hpp"

namespace pddl
{

// ============================================================================
// Check Options / Result
// ============================================================================

struct CheckOptions
{
  /// Accept `(:job` as a domain structure when checking section order
  bool job_scheduling = false;

  /// Enable verbose output
  bool verbose = false;
};

struct CheckedFile
{
  std::filesystem::path path;
  SourceManager source;
  model::FileScope scope = model::UnknownScope{};
  DiagnosticBag diagnostics;
};

struct CheckResult
{
  /// Whether every file was read and has no errors (warnings allowed)
  bool success = false;

  std::vector<CheckedFile> files;

  /// Files that could not be read
  std::vector<std::string> io_errors;
};

// ============================================================================
// Checker
// ============================================================================

class Checker
{
public:
  /**
   * Check a single domain or problem file.
   *
   * @param file Path to the .pddl file
   * @param options Check options
   */
  [[nodiscard]] static CheckResult check_file(
    const std::filesystem::path & file, const CheckOptions & options);

  /**
   * Check every file listed in a project configuration.
   *
   * `completion.job_scheduling` from the config is OR-ed into the options.
   */
  [[nodiscard]] static CheckResult check_project(
    const ProjectConfig & config, const CheckOptions & options);

  /// Check text that is already in memory.
  [[nodiscard]] static CheckedFile check_source(
    std::filesystem::path path, std::string text, const CheckOptions & options);
};

}  // namespace pddl
