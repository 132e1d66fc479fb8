// pddl/driver/checker.cpp - Structural check driver
#include "pddl/driver/checker.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <utility>

#include "pddl/syntax/sections.hpp"
#include "pddl/syntax/structure_checker.hpp"
#include "pddl/syntax/syntax_tree.hpp"

namespace fs = std::filesystem;

namespace pddl
{

namespace
{

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

void check_into(CheckResult & result, const fs::path & file, const CheckOptions & options)
{
  const fs::path input_path = fs::absolute(file);

  auto text = read_file(input_path);
  if (!text) {
    result.io_errors.push_back("cannot read file: " + input_path.string());
    return;
  }

  if (options.verbose) {
    std::cerr << "Checking: " << input_path.string() << "\n";
  }

  result.files.push_back(Checker::check_source(input_path, std::move(*text), options));
}

bool all_clean(const CheckResult & result)
{
  if (!result.io_errors.empty()) {
    return false;
  }
  for (const auto & file : result.files) {
    if (file.diagnostics.has_errors()) {
      return false;
    }
  }
  return true;
}

}  // namespace

CheckedFile Checker::check_source(fs::path path, std::string text, const CheckOptions & options)
{
  CheckedFile out;
  out.path = std::move(path);
  out.source = SourceManager(out.path, std::move(text));

  const auto tree = syntax::SyntaxTreeBuilder::build(out.source.get_source());
  out.scope = model::classify_file(tree);

  std::optional<syntax::GrammarTable> grammar;
  if (model::is_domain(out.scope)) {
    grammar = syntax::domain_grammar(options.job_scheduling);
  } else if (model::is_problem(out.scope)) {
    grammar = syntax::problem_grammar();
  }

  syntax::StructureChecker checker(&out.diagnostics);
  (void)checker.check(tree, grammar ? &*grammar : nullptr);
  return out;
}

CheckResult Checker::check_file(const fs::path & file, const CheckOptions & options)
{
  CheckResult result;
  check_into(result, file, options);
  result.success = all_clean(result);
  return result;
}

CheckResult Checker::check_project(const ProjectConfig & config, const CheckOptions & options)
{
  CheckOptions effective = options;
  effective.job_scheduling = options.job_scheduling || config.completion.job_scheduling;

  CheckResult result;
  for (const auto & file : config.files) {
    const fs::path path = file.is_absolute() ? file : config.project_root / file;
    check_into(result, path, effective);
  }
  result.success = all_clean(result);
  return result;
}

}  // namespace pddl
