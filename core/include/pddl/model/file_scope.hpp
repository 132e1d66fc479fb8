// pddl/model/file_scope.hpp - Domain / problem / unknown file classification
#pragma once

#include <string>
#include <variant>

#include "pddl/syntax/syntax_tree.hpp"

namespace pddl::model
{

/// `(define (domain name) ...)`
struct DomainScope
{
  std::string name;
};

/// `(define (problem name) (:domain domain_name) ...)`
struct ProblemScope
{
  std::string name;
  std::string domain_name;
};

/// Anything without a recognizable header, including an empty document
struct UnknownScope
{
};

using FileScope = std::variant<DomainScope, ProblemScope, UnknownScope>;

/// Classify a document by the header inside its `(define` bracket.
[[nodiscard]] FileScope classify_file(const syntax::SyntaxTree & tree);

[[nodiscard]] inline bool is_domain(const FileScope & scope) noexcept
{
  return std::holds_alternative<DomainScope>(scope);
}

[[nodiscard]] inline bool is_problem(const FileScope & scope) noexcept
{
  return std::holds_alternative<ProblemScope>(scope);
}

}  // namespace pddl::model
