// pddl/model/problem_info.hpp - Objects collected from a problem file
#pragma once

#include <string>
#include <vector>

#include "pddl/model/domain_info.hpp"
#include "pddl/syntax/syntax_tree.hpp"

namespace pddl::model
{

struct ProblemInfo
{
  std::vector<TypedName> objects;  // `(:objects` in declaration order
};

/// Collect the objects of a problem document. A missing section stays empty.
[[nodiscard]] ProblemInfo extract_problem_info(const syntax::SyntaxTree & tree);

/**
 * Names of `objects` whose declared type is one of `types`.
 *
 * Objects are grouped by declared type in order of first appearance;
 * duplicates are dropped.
 */
[[nodiscard]] std::vector<std::string> objects_of_types(
  const std::vector<TypedName> & objects, const std::vector<std::string> & types);

}  // namespace pddl::model
