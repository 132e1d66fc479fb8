// pddl/model/problem_info.cpp - Object extraction from a problem tree
#include "pddl/model/problem_info.hpp"

#include <algorithm>
#include <string>

namespace pddl::model
{

using syntax::ConstructKind;
using syntax::TokenKind;

ProblemInfo extract_problem_info(const syntax::SyntaxTree & tree)
{
  ProblemInfo info;
  const syntax::SyntaxNode * define = tree.define_node();
  if (define == nullptr) {
    return info;
  }
  if (const auto * objects = define->first_child(TokenKind::OpenBracketOperator, ConstructKind::Objects)) {
    info.objects = typed_list(*objects);
  }
  return info;
}

std::vector<std::string> objects_of_types(
  const std::vector<TypedName> & objects, const std::vector<std::string> & types)
{
  const auto contains = [](const std::vector<std::string> & list, const std::string & value) {
    return std::find(list.begin(), list.end(), value) != list.end();
  };

  std::vector<std::string> declared_types;
  for (const auto & object : objects) {
    if (!contains(declared_types, object.type)) {
      declared_types.push_back(object.type);
    }
  }

  std::vector<std::string> out;
  for (const auto & type : declared_types) {
    if (!contains(types, type)) {
      continue;
    }
    for (const auto & object : objects) {
      if (object.type == type && !contains(out, object.name)) {
        out.push_back(object.name);
      }
    }
  }
  return out;
}

}  // namespace pddl::model
