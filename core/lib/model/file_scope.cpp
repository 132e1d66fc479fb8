// pddl/model/file_scope.cpp - File classification from the define header
#include "pddl/model/file_scope.hpp"

#include <string>

namespace pddl::model
{
namespace
{

using syntax::ConstructKind;
using syntax::SyntaxNode;
using syntax::TokenKind;

/// First plain name nested in a header bracket such as `(domain name)`
std::string header_name(const SyntaxNode & header)
{
  for (const auto * child : header.non_whitespace_children()) {
    if (child->is(TokenKind::Other)) {
      return std::string(child->token_text());
    }
  }
  return {};
}

}  // namespace

FileScope classify_file(const syntax::SyntaxTree & tree)
{
  const SyntaxNode * define = tree.define_node();
  if (define == nullptr) {
    return UnknownScope{};
  }

  if (const auto * domain = define->first_child(TokenKind::OpenBracketOperator, ConstructKind::DomainHeader)) {
    return DomainScope{header_name(*domain)};
  }

  if (const auto * problem = define->first_child(TokenKind::OpenBracketOperator, ConstructKind::ProblemHeader)) {
    ProblemScope scope{header_name(*problem), {}};
    if (const auto * ref = define->first_child(TokenKind::OpenBracketOperator, ConstructKind::DomainReference)) {
      scope.domain_name = header_name(*ref);
    }
    return scope;
  }

  return UnknownScope{};
}

}  // namespace pddl::model
