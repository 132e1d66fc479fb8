// pddl/syntax/construct_kind.hpp - Construct tags attached to syntax nodes
#pragma once

#include <cstdint>
#include <string_view>

#include "pddl/syntax/token.hpp"

namespace pddl::syntax
{

/**
 * What a bracket or keyword node opens, decided once while the tree is built.
 *
 * Only OpenBracketOperator and Keyword nodes carry a tag other than None.
 * Matching is case-insensitive and ignores whitespace between '(' and the
 * operator.
 */
enum class ConstructKind : uint8_t {
  None,

  // (define ...) and its headers
  Define,
  DomainHeader,   // (domain name)
  ProblemHeader,  // (problem name)

  // domain sections
  Requirements,
  Types,
  Constants,
  Predicates,
  Functions,
  Constraints,

  // problem sections
  DomainReference,  // (:domain name)
  Objects,
  Init,
  Goal,
  Metric,

  // domain structures
  Derived,
  Action,
  DurativeAction,
  Process,
  Event,
  Job,

  // expression forms
  And,
  Not,
  AtStart,
  AtEnd,
  OverAll,
  Forall,
  Exists,
  When,
  OtherOperator,  // any other bracket operator, e.g. `(or`, `(>=`, `(:unknown`

  // keywords inside structures
  Parameters,
  Precondition,
  Effect,
  Duration,
  Condition,
  OtherKeyword,
};

/// Tag for a token; None for everything except bracket operators and keywords.
[[nodiscard]] ConstructKind classify_construct(TokenKind kind, std::string_view text);

[[nodiscard]] std::string_view to_string(ConstructKind kind) noexcept;

/// Structures that declare `?parameters` visible to their nested expressions
[[nodiscard]] constexpr bool is_parametrisable(ConstructKind kind) noexcept
{
  switch (kind) {
    case ConstructKind::Action:
    case ConstructKind::DurativeAction:
    case ConstructKind::Process:
    case ConstructKind::Event:
    case ConstructKind::Derived:
    case ConstructKind::Job:
    case ConstructKind::Forall:
    case ConstructKind::Exists:
      return true;
    default:
      return false;
  }
}

/// Action-like structures whose parameters live under a `:parameters` keyword
[[nodiscard]] constexpr bool has_parameters_keyword(ConstructKind kind) noexcept
{
  return kind == ConstructKind::Action || kind == ConstructKind::DurativeAction ||
         kind == ConstructKind::Process || kind == ConstructKind::Event ||
         kind == ConstructKind::Job;
}

}  // namespace pddl::syntax
