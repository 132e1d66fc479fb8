// pddl/syntax/sections.hpp - Section grammar tables and structural eligibility
#pragma once

#include <array>
#include <gsl/span>
#include <string>
#include <string_view>
#include <vector>

#include "pddl/syntax/syntax_tree.hpp"

namespace pddl::syntax
{

// NOTE: These tables are the accepted section order of the language. A
// section may be omitted, but the ones present must keep this relative order.

inline constexpr std::array<std::string_view, 7> k_domain_sections = {
  "domain", ":requirements", ":types", ":constants", ":predicates", ":functions", ":constraints",
};

inline constexpr std::array<std::string_view, 5> k_domain_structures = {
  ":derived", ":action", ":durative-action", ":process", ":event",
};

/// Extra structure offered when job scheduling is enabled
inline constexpr std::string_view k_job_structure = ":job";

inline constexpr std::array<std::string_view, 8> k_problem_sections = {
  "problem", ":domain", ":requirements", ":objects", ":init", ":goal", ":constraints", ":metric",
};

inline constexpr std::array<std::string_view, 3> k_action_sections = {
  ":parameters", ":precondition", ":effect",
};

inline constexpr std::array<std::string_view, 4> k_durative_action_sections = {
  ":parameters", ":duration", ":condition", ":effect",
};

/// Job body: a durative action whose duration comes from the scheduling model
inline constexpr std::array<std::string_view, 3> k_job_sections = {
  ":parameters", ":condition", ":effect",
};

inline constexpr std::array<std::string_view, 25> k_requirements = {
  ":strips",
  ":typing",
  ":negative-preconditions",
  ":disjunctive-preconditions",
  ":equality",
  ":existential-preconditions",
  ":universal-preconditions",
  ":quantified-preconditions",
  ":conditional-effects",
  ":fluents",
  ":numeric-fluents",
  ":object-fluents",
  ":adl",
  ":durative-actions",
  ":duration-inequalities",
  ":continuous-effects",
  ":derived-predicates",
  ":derived-functions",
  ":timed-initial-literals",
  ":timed-effects",
  ":preferences",
  ":constraints",
  ":action-costs",
  ":timed-initial-fluents",
  ":time",
};

inline constexpr std::string_view k_job_scheduling_requirement = ":job-scheduling";

using SectionList = std::vector<std::string_view>;

/**
 * Ordered sections plus the freely repeating structures of one construct.
 *
 * The two lists are disjoint; structures may only follow the ordered sections.
 */
struct GrammarTable
{
  SectionList ordered;
  SectionList structures;

  [[nodiscard]] bool is_structure(std::string_view name) const noexcept;
};

[[nodiscard]] GrammarTable domain_grammar(bool job_scheduling = false);
[[nodiscard]] GrammarTable problem_grammar();
[[nodiscard]] GrammarTable action_grammar();
[[nodiscard]] GrammarTable durative_action_grammar();
[[nodiscard]] GrammarTable job_grammar();

/// Requirement flags offered inside `(:requirements`
[[nodiscard]] SectionList requirement_names(bool job_scheduling = false);

/// Prefix of `ordered` strictly before `name`; all of `ordered` when absent.
[[nodiscard]] SectionList sections_before(
  std::string_view name, gsl::span<const std::string_view> ordered);

/// Suffix of `ordered` strictly after `name`; all of `ordered` when absent.
[[nodiscard]] SectionList sections_after(
  std::string_view name, gsl::span<const std::string_view> ordered);

/**
 * Sections still insertable at `current`.
 *
 * Siblings of `reference` with kind `sibling_kind` that start before `current`
 * rule out themselves and everything ordered before them; siblings that start
 * after `current` rule out themselves and everything ordered after them.
 * Structures are appended when every following sibling is a structure, and
 * once a structure precedes the cursor only structures remain.
 */
[[nodiscard]] SectionList supported_sections_here(
  const SyntaxNode & reference, const SyntaxNode & current, TokenKind sibling_kind,
  gsl::span<const std::string_view> ordered, gsl::span<const std::string_view> structures);

/// Lower-cased section name of a bracket or keyword node, e.g. ":action"
[[nodiscard]] std::string section_name(const SyntaxNode & node);

/// Keyword owning `node` within its bracket, or `node` itself
[[nodiscard]] const SyntaxNode & preceding_keyword_or_self(const SyntaxNode & node) noexcept;

}  // namespace pddl::syntax
