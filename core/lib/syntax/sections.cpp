// pddl/syntax/sections.cpp - Section grammar tables and structural eligibility
#include "pddl/syntax/sections.hpp"

#include <algorithm>
#include <cctype>

namespace pddl::syntax
{
namespace
{

template <typename Table>
SectionList to_list(const Table & table)
{
  return SectionList(table.begin(), table.end());
}

bool contains(gsl::span<const std::string_view> list, std::string_view name)
{
  return std::find(list.begin(), list.end(), name) != list.end();
}

}  // namespace

bool GrammarTable::is_structure(std::string_view name) const noexcept
{
  return std::find(structures.begin(), structures.end(), name) != structures.end();
}

GrammarTable domain_grammar(bool job_scheduling)
{
  GrammarTable table{to_list(k_domain_sections), to_list(k_domain_structures)};
  if (job_scheduling) {
    table.structures.push_back(k_job_structure);
  }
  return table;
}

GrammarTable problem_grammar() { return {to_list(k_problem_sections), {}}; }

GrammarTable action_grammar() { return {to_list(k_action_sections), {}}; }

GrammarTable durative_action_grammar() { return {to_list(k_durative_action_sections), {}}; }

GrammarTable job_grammar() { return {to_list(k_job_sections), {}}; }

SectionList requirement_names(bool job_scheduling)
{
  SectionList names = to_list(k_requirements);
  if (job_scheduling) {
    names.push_back(k_job_scheduling_requirement);
  }
  return names;
}

SectionList sections_before(std::string_view name, gsl::span<const std::string_view> ordered)
{
  auto it = std::find(ordered.begin(), ordered.end(), name);
  if (it == ordered.end()) {
    return SectionList(ordered.begin(), ordered.end());
  }
  return SectionList(ordered.begin(), it);
}

SectionList sections_after(std::string_view name, gsl::span<const std::string_view> ordered)
{
  auto it = std::find(ordered.begin(), ordered.end(), name);
  if (it == ordered.end()) {
    return SectionList(ordered.begin(), ordered.end());
  }
  return SectionList(it + 1, ordered.end());
}

SectionList supported_sections_here(
  const SyntaxNode & reference, const SyntaxNode & current, TokenKind sibling_kind,
  gsl::span<const std::string_view> ordered, gsl::span<const std::string_view> structures)
{
  const auto preceding = reference.preceding_siblings(sibling_kind, &current);
  const auto following = reference.following_siblings(sibling_kind, &current);

  SectionList eligible(ordered.begin(), ordered.end());
  for (const auto * predecessor : preceding) {
    eligible = sections_after(section_name(*predecessor), eligible);
  }
  for (auto it = following.rbegin(); it != following.rend(); ++it) {
    eligible = sections_before(section_name(**it), eligible);
  }

  const auto is_structure = [structures](const SyntaxNode * node) {
    return contains(structures, section_name(*node));
  };
  if (std::all_of(following.begin(), following.end(), is_structure)) {
    eligible.insert(eligible.end(), structures.begin(), structures.end());
  }
  if (std::any_of(preceding.begin(), preceding.end(), is_structure)) {
    eligible.assign(structures.begin(), structures.end());
  }
  return eligible;
}

std::string section_name(const SyntaxNode & node)
{
  std::string name(node.stripped_text());
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return name;
}

const SyntaxNode & preceding_keyword_or_self(const SyntaxNode & node) noexcept
{
  const SyntaxNode * walker = &node;
  while (walker->parent() != nullptr && !walker->parent()->is_open_bracket() &&
         !walker->parent()->is_document()) {
    walker = walker->parent();
  }
  return walker->is(TokenKind::Keyword) ? *walker : node;
}

}  // namespace pddl::syntax
