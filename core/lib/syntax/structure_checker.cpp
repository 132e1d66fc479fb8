// pddl/syntax/structure_checker.cpp - Bracket balance and section order checks
#include "pddl/syntax/structure_checker.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <string>
#include <utility>

namespace pddl::syntax
{

bool StructureChecker::check(const SyntaxTree & tree, const GrammarTable * grammar)
{
  for (const auto & token : tree.offending_tokens()) {
    report_error(
      token.range(), diag_code::k_unmatched_close, "unmatched closing bracket",
      "no '(' to close here");
  }

  check_unclosed(tree.root());

  if (grammar != nullptr) {
    if (const auto * define = tree.define_node()) {
      check_section_order(*define, *grammar);
    }
  }

  return !has_errors();
}

void StructureChecker::check_unclosed(const SyntaxNode & node)
{
  if (node.is_open_bracket() && !node.is_closed()) {
    report_error(
      node.token().range(), diag_code::k_unclosed_open,
      fmt::format("unclosed bracket '{}'", node.token_text()), "this '(' is never closed",
      FixIt{SourceRange(node.end(), node.end()), ")"});
  }
  for (const auto * child : node.children()) {
    check_unclosed(*child);
  }
}

void StructureChecker::check_section_order(const SyntaxNode & define, const GrammarTable & grammar)
{
  const auto & ordered = grammar.ordered;

  // furthest ordered section seen so far, and the first structure
  const SyntaxNode * furthest = nullptr;
  size_t furthest_index = 0;
  const SyntaxNode * first_structure = nullptr;

  for (const auto * child : define.non_whitespace_children()) {
    if (!child->is(TokenKind::OpenBracketOperator)) {
      continue;
    }
    const std::string name = section_name(*child);

    if (grammar.is_structure(name)) {
      if (first_structure == nullptr) {
        first_structure = child;
      }
      continue;
    }

    auto it = std::find(ordered.begin(), ordered.end(), name);
    if (it == ordered.end()) {
      continue;
    }
    const auto index = static_cast<size_t>(it - ordered.begin());

    if (first_structure != nullptr) {
      report_warning(
        child->token().range(),
        fmt::format("section '{}' must come before '{}'", name, section_name(*first_structure)),
        "written after a structure", first_structure->token().range(), "first structure here",
        grammar);
    } else if (furthest != nullptr && index < furthest_index) {
      report_warning(
        child->token().range(),
        fmt::format("section '{}' must come before '{}'", name, section_name(*furthest)),
        "out of order", furthest->token().range(), "written earlier here", grammar);
    }

    if (furthest == nullptr || index > furthest_index) {
      furthest = child;
      furthest_index = index;
    }
  }
}

void StructureChecker::report_error(
  SourceRange range, std::string_view code, std::string message, std::string label,
  std::optional<FixIt> fixit)
{
  ++error_count_;
  if (diags_ == nullptr) {
    return;
  }
  auto builder = diags_->report_error(range, std::move(message), std::move(label));
  builder.with_code(std::string(code));
  if (fixit) {
    builder.with_fixit(fixit->range, std::move(fixit->replacement_text));
  }
}

void StructureChecker::report_warning(
  SourceRange range, std::string message, std::string label, SourceRange related,
  std::string related_label, const GrammarTable & grammar)
{
  ++warning_count_;
  if (diags_ == nullptr) {
    return;
  }
  std::string help = fmt::format("expected order: {}", fmt::join(grammar.ordered, " "));
  if (!grammar.structures.empty()) {
    help += fmt::format(", then {}", fmt::join(grammar.structures, " "));
  }
  diags_->report_warning(range, std::move(message), std::move(label))
    .with_code(diag_code::k_section_order)
    .with_secondary_label(related, std::move(related_label))
    .with_help(std::move(help));
}

}  // namespace pddl::syntax
