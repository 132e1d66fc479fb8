// pddl/lsp/domain_completion.cpp - Domain file completion
#include <utility>

#include "pddl/lsp/completion_providers.hpp"
#include "pddl/syntax/sections.hpp"

namespace pddl::lsp
{
namespace
{

using syntax::ConstructKind;
using syntax::SyntaxNode;
using syntax::TokenKind;

constexpr std::string_view k_duration_snippet =
  ":duration ${2|(= ?duration 1),(> ?duration 0),(<= ?duration 10),"
  "(and (>= ?duration 1)(<= ?duration 2))|}";

std::string join_lines(std::initializer_list<std::string_view> lines)
{
  std::string out;
  bool first = true;
  for (const auto line : lines) {
    if (!first) {
      out += '\n';
    }
    out += line;
    first = false;
  }
  return out;
}

/// Names of the `?parameters` declared directly in a parameter list
std::vector<std::string> parameter_names(const SyntaxNode & definition)
{
  std::vector<std::string> names;
  for (const auto * child : definition.nested_children()) {
    if (child->is(TokenKind::Parameter)) {
      names.emplace_back(child->token_text());
    }
  }
  return names;
}

}  // namespace

// ============================================================================
// Shared helpers
// ============================================================================

std::optional<SourceRange> trigger_replace_range(
  const CompletionRequest & request, const SyntaxNode & current)
{
  if (request.triggered_by('(') || request.triggered_by(':')) {
    return current.range();
  }
  return std::nullopt;
}

std::vector<CompletionItem> requirement_items(
  const SuggestionTable & table, const CompletionContext & ctx, bool job_scheduling)
{
  const auto range = trigger_replace_range(ctx.request, *ctx.scope.current);

  std::vector<CompletionItem> items;
  const auto names = syntax::requirement_names(job_scheduling);
  for (size_t i = 0; i < names.size(); ++i) {
    const auto suggestion = Suggestion::from(names[i], ctx.request.trigger_character, "");
    if (!suggestion) {
      continue;
    }
    items.push_back(make_snippet_item(
      table, SuggestionGroup::Domain, *suggestion, std::string(names[i]), range, i));
  }
  return items;
}

std::string to_type_less_names_csv(const std::vector<model::Declaration> & declarations)
{
  std::string csv;
  for (const auto & d : declarations) {
    if (!csv.empty()) {
      csv += ',';
    }
    csv += d.declared_name_without_types;
  }
  return csv;
}

// ============================================================================
// DomainCompletionProvider
// ============================================================================

DomainCompletionProvider::DomainCompletionProvider(
  std::shared_ptr<const SuggestionTable> table, CompletionOptions options)
: table_(std::move(table)), options_(options)
{
}

std::vector<CompletionItem> DomainCompletionProvider::provide(
  const CompletionContext & ctx, const model::DomainInfo & domain) const
{
  switch (ctx.scope.position) {
    case StructuralPosition::InsideDefine:
      return define_items(ctx);
    case StructuralPosition::InsideRequirements:
      return requirement_items(*table_, ctx, options_.job_scheduling);
    case StructuralPosition::InsideActionBody:
      return body_items(ctx, syntax::action_grammar());
    case StructuralPosition::InsideDurativeActionBody:
      return body_items(
        ctx, ctx.scope.scope != nullptr && ctx.scope.scope->construct() == ConstructKind::Job
               ? syntax::job_grammar()
               : syntax::durative_action_grammar());
    case StructuralPosition::InsideEffect:
      return effect_items(ctx, domain);
    case StructuralPosition::InsideCondition:
      return condition_items(ctx);
    case StructuralPosition::ParameterReference:
      return parameter_items(ctx);
    case StructuralPosition::BeforeDefine:
    case StructuralPosition::InsideInit:
    case StructuralPosition::Unknown:
      break;
  }
  return {};
}

std::vector<CompletionItem> DomainCompletionProvider::define_items(const CompletionContext & ctx) const
{
  const SyntaxNode & current = *ctx.scope.current;
  const auto grammar = syntax::domain_grammar(options_.job_scheduling);
  const auto eligible = syntax::supported_sections_here(
    *ctx.scope.reference, current, TokenKind::OpenBracketOperator, grammar.ordered,
    grammar.structures);
  const auto range = trigger_replace_range(ctx.request, current);

  std::vector<CompletionItem> items;
  for (size_t i = 0; i < eligible.size(); ++i) {
    const auto suggestion = Suggestion::from(eligible[i], ctx.request.trigger_character, "(");
    if (!suggestion) {
      continue;
    }
    if (auto snippet = define_snippet(eligible[i])) {
      items.push_back(make_snippet_item(
        *table_, SuggestionGroup::Domain, *suggestion, std::move(*snippet), range, i));
    }
  }
  return items;
}

std::optional<std::string> DomainCompletionProvider::define_snippet(std::string_view section) const
{
  if (section == "domain") {
    return std::string("(domain ${1:domain_name})");
  }
  if (section == ":requirements") {
    return std::string("(:requirements :strips $0)");
  }
  if (section == ":types" || section == ":constants" || section == ":predicates" ||
      section == ":functions") {
    return "(" + std::string(section) + "\n\t$0\n)";
  }
  if (section == ":constraints") {
    return "(" + std::string(section) + " (and\n\t$0\n))";
  }
  if (section == ":derived") {
    return join_lines({"(:derived (${1:derived_name} $2)", "    $0", ")", ""});
  }
  if (section == ":action") {
    return join_lines({
      "(:action ${1:action_name}",
      "    :parameters ($0)",
      "    :precondition (and )",
      "    :effect (and )",
      ")",
      "",
    });
  }
  if (section == ":durative-action") {
    const std::string duration_line = "    " + std::string(k_duration_snippet);
    return join_lines({
      "(:durative-action ${1:action_name}",
      "    :parameters ($0)",
      duration_line,
      "    :condition (and ",
      "        (at start (and ",
      "        ))",
      "        (over all (and ",
      "        ))",
      "        (at end (and ",
      "        ))",
      "    )",
      "    :effect (and ",
      "        (at start (and ",
      "        ))",
      "        (at end (and ",
      "        ))",
      "    )",
      ")",
      "",
    });
  }
  if (section == ":job" && options_.job_scheduling) {
    return join_lines({
      "(:job ${1:job_name}",
      "    :parameters ($0)",
      "    :condition (and ",
      "        (at start (and ",
      "        ))",
      "    )",
      "    :effect (and ",
      "        (at start (and ",
      "        ))",
      "        (at end (and ",
      "        ))",
      "    )",
      ")",
      "",
    });
  }
  if (section == ":process") {
    return join_lines({
      "(:process ${1:process_name}",
      "    :parameters ($0)",
      "    :precondition (and",
      "        ; activation condition",
      "    )",
      "    :effect (and",
      "        ; continuous effect(s)",
      "    )",
      ")",
      "",
    });
  }
  if (section == ":event") {
    return join_lines({
      "(:event ${1:event_name}",
      "    :parameters ($0)",
      "    :precondition (and",
      "        ; trigger condition",
      "    )",
      "    :effect (and",
      "        ; discrete effect(s)",
      "    )",
      ")",
      "",
    });
  }
  return std::nullopt;
}

std::vector<CompletionItem> DomainCompletionProvider::body_items(
  const CompletionContext & ctx, const syntax::GrammarTable & grammar) const
{
  const SyntaxNode & current = *ctx.scope.current;
  const auto eligible = syntax::supported_sections_here(
    *ctx.scope.reference, current, TokenKind::Keyword, grammar.ordered, {});
  const auto range = trigger_replace_range(ctx.request, current);

  std::vector<CompletionItem> items;
  for (size_t i = 0; i < eligible.size(); ++i) {
    const std::string_view section = eligible[i];
    const auto suggestion = Suggestion::from(section, ctx.request.trigger_character, "");
    if (!suggestion) {
      continue;
    }
    std::string snippet;
    if (section == ":parameters") {
      snippet = ":parameters ($0)";
    } else if (section == ":duration") {
      snippet = std::string(k_duration_snippet);
    } else if (section == ":precondition" || section == ":condition" || section == ":effect") {
      snippet = std::string(section) + " (and \n\t$0\n)";
    } else {
      continue;
    }
    items.push_back(make_snippet_item(
      *table_, SuggestionGroup::Domain, *suggestion, std::move(snippet), range, i));
  }
  return items;
}

std::vector<CompletionItem> DomainCompletionProvider::effect_items(
  const CompletionContext & ctx, const model::DomainInfo & domain) const
{
  const auto & request = ctx.request;
  if (request.trigger_kind != TriggerKind::Invoke && !request.triggered_by('(')) {
    return {};
  }

  const SyntaxNode & node = ctx.node;
  const std::optional<SourceRange> range =
    request.triggered_by('(') ? std::optional<SourceRange>(node.range()) : std::nullopt;
  const std::optional<char> trigger = request.trigger_character;

  std::vector<CompletionItem> items;
  const auto push = [&](SuggestionGroup group, std::string_view name, std::string snippet,
                        size_t index) {
    if (const auto suggestion = Suggestion::from(name, trigger, "(")) {
      items.push_back(make_snippet_item(*table_, group, *suggestion, std::move(snippet), range, index));
    }
  };

  const std::string functions_csv = to_type_less_names_csv(domain.functions);
  const std::string predicates_csv = to_type_less_names_csv(domain.predicates);
  const std::string function_choice = to_selection(1, functions_csv, "new_function");

  if (is_inside_durative_unqualified_effect(node)) {
    push(SuggestionGroup::DurativeEffect, "at start", "(at start $0)", 1);
    push(SuggestionGroup::DurativeEffect, "at end", "(at end $0)", 2);
  }

  if (is_inside_action_or_event(node) || is_inside_durative_discrete_effect(node)) {
    constexpr auto g = SuggestionGroup::DiscreteEffect;
    push(g, "not", "(not (" + to_selection(1, predicates_csv, "new_predicate") + "))$0", 0);
    push(g, "assign", "(assign (" + function_choice + ") ${2:0})$0", 1);
    push(g, "increase", "(increase (" + function_choice + ") ${2:1})$0", 2);
    push(g, "decrease", "(decrease (" + function_choice + ") ${2:1})$0", 3);
    push(g, "forall", "(forall ($1) $2)$0", 4);
    push(g, "when", "(when ${1:condition} ${2:effect})$0", 5);
  }

  if (is_inside_process(node) || is_inside_durative_unqualified_effect(node)) {
    constexpr auto g = SuggestionGroup::ContinuousEffect;
    push(g, "increase", "(increase (" + function_choice + ") (* #t ${2:1.0}))$0", 2);
    push(g, "decrease", "(decrease (" + function_choice + ") (* #t ${2:1.0}))$0", 3);
    push(g, "forall", "(forall ($1) $2)$0", 4);
  }

  return items;
}

std::vector<CompletionItem> DomainCompletionProvider::condition_items(
  const CompletionContext & ctx) const
{
  const auto & request = ctx.request;
  if (request.trigger_kind != TriggerKind::Invoke && !request.triggered_by('(')) {
    return {};
  }
  const std::optional<SourceRange> range =
    request.triggered_by('(') ? std::optional<SourceRange>(ctx.node.range()) : std::nullopt;

  std::vector<CompletionItem> items;
  size_t index = 1;
  for (const std::string_view qualifier : {"at start", "at end", "over all"}) {
    if (const auto s = Suggestion::from(qualifier, request.trigger_character, "(")) {
      items.push_back(make_snippet_item(
        *table_, SuggestionGroup::DurativeCondition, *s, "(" + std::string(qualifier) + " $0)",
        range, index));
    }
    ++index;
  }
  return items;
}

std::vector<CompletionItem> DomainCompletionProvider::parameter_items(
  const CompletionContext & ctx) const
{
  const SourceRange range = ctx.node.range();

  std::vector<std::string> names;
  for (const auto * scope : ctx.node.parametrisable_scopes()) {
    if (const auto * definition = scope->parameter_definition()) {
      auto scope_names = parameter_names(*definition);
      names.insert(names.end(), scope_names.begin(), scope_names.end());
    }
  }

  std::vector<CompletionItem> items;
  for (size_t i = 0; i < names.size(); ++i) {
    if (const auto s = Suggestion::from(names[i], ctx.request.trigger_character, "")) {
      items.push_back(
        make_snippet_item(*table_, SuggestionGroup::Domain, *s, names[i], range, i));
    }
  }
  return items;
}

}  // namespace pddl::lsp
