// pddl/lsp/problem_completion.cpp - Problem and unknown file completion
#include <fmt/format.h>

#include <algorithm>
#include <utility>

#include "pddl/lsp/completion_providers.hpp"
#include "pddl/model/problem_info.hpp"
#include "pddl/syntax/sections.hpp"

namespace pddl::lsp
{
namespace
{

using syntax::SyntaxNode;
using syntax::TokenKind;

std::optional<std::string> problem_section_snippet(std::string_view section)
{
  if (section == "problem") {
    return std::string("(problem ${1:problem_name})");
  }
  if (section == ":domain") {
    return std::string("(:domain ${1:domain_name})");
  }
  if (section == ":requirements") {
    return std::string("(:requirements :strips $0)");
  }
  if (section == ":objects" || section == ":init") {
    return "(" + std::string(section) + "\n\t$0\n)";
  }
  if (section == ":goal" || section == ":constraints") {
    return "(" + std::string(section) + " (and\n\t$0\n))";
  }
  if (section == ":metric") {
    return std::string("(:metric ${1|minimize,maximize|} ($0))");
  }
  return std::nullopt;
}

/// Two parameters of one type, e.g. `(road ?from ?to - place)`
bool is_symmetric(const model::Declaration & declaration)
{
  return declaration.parameters.size() == 2 &&
         declaration.parameters[0].type == declaration.parameters[1].type;
}

std::vector<model::Declaration> symmetric_only(const std::vector<model::Declaration> & declarations)
{
  std::vector<model::Declaration> out;
  for (const auto & d : declarations) {
    if (is_symmetric(d)) {
      out.push_back(d);
    }
  }
  return out;
}

std::string join_csv(const std::vector<std::string> & values)
{
  std::string csv;
  for (const auto & v : values) {
    if (!csv.empty()) {
      csv += ',';
    }
    csv += v;
  }
  return csv;
}

std::string names_csv(const std::vector<model::Declaration> & declarations)
{
  std::vector<std::string> names;
  names.reserve(declarations.size());
  for (const auto & d : declarations) {
    names.push_back(d.name);
  }
  return join_csv(names);
}

/// Parameter types of the declarations together with every type inheriting from them
std::vector<std::string> involved_types(
  const std::vector<model::Declaration> & declarations, const model::DomainInfo & domain)
{
  std::vector<std::string> types;
  const auto add = [&types](const std::string & type) {
    if (std::find(types.begin(), types.end(), type) == types.end()) {
      types.push_back(type);
    }
  };
  for (const auto & d : declarations) {
    for (const auto & p : d.parameters) {
      add(p.type);
      for (const auto & sub : domain.subtypes_of(p.type)) {
        add(sub);
      }
    }
  }
  return types;
}

CompletionItem init_snippet(std::string label, std::string insert_text)
{
  CompletionItem item;
  item.label = std::move(label);
  item.kind = CompletionItemKind::Snippet;
  item.insert_text = std::move(insert_text);
  item.insert_text_format = InsertTextFormat::Snippet;
  item.filter_text = item.label;
  return item;
}

CompletionItem module_item(std::string label, std::string insert_text)
{
  CompletionItem item;
  item.label = std::move(label);
  item.kind = CompletionItemKind::Module;
  item.insert_text = std::move(insert_text);
  item.insert_text_format = InsertTextFormat::Snippet;
  item.filter_text = item.label;
  return item;
}

constexpr std::string_view k_domain_skeleton =
  "(define (domain ${1:domain_name})\n"
  "\n"
  "(:requirements :strips :typing)\n"
  "\n"
  "(:types ${2:type1})\n"
  "\n"
  "(:predicates\n"
  "    ${3:(predicate1 ?p - type1)}\n"
  ")\n"
  "\n"
  "(:action ${4:action_name}\n"
  "    :parameters ($5)\n"
  "    :precondition (and $6)\n"
  "    :effect (and $7)\n"
  ")\n"
  "$0\n"
  ")\n";

constexpr std::string_view k_problem_skeleton =
  "(define (problem ${1:problem_name}) (:domain ${2:domain_name})\n"
  "(:objects $3)\n"
  "\n"
  "(:init\n"
  "    $4\n"
  ")\n"
  "\n"
  "(:goal (and\n"
  "    $5\n"
  "))\n"
  "$0\n"
  ")\n";

}  // namespace

// ============================================================================
// ProblemCompletionProvider
// ============================================================================

ProblemCompletionProvider::ProblemCompletionProvider(std::shared_ptr<const SuggestionTable> table)
: table_(std::move(table))
{
}

std::vector<CompletionItem> ProblemCompletionProvider::provide(
  const CompletionContext & ctx, const model::DomainInfo * domain) const
{
  switch (ctx.scope.position) {
    case StructuralPosition::BeforeDefine:
      return pre_parsing_items();
    case StructuralPosition::InsideDefine:
      return define_items(ctx);
    case StructuralPosition::InsideRequirements:
      return requirement_items(*table_, ctx, false);
    case StructuralPosition::InsideInit:
      return domain != nullptr ? init_items(ctx, *domain) : std::vector<CompletionItem>{};
    default:
      return {};
  }
}

std::vector<CompletionItem> ProblemCompletionProvider::init_items(
  const CompletionContext & ctx, const model::DomainInfo & domain)
{
  const auto & request = ctx.request;
  if (request.trigger_kind != TriggerKind::Invoke && !request.triggered_by('(')) {
    return {};
  }

  // the typed `(` opens the first literal of the snippet
  const bool bracket_typed = request.triggered_by('(');
  const auto open = [bracket_typed](std::string snippet) {
    return bracket_typed ? snippet.substr(1) : snippet;
  };
  const auto enclose = [bracket_typed](const std::string & snippet) {
    return bracket_typed ? snippet : "(" + snippet + ")";
  };

  std::vector<model::TypedName> objects = domain.constants;
  const auto problem = model::extract_problem_info(ctx.tree);
  objects.insert(objects.end(), problem.objects.begin(), problem.objects.end());

  const auto symmetric_predicates = symmetric_only(domain.predicates);
  const auto symmetric_functions = symmetric_only(domain.functions);

  std::vector<CompletionItem> items;

  if (!symmetric_predicates.empty() && !symmetric_functions.empty() && !objects.empty()) {
    auto types = involved_types(symmetric_predicates, domain);
    const auto function_types = involved_types(symmetric_functions, domain);
    types.insert(types.end(), function_types.begin(), function_types.end());
    const std::string objs = join_csv(model::objects_of_types(objects, types));

    auto item = init_snippet(
      "Initialize a symmetric predicate and function",
      open(fmt::format(
        "(${{1|{0}|}} ${{2|{2}|}} ${{3|{2}|}}) (${{1}} ${{3}} ${{2}})\n"
        "(= (${{4|{1}|}} ${{2|{2}|}} ${{3|{2}|}}) ${{5:1}}) (= (${{4}} ${{3}} ${{2}}) ${{5}})",
        names_csv(symmetric_predicates), names_csv(symmetric_functions), objs)));
    item.documentation =
      "Inserts a predicate and function initialization for predicates and functions with two "
      "parameters of the same type.\n\n" +
      code_block("(road A B) (road B A)\n(= (distance A B) 1) (= (distance B A) 1)");
    items.push_back(std::move(item));
  }

  if (!symmetric_predicates.empty()) {
    const std::string objs =
      join_csv(model::objects_of_types(objects, involved_types(symmetric_predicates, domain)));
    auto item = init_snippet(
      "Initialize a symmetric predicate",
      open(fmt::format(
        "(${{1|{}|}} {} {}) (${{1}} ${{3}} ${{2}})", names_csv(symmetric_predicates),
        to_selection(2, objs, "a"), to_selection(3, objs, "b"))));
    item.documentation =
      "Inserts two initial literals of a predicate with two parameters of the same type.\n\n" +
      code_block("(road A B) (road B A)");
    items.push_back(std::move(item));

    for (const auto & predicate : symmetric_predicates) {
      const auto chain = model::objects_of_types(objects, {predicate.parameters[0].type});
      if (chain.size() < 2) {
        continue;
      }
      std::string text;
      for (size_t i = 0; i + 1 < chain.size(); ++i) {
        text += fmt::format("({} {} {})\n", predicate.name, chain[i], chain[i + 1]);
      }
      auto sequence =
        init_snippet("Initialize a sequence for " + predicate.declared_name_without_types, open(text));
      sequence.insert_text_format = InsertTextFormat::PlainText;
      sequence.documentation = fmt::format(
        "Chains every `{}` object in declaration order.", predicate.parameters[0].type);
      items.push_back(std::move(sequence));
    }
  }

  if (!symmetric_functions.empty()) {
    const std::string objs =
      join_csv(model::objects_of_types(objects, involved_types(symmetric_functions, domain)));
    auto item = init_snippet(
      "Initialize a symmetric function",
      open(fmt::format(
        "(= (${{1|{}|}} {} {}) ${{4:1}}) (= (${{1}} ${{3}} ${{2}}) ${{4}})",
        names_csv(symmetric_functions), to_selection(2, objs, "a"), to_selection(3, objs, "b"))));
    item.documentation =
      "Inserts two initial values of a function with two parameters of the same type.\n\n" +
      code_block("(= (distance A B) 1) (= (distance B A) 1)");
    items.push_back(std::move(item));
  }

  const auto timed = [&](std::string label, std::string detail, std::string body) {
    auto item = init_snippet(std::move(label), enclose(body));
    item.detail = std::move(detail);
    item.filter_text = "at ";
    items.push_back(std::move(item));
  };

  if (!domain.predicates.empty()) {
    const std::string predicates = to_type_less_names_csv(domain.predicates);
    timed(
      "at <time> (predicate1)", "Timed initial literal",
      fmt::format("at ${{1:1.0}} (${{2|{}|}})", predicates));
    timed(
      "at <time> (not (predicate1))", "Timed initial literal (negative)",
      fmt::format("at ${{1:1.0}} (not (${{2|{}|}}))", predicates));
  }

  if (!domain.functions.empty()) {
    timed(
      "at <time> (= (function1) <value>)", "Timed initial fluent",
      fmt::format(
        "at ${{1:1.0}} (= (${{2|{}|}}) ${{3:42}})", to_type_less_names_csv(domain.functions)));
  }

  for (size_t i = 0; i < items.size(); ++i) {
    items[i].sort_text = fmt::format("item{:03}", i);
  }
  return items;
}

std::vector<CompletionItem> ProblemCompletionProvider::pre_parsing_items()
{
  const auto make = [](std::string label, std::string insert_text, std::string detail) {
    CompletionItem item;
    item.label = std::move(label);
    item.kind = CompletionItemKind::Snippet;
    item.insert_text = std::move(insert_text);
    item.insert_text_format = InsertTextFormat::Snippet;
    item.detail = std::move(detail);
    item.filter_text = item.label;
    return item;
  };

  std::vector<CompletionItem> items;
  items.push_back(make(
    ";;!pre-parsing:command",
    ";;!pre-parsing:{type: \"command\", command: \"${1:program}\", args: [${2:\"data.json\", "
    "\"1234\"}]}\n$0",
    "Pre-parsing problem file transformation via a shell command."));
  items.push_back(make(
    ";;!pre-parsing:python",
    ";;!pre-parsing:{type: \"python\", command: \"${1:your_script.py}\", args: "
    "[${2:\"data.json\", \"1234\"}]}\n$0",
    "Pre-parsing problem file transformation via a python script."));
  items.push_back(make(
    ";;!pre-parsing:",
    ";;!pre-parsing:{type: \"${1|nunjucks,jinja2|}\", data: \"${2:case1.json}\"}\n$0",
    "Pre-parsing problem file transformation via Nunjucks or Jinja2."));
  return items;
}

std::vector<CompletionItem> ProblemCompletionProvider::define_items(const CompletionContext & ctx) const
{
  const SyntaxNode & current = *ctx.scope.current;
  const auto grammar = syntax::problem_grammar();
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
    if (auto snippet = problem_section_snippet(eligible[i])) {
      items.push_back(make_snippet_item(
        *table_, SuggestionGroup::Problem, *suggestion, std::move(*snippet), range, i));
    }
  }
  return items;
}

// ============================================================================
// UnknownCompletionProvider
// ============================================================================

std::vector<CompletionItem> UnknownCompletionProvider::provide(const CompletionContext & ctx) const
{
  const SyntaxNode & node = ctx.node;
  const SyntaxNode * parent = node.parent();

  if (node.is_document() || (node.is(TokenKind::Whitespace) && parent != nullptr && parent->is_document())) {
    std::vector<CompletionItem> items;
    items.push_back(module_item("domain", std::string(k_domain_skeleton)));
    items.push_back(module_item("problem", std::string(k_problem_skeleton)));
    return items;
  }

  if (ctx.request.triggered_by('(') && parent != nullptr && parent->is_document()) {
    const SyntaxNode * bracket = node.expand();
    const SourceRange range = bracket != nullptr ? bracket->range() : node.range();

    auto domain = module_item("(define domain...", std::string(k_domain_skeleton));
    domain.filter_text = "(define domain";
    domain.replace_range = range;

    auto problem = module_item("(define problem...", std::string(k_problem_skeleton));
    problem.filter_text = "(define problem";
    problem.replace_range = range;

    return {std::move(domain), std::move(problem)};
  }

  return {};
}

}  // namespace pddl::lsp
