// pddl/lsp/suggestion.cpp - Suggestion filtering and the documentation table
#include "pddl/lsp/suggestion.hpp"

#include <fmt/format.h>

#include <utility>

namespace pddl::lsp
{

// ============================================================================
// Suggestion
// ============================================================================

std::optional<Suggestion> Suggestion::from(
  std::string_view section_name, std::optional<char> trigger_character,
  std::string_view filter_text_prefix)
{
  if (trigger_character == ':' && (section_name.empty() || section_name.front() != ':')) {
    return std::nullopt;
  }
  Suggestion s;
  s.section_name = std::string(section_name);
  s.filter_text = std::string(filter_text_prefix) + s.section_name;
  return s;
}

// ============================================================================
// SuggestionTable
// ============================================================================

void SuggestionTable::add(
  SuggestionGroup group, std::string label, std::string detail, std::string documentation,
  std::optional<CompletionItemKind> kind)
{
  auto & entries = groups_[static_cast<size_t>(group)];
  std::string key = label;
  entries[std::move(key)] =
    SuggestionDetails{std::move(label), std::move(detail), std::move(documentation), kind};
}

const SuggestionDetails * SuggestionTable::find(SuggestionGroup group, std::string_view label) const
{
  const auto & entries = groups_[static_cast<size_t>(group)];
  auto it = entries.find(std::string(label));
  return it == entries.end() ? nullptr : &it->second;
}

size_t SuggestionTable::size() const noexcept
{
  size_t n = 0;
  for (const auto & entries : groups_) {
    n += entries.size();
  }
  return n;
}

namespace
{

void add_domain_docs(SuggestionTable & t)
{
  constexpr auto g = SuggestionGroup::Domain;

  t.add(g, ":requirements", "Requirements", "Required planning engine features.");
  t.add(
    g, ":types", "Types",
    "Types of objects and their hierarchy. Example:" + code_block("car - vehicle"));
  t.add(
    g, ":constants", "Constants",
    "Constant objects that will be part of all problems defined for this domain in addition to "
    "the objects defined in the `:objects` section.");
  t.add(g, ":predicates", "Predicates", "Predicates are things that are either true or false.");
  t.add(g, ":functions", "Functions", "Functions are used to define numeric values.");
  t.add(g, ":constraints", "Constraints", "Constraints that all plans must satisfy.");
  t.add(
    g, ":derived", "Derived predicate/function",
    "Derived predicate/function can be defined to simplify action declaration. Example derived "
    "predicate:" +
      code_block("(:derived (p_and_q) \n\t(and (p) (q))\n)") +
      "Example derived function: " + code_block("(:derived (c) (+ (a) (b))"));
  t.add(
    g, ":action", "Instantaneous action",
    "Actions that change state of the world. Example:" +
      code_block(
        "(:action action_name\n\t:parameters (?t - type1)\n\t:precondition (and (p ?t))\n"
        "\t:effect (and (q ?t))\n)"));
  t.add(
    g, ":durative-action", "Durative action",
    "Actions that change the state of the world when they start, then they last for a defined "
    "duration period, while changing the world continuously and finally change the state when "
    "they end.");
  t.add(
    g, ":job", "Job (simplified durative action)",
    "Durative Action simplified for specifying job-scheduling problems.");
  t.add(
    g, ":process", "PDDL+ Process",
    "Process is activated and continues running when its condition is met. It may only have "
    "continuous effects. Example:" +
      code_block(
        "(:process HEAT\n"
        "    :parameters (?r - room)\n"
        "    :precondition (and\n"
        "        (too_cold ?r)\n"
        "        (< (temperature ?r) 22)\n"
        "    )\n"
        "    :effect (and\n"
        "        (increase (temperature ?b) (* #t 3))\n"
        "    )\n"
        ")") +
      "Note that `:process` and `:event` require the `:time` requirement.",
    CompletionItemKind::Struct);
  t.add(
    g, ":event", "PDDL+ Effect",
    "Effect is triggered when its condition is met. It may only have continuous effects. "
    "Example:" +
      code_block(
        "(:event BOUNCE\n"
        "    :parameters (?b - ball)\n"
        "    :precondition (and\n"
        "        (not (held ?b))\n"
        "        (<= (distance-to-floor ?b) 0)\n"
        "    )\n"
        "    :effect (and\n"
        "        (assign (velocity ?b) (* -0.8 (velocity ?b)))\n"
        "    )\n"
        ")") +
      "Note that `:process` and `:event` require the `:time` requirement.",
    CompletionItemKind::Event);

  // action and durative action keywords
  t.add(
    g, ":parameters", "Action parameters",
    "Parameters such as:" + code_block(":parameters (?v - vehicle ?from ?to - place)", ""));
  t.add(g, ":precondition", "Instantaneous action precondition", "");
  t.add(g, ":effect", "Action effect", "");
  t.add(
    g, ":duration", "Durative action duration",
    "Examples:" + code_block(
                    ":duration (= ?duration 1)\n:duration (and (>= ?duration (min_duration))(<= "
                    "?duration (max_duration)))",
                    ""));
  t.add(g, ":condition", "Durative action condition", "");
}

void add_problem_docs(SuggestionTable & t)
{
  constexpr auto g = SuggestionGroup::Problem;

  t.add(g, "problem", "Problem name", "Name of this problem.");
  t.add(
    g, ":domain", "Domain reference",
    "Name of the domain this problem instantiates. It must match the `(domain ...)` name.");
  t.add(g, ":requirements", "Requirements", "Required planning engine features.");
  t.add(
    g, ":objects", "Objects",
    "Objects of this problem in addition to the domain constants. Example:" +
      code_block("truck1 truck2 - truck\ndepot1 - location"));
  t.add(
    g, ":init", "Initial state",
    "Facts and function values that hold in the initial state. Example:" +
      code_block("(at truck1 depot1)\n(= (fuel truck1) 100)"));
  t.add(g, ":goal", "Goal", "Condition every valid plan must satisfy in its final state.");
  t.add(g, ":constraints", "Constraints", "Constraints that all plans must satisfy.");
  t.add(
    g, ":metric", "Plan metric",
    "Numeric expression to minimize or maximize. Example:" +
      code_block("(:metric minimize (total-cost))"));
}

void add_effect_docs(SuggestionTable & t)
{
  const std::string discrete_hint =
    "Use this either in instantaneous `:action`'s `:effect`, or in `:durative-action`'s "
    "`(at start ...)` or `(at end ...)` effect.";
  const std::string requires_fluents = requires_features({":fluents"});

  constexpr auto d = SuggestionGroup::DiscreteEffect;
  t.add(
    d, "not", "Assigns `false` to a predicate",
    "Makes predicate false:" + code_block("(not (at ?location))") + discrete_hint,
    CompletionItemKind::Function);
  t.add(
    d, "assign", "Numeric assign effect",
    "Assigns value to the function, for example:" + code_block("(assign (function1) 3.14)") +
      discrete_hint + requires_fluents,
    CompletionItemKind::Method);
  t.add(
    d, "increase", "Discrete numeric increase effect",
    "For example to increment a function value by `3.14`, use" +
      code_block("(increase (function1) 3.14)") + discrete_hint + requires_fluents,
    CompletionItemKind::Method);
  t.add(
    d, "decrease", "Discrete numeric decrease effect",
    "For example to decrement a function value by `3.14`, use" +
      code_block("(decrease (function1) 3.14)") + discrete_hint + requires_fluents,
    CompletionItemKind::Method);
  t.add(
    d, "forall", "For all effect",
    "Effect that shall be applied to all objects of specified type. For example:" +
      code_block("(forall (?p - product) (sold_out ?p))"),
    CompletionItemKind::TypeParameter);
  t.add(
    d, "when", "Conditional effect",
    "Effect that shall only be applied when a condition is met. For example:" +
      code_block("(when (at ?location) (not (at ?location)))") + discrete_hint +
      requires_features({":conditional-effects"}),
    CompletionItemKind::Method);

  const std::string continuous_hint =
    "Use this in `:durative-action`'s `:effect` block. Do not use it inside `(at start ...)` or "
    "`(at end ...)` effect. Example usage:";
  const std::string continuous_example =
    "(:durative-action\n...\n:effect (and \n    (at start ...)\n"
    "    (increase (function1) (* #t 2.0))\n    (decrease (function2) (* #t 3.0))\n"
    "    (at end ...)\n)";
  const std::string requires_continuous = requires_features({":continuous-effects"});

  constexpr auto c = SuggestionGroup::ContinuousEffect;
  t.add(
    c, "increase", "Continuous numeric increase effect",
    "For example to increment a function value by *twice* the amount of time that elapsed since "
    "action started, use:" +
      code_block("(increase (function1) (* #t 2.0))") + continuous_hint +
      code_block(continuous_example, "") + requires_continuous,
    CompletionItemKind::Method);
  t.add(
    c, "decrease", "Continuous numeric decrease effect",
    "For example to decrement a function value by *twice* the amount of time that elapsed since "
    "action started, use:" +
      code_block("(decrease (function1) (* #t 2.0))") + continuous_hint +
      code_block(continuous_example, "") + requires_continuous,
    CompletionItemKind::Method);
  t.add(
    c, "forall", "For all duration-dependent effect",
    "Effect that shall be applied to all objects of specified type. For example:" +
      code_block("(forall (?p - product) (increase (stock ?p) (* #t 2.0)))"),
    CompletionItemKind::TypeParameter);

  const std::string requires_durative = requires_features({":durative-actions"});

  constexpr auto e = SuggestionGroup::DurativeEffect;
  t.add(
    e, "at start", "At start effect",
    "Effect that takes place at the *start* point of a durative action. Only use this inside a "
    "`:durative-action`." +
      code_block(
        "(:durative-action\n:condition (and (at start (...) ) )\n"
        ":effect (and (at start (...) ) ) \n)") +
      requires_durative,
    CompletionItemKind::Property);
  t.add(
    e, "at end", "At end effect",
    "Effect that takes place at the *end* point of a durative action. Only use this inside a "
    "`:durative-action`." +
      code_block(
        "(:durative-action\n:condition (and (at end (...) ) )\n"
        ":effect (and (at end (...) ) ) \n)") +
      requires_durative,
    CompletionItemKind::Property);

  constexpr auto k = SuggestionGroup::DurativeCondition;
  t.add(
    k, "at start", "At start condition",
    "Condition that applies at the *start* point of a durative action. Only use this inside a "
    "`:durative-action`." +
      code_block(
        "(:durative-action\n\t:condition (and (at start (...) ) )\n"
        "\t:effect (and (at start (...) ) ) \n)") +
      requires_durative,
    CompletionItemKind::Property);
  t.add(
    k, "at end", "At end condition",
    "Condition that applies at the *end* point of a durative action. Only use this inside a "
    "`:durative-action`." +
      code_block(
        "(:durative-action\n\t:condition (and (at end (...) ) )\n"
        "\t:effect (and (at end (...) ) ) \n)") +
      requires_durative,
    CompletionItemKind::Property);
  t.add(
    k, "over all", "Over all condition",
    "Over-all (a.k.a. _invariant_) condition that applies for the entire duration of the "
    "durative action. Only use this inside a `:durative-action`." +
      code_block("(:durative-action\n\t:condition (and (over all (...) ) )\n)") +
      requires_durative,
    CompletionItemKind::Property);
}

void add_operator_docs(SuggestionTable & t)
{
  constexpr auto g = SuggestionGroup::Operator;
  constexpr auto fn = CompletionItemKind::Function;

  t.add(g, "and", "Logical conjunction", "Example:" + code_block("(and (fact1)(fact2))"), fn);
  t.add(g, "not", "Logical negation", "Example:" + code_block("(not (fact1))"), fn);
  t.add(
    g, "at start", "At start condition or effect",
    "Condition or effect that takes place at the *start* point of a durative action. Only use "
    "this inside a `:durative-action`." +
      code_block(
        "(:durative-action\n:condition (and (at start (...) ) )\n"
        ":effect (and (at start (...) ) ) \n)"),
    fn);
  t.add(
    g, "at end", "At end condition or effect",
    "Condition or effect that takes place at the *end* point of a durative action. Only use this "
    "inside a `:durative-action`." +
      code_block(
        "(:durative-action\n:condition (and (at end (...) ) )\n"
        ":effect (and (at end (...) ) ) \n)"),
    fn);
  t.add(
    g, "over all", "Over all condition",
    "Overall condition (aka the invariant) is the condition that must hold true for as long as "
    "action is executing. Only use this inside a `:durative-action`.",
    fn);
  t.add(g, "=", "Equality", "Evaluates whether two numeric values are equal.", fn);
  t.add(g, ">", "Greater than", "", fn);
  t.add(g, "<", "Less than", "", fn);
  t.add(g, ">=", "Greater than or equal", "", fn);
  t.add(g, "<=", "Less than or equal", "", fn);
  t.add(g, "+", "Numerical addition", "Example:" + code_block("(+ (function1) 1.0)"), fn);
  t.add(g, "-", "Numerical subtraction", "Example:" + code_block("(- (function1) 1.0)"), fn);
  t.add(g, "/", "Numerical division", "Example:" + code_block("(/ (function1) 2)"), fn);
  t.add(g, "*", "Numerical multiplication", "Example:" + code_block("(* (function1) 2)"), fn);
  t.add(
    g, "forall", "For all effect",
    "Effect that shall be applied to all objects of specified type. For example:" +
      code_block("(forall (?p - product)(sold_out ?p))"),
    fn);
  t.add(
    g, "exists", "Existential condition",
    "Condition such as" + code_block("(exists (?p - product)(available ?p))"), fn);
  t.add(g, ":", "keyword", "Keywords such as `:action`", CompletionItemKind::Keyword);
}

}  // namespace

std::shared_ptr<const SuggestionTable> SuggestionTable::create_default()
{
  auto table = std::make_shared<SuggestionTable>();
  add_domain_docs(*table);
  add_problem_docs(*table);
  add_effect_docs(*table);
  add_operator_docs(*table);
  return table;
}

// ============================================================================
// Rendering helpers
// ============================================================================

CompletionItem make_snippet_item(
  const SuggestionTable & table, SuggestionGroup group, const Suggestion & suggestion,
  std::string snippet, std::optional<SourceRange> replace_range, size_t index)
{
  CompletionItem item;
  item.label = suggestion.section_name;
  item.insert_text = std::move(snippet);
  item.insert_text_format = InsertTextFormat::Snippet;
  item.replace_range = replace_range;
  item.filter_text = suggestion.filter_text;
  item.sort_text = fmt::format("item{:03}", index);

  if (const auto * details = table.find(group, suggestion.section_name)) {
    item.kind = details->kind.value_or(CompletionItemKind::Keyword);
    item.detail = details->detail;
    item.documentation = details->documentation;
  } else {
    item.kind = CompletionItemKind::Keyword;
  }
  return item;
}

std::string to_selection(int tabstop, std::string_view options_csv, std::string_view or_default)
{
  if (!options_csv.empty()) {
    return fmt::format("${{{}|{}|}}", tabstop, options_csv);
  }
  return fmt::format("${{{}:{}}}", tabstop, or_default);
}

std::string requires_features(std::initializer_list<std::string_view> requirements)
{
  std::string csv;
  for (const auto r : requirements) {
    if (!csv.empty()) {
      csv += ", ";
    }
    csv += fmt::format("`{}`", r);
  }
  return fmt::format("\n\nThis language feature requires {}.", csv);
}

std::string code_block(std::string_view code, std::string_view language)
{
  return fmt::format("\n```{}\n{}\n```\n", language, code);
}

}  // namespace pddl::lsp
