#include <fmt/format.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "pddl/lsp/completion_providers.hpp"
#include "pddl/test_support/completion_helpers.hpp"

using pddl::lsp::CompletionItemKind;
using pddl::lsp::InsertTextFormat;
using pddl::lsp::SuggestionTable;
using pddl::lsp::SymbolCompletionProvider;
using pddl::test_support::complete;
using pddl::test_support::find_label;
using pddl::test_support::invoked;
using pddl::test_support::labels;
using pddl::test_support::load;

using Strings = std::vector<std::string>;

namespace
{

constexpr const char * k_domain =
  "(define (domain robots)\n"
  "(:types car truck - vehicle)\n"
  "(:predicates\n"
  "  ; robot location\n"
  "  (at ?r - robot ?l - location)\n"
  "  (free ?r) ; nothing held\n"
  ")\n"
  "(:functions (fuel ?v - vehicle))\n"
  "(:derived (busy ?r) (not (free ?r)))\n";

}  // namespace

TEST(SymbolCompletion, OperatorsAndDeclarationsAfterOpenBracket)
{
  const auto doc = load(std::string(k_domain) + "(:action a :precondition (and (|)))\n)");
  const auto items = complete(doc, invoked(doc.cursor));

  ASSERT_EQ(items.size(), 17U + 4U);
  EXPECT_EQ(items[0].label, "and");
  EXPECT_EQ(items[16].label, ":");
  EXPECT_EQ(items[16].kind, CompletionItemKind::Keyword);

  EXPECT_EQ(items[17].label, "at ?r - robot ?l - location");
  EXPECT_EQ(items[17].insert_text, "at ?r ?l");
  EXPECT_EQ(items[17].detail, "Predicate");
  EXPECT_EQ(items[17].kind, CompletionItemKind::Value);
  EXPECT_NE(items[17].documentation.find("robot location"), std::string::npos);

  EXPECT_EQ(items[18].label, "free ?r");
  EXPECT_NE(items[18].documentation.find("nothing held"), std::string::npos);

  EXPECT_EQ(items[19].label, "fuel ?v - vehicle");
  EXPECT_EQ(items[19].kind, CompletionItemKind::Unit);

  EXPECT_EQ(items[20].label, "busy ?r");
  EXPECT_EQ(items[20].kind, CompletionItemKind::Interface);

  for (size_t i = 0; i < items.size(); ++i) {
    EXPECT_EQ(items[i].sort_text, fmt::format("item{:03}", i));
    EXPECT_EQ(items[i].insert_text_format, InsertTextFormat::PlainText);
  }

  auto sorted = items;
  std::stable_sort(sorted.begin(), sorted.end(), [](const auto & a, const auto & b) {
    return a.sort_text < b.sort_text;
  });
  EXPECT_EQ(labels(sorted), labels(items));
}

TEST(SymbolCompletion, TypesAfterDash)
{
  const auto doc = load(std::string(k_domain) + "(:action a :parameters (?c -|))\n)");
  const auto items = complete(doc, invoked(doc.cursor));

  EXPECT_EQ(labels(items), (Strings{"car", "truck", "vehicle"}));
  const auto * car = find_label(items, "car");
  ASSERT_NE(car, nullptr);
  EXPECT_EQ(car->insert_text, " car");
  EXPECT_EQ(car->kind, CompletionItemKind::Class);
}

TEST(SymbolCompletion, NothingInsideComments)
{
  const auto doc = load(std::string(k_domain) + "(:action a :precondition (and ; (|\n))\n)");
  EXPECT_TRUE(complete(doc, invoked(doc.cursor)).empty());
}

TEST(SymbolCompletion, NothingAfterPlainName)
{
  const auto doc = load(std::string(k_domain) + "(:action a :precondition (and (at |)))\n)");
  EXPECT_TRUE(complete(doc, invoked(doc.cursor)).empty());
}

TEST(SymbolCompletion, OperatorDocumentation)
{
  const SymbolCompletionProvider provider(SuggestionTable::create_default());
  const auto items = provider.operator_items();

  ASSERT_EQ(items.size(), 17U);
  const auto * conjunction = find_label(items, "and");
  ASSERT_NE(conjunction, nullptr);
  EXPECT_EQ(conjunction->detail, "Logical conjunction");
  EXPECT_NE(conjunction->documentation.find("(and (fact1)(fact2))"), std::string::npos);

  const auto * greater = find_label(items, ">");
  ASSERT_NE(greater, nullptr);
  EXPECT_EQ(greater->kind, CompletionItemKind::Function);
}

TEST(SymbolCompletion, NoDomainMeansOperatorsOnly)
{
  const auto doc = load("(define (problem p) (:domain missing) (:goal (and (|))))");
  const pddl::lsp::CompletionEngine engine;
  const auto items =
    engine.complete(doc.tree, doc.source, doc.scope, nullptr, invoked(doc.cursor));

  ASSERT_EQ(items.size(), 17U);
  EXPECT_EQ(items.back().label, ":");
}
