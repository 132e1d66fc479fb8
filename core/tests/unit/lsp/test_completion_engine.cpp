#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "pddl/test_support/completion_helpers.hpp"

using pddl::lsp::CancellationToken;
using pddl::lsp::CompletionEngine;
using pddl::lsp::CompletionItemKind;
using pddl::lsp::CompletionOptions;
using pddl::test_support::complete;
using pddl::test_support::filter_texts;
using pddl::test_support::invoked;
using pddl::test_support::labels;
using pddl::test_support::load;
using pddl::test_support::triggered;

using Strings = std::vector<std::string>;

namespace
{

bool is_subset(Strings subset, Strings superset)
{
  std::sort(subset.begin(), subset.end());
  std::sort(superset.begin(), superset.end());
  return std::includes(superset.begin(), superset.end(), subset.begin(), subset.end());
}

}  // namespace

// ============================================================================
// Unknown files
// ============================================================================

TEST(CompletionEngine, EmptyDocumentOffersSkeletons)
{
  const auto doc = load("|");
  const auto items = complete(doc, invoked(doc.cursor));

  EXPECT_EQ(labels(items), (Strings{"domain", "problem"}));
  for (const auto & item : items) {
    EXPECT_EQ(item.kind, CompletionItemKind::Module);
  }
  EXPECT_EQ(items[0].insert_text.rfind("(define (domain ${1:domain_name})", 0), 0U);
  EXPECT_EQ(items[1].insert_text.rfind("(define (problem ${1:problem_name})", 0), 0U);
}

TEST(CompletionEngine, OpenBracketInUnknownFile)
{
  const auto doc = load(" (|)");
  const auto items = complete(doc, triggered(doc.cursor, '('));

  EXPECT_EQ(labels(items), (Strings{"(define domain...", "(define problem..."}));
  EXPECT_EQ(filter_texts(items), (Strings{"(define domain", "(define problem"}));
  for (const auto & item : items) {
    ASSERT_TRUE(item.replace_range.has_value());
    EXPECT_EQ(item.replace_range->get_begin().get_offset(), 1U);
    EXPECT_EQ(item.replace_range->get_end().get_offset(), 3U);
  }
}

TEST(CompletionEngine, UnknownFileInsideBracketOffersNothing)
{
  const auto doc = load("(foo |)");
  EXPECT_TRUE(complete(doc, invoked(doc.cursor)).empty());
}

// ============================================================================
// Robustness
// ============================================================================

TEST(CompletionEngine, OffsetPastEndIsEmpty)
{
  const auto doc = load("(define (domain d)\n)");
  EXPECT_TRUE(complete(doc, invoked(500)).empty());
}

TEST(CompletionEngine, CancelledRequestIsEmpty)
{
  const auto doc = load("(define (domain d) \n|\n)");
  const CompletionEngine engine;

  CancellationToken token;
  EXPECT_FALSE(
    engine.complete(doc.tree, doc.source, doc.scope, &doc.domain, invoked(doc.cursor), &token)
      .empty());

  token.cancel();
  EXPECT_TRUE(
    engine.complete(doc.tree, doc.source, doc.scope, &doc.domain, invoked(doc.cursor), &token)
      .empty());
}

TEST(CompletionEngine, CommentBelowDefineOffersNothing)
{
  const auto doc = load("(define (domain d)\n; (|\n)");
  EXPECT_TRUE(complete(doc, invoked(doc.cursor)).empty());
}

TEST(CompletionEngine, UnbalancedDocumentStillCompletes)
{
  // unclosed (define and a stray close bracket
  const auto doc = load(") (define (domain d)\n|");
  const auto items = complete(doc, invoked(doc.cursor));

  ASSERT_FALSE(items.empty());
  EXPECT_EQ(items.front().label, ":requirements");
}

// ============================================================================
// Properties of the section slots
// ============================================================================

TEST(CompletionEngine, RepeatedRequestsAgree)
{
  const auto doc = load("(define (domain d) (:types t)\n|\n(:action a)\n)");
  const CompletionEngine engine;

  const auto first =
    engine.complete(doc.tree, doc.source, doc.scope, &doc.domain, invoked(doc.cursor));
  const auto second =
    engine.complete(doc.tree, doc.source, doc.scope, &doc.domain, invoked(doc.cursor));
  EXPECT_EQ(filter_texts(first), filter_texts(second));
  EXPECT_EQ(
    filter_texts(first),
    (Strings{
      "(:constants", "(:predicates", "(:functions", "(:constraints", "(:derived", "(:action",
      "(:durative-action", "(:process", "(:event"}));
}

TEST(CompletionEngine, AddingSectionsNeverWidensTheOffer)
{
  const auto before = load("(define (domain d)\n|\n)");
  const auto after = load("(define (domain d) (:requirements :strips)\n|\n(:predicates (p))\n)");

  const auto wide = filter_texts(complete(before, invoked(before.cursor)));
  const auto narrow = filter_texts(complete(after, invoked(after.cursor)));
  EXPECT_LT(narrow.size(), wide.size());
  EXPECT_TRUE(is_subset(narrow, wide));
  EXPECT_EQ(narrow, (Strings{"(:types", "(:constants"}));
}

TEST(CompletionEngine, OfferedSectionsKeepTheDocumentOrdered)
{
  // every offered ordered section fits between its neighbours
  const auto doc = load("(define (domain d) (:types t)\n|\n(:functions (f))\n)");
  const auto items = complete(doc, invoked(doc.cursor));

  EXPECT_EQ(filter_texts(items), (Strings{"(:constants", "(:predicates"}));
}

TEST(CompletionEngine, ColonTriggerOffersOnlyColonNames)
{
  const auto doc = load("(define (problem p) (:domain d)\n(:|)\n)");
  const auto items = complete(doc, triggered(doc.cursor, ':'));

  ASSERT_FALSE(items.empty());
  for (const auto & item : items) {
    EXPECT_EQ(item.label.front(), ':') << item.label;
  }
}

TEST(CompletionEngine, OneEngineServesDomainAndProblem)
{
  const CompletionEngine engine(CompletionOptions{true});
  EXPECT_TRUE(engine.options().job_scheduling);

  const auto domain = load("(define (domain d) \n|\n)");
  const auto problem = load("(define (problem p) (:domain d)\n|\n)");

  const auto domain_items = engine.complete(
    domain.tree, domain.source, domain.scope, &domain.domain, invoked(domain.cursor));
  const auto problem_items = engine.complete(
    problem.tree, problem.source, problem.scope, nullptr, invoked(problem.cursor));

  ASSERT_FALSE(domain_items.empty());
  EXPECT_EQ(domain_items.back().label, ":job");
  ASSERT_FALSE(problem_items.empty());
  EXPECT_EQ(problem_items.front().label, ":requirements");
}
