#include <gtest/gtest.h>

#include <string>

#include "pddl/basic/diagnostic.hpp"
#include "pddl/syntax/sections.hpp"
#include "pddl/syntax/structure_checker.hpp"
#include "pddl/syntax/syntax_tree.hpp"

using pddl::DiagnosticBag;
using pddl::Severity;
using pddl::SourceRange;
using pddl::syntax::domain_grammar;
using pddl::syntax::problem_grammar;
using pddl::syntax::StructureChecker;
using pddl::syntax::SyntaxTreeBuilder;

namespace
{

bool check_text(const std::string & text, DiagnosticBag & diags, bool domain = true)
{
  const auto tree = SyntaxTreeBuilder::build(text);
  const auto grammar = domain ? domain_grammar() : problem_grammar();
  StructureChecker checker(&diags);
  return checker.check(tree, &grammar);
}

}  // namespace

TEST(StructureChecker, BalancedDomainIsClean)
{
  DiagnosticBag diags;
  EXPECT_TRUE(check_text(
    "(define (domain d) (:requirements :strips) (:predicates (p ?x))\n"
    "  (:action a :parameters (?x) :precondition (p ?x) :effect (not (p ?x))))",
    diags));
  EXPECT_TRUE(diags.empty());
}

TEST(StructureChecker, UnmatchedCloseBracket)
{
  DiagnosticBag diags;
  EXPECT_FALSE(check_text("(define (domain d)))", diags));

  ASSERT_EQ(diags.size(), 1U);
  const auto & d = diags.all().front();
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "E0001");
  EXPECT_EQ(d.message, "unmatched closing bracket");
  EXPECT_EQ(d.primary_range(), SourceRange(19, 20));
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_label()->message, "no '(' to close here");
}

TEST(StructureChecker, UnclosedBracket)
{
  DiagnosticBag diags;
  EXPECT_FALSE(check_text("(define (domain d)", diags));

  ASSERT_EQ(diags.size(), 1U);
  const auto & d = diags.all().front();
  EXPECT_EQ(d.code, "E0002");
  EXPECT_EQ(d.message, "unclosed bracket '(define'");
  EXPECT_EQ(d.primary_range(), SourceRange(0, 7));

  ASSERT_EQ(d.fixits.size(), 1U);
  EXPECT_EQ(d.fixits[0].range, SourceRange(18, 18));
  EXPECT_EQ(d.fixits[0].replacement_text, ")");
}

TEST(StructureChecker, EveryUnclosedBracketIsReported)
{
  DiagnosticBag diags;
  StructureChecker checker(&diags);
  EXPECT_FALSE(checker.check(SyntaxTreeBuilder::build("(define (domain d) (:action a"), nullptr));
  EXPECT_EQ(checker.error_count(), 2U);
  EXPECT_EQ(diags.errors().size(), 2U);
  for (const auto & d : diags) {
    ASSERT_EQ(d.fixits.size(), 1U);
    EXPECT_EQ(d.fixits[0].range, SourceRange(29, 29));
  }
}

TEST(StructureChecker, OrderedSectionOutOfOrder)
{
  DiagnosticBag diags;
  EXPECT_TRUE(check_text("(define (domain d) (:predicates (p)) (:types t))", diags));

  ASSERT_EQ(diags.size(), 1U);
  const auto & d = diags.all().front();
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(d.code, "W0001");
  EXPECT_EQ(d.message, "section ':types' must come before ':predicates'");
  ASSERT_EQ(d.labels.size(), 2U);
  EXPECT_EQ(d.labels[0].message, "out of order");
  EXPECT_EQ(d.labels[1].message, "written earlier here");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(
    d.help_message->rfind("expected order: domain :requirements :types :constants", 0), 0U);
  EXPECT_NE(d.help_message->find(", then :derived :action"), std::string::npos);
}

TEST(StructureChecker, OrderedSectionAfterStructure)
{
  DiagnosticBag diags;
  EXPECT_TRUE(check_text("(define (domain d) (:action a) (:predicates (p)))", diags));

  ASSERT_EQ(diags.warnings().size(), 1U);
  const auto & d = diags.all().front();
  EXPECT_EQ(d.message, "section ':predicates' must come before ':action'");
  EXPECT_EQ(d.labels[0].message, "written after a structure");
  EXPECT_EQ(d.labels[1].message, "first structure here");
}

TEST(StructureChecker, StructuresRepeatFreely)
{
  DiagnosticBag diags;
  EXPECT_TRUE(check_text(
    "(define (domain d) (:action a) (:process p) (:action b) (:derived (q) (p)))", diags));
  EXPECT_TRUE(diags.empty());
}

TEST(StructureChecker, ProblemOrder)
{
  DiagnosticBag diags;
  EXPECT_TRUE(check_text(
    "(define (problem p) (:domain d) (:goal (and)) (:init))", diags, /*domain=*/false));

  ASSERT_EQ(diags.size(), 1U);
  const auto & d = diags.all().front();
  EXPECT_EQ(d.message, "section ':init' must come before ':goal'");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(
    *d.help_message,
    "expected order: problem :domain :requirements :objects :init :goal :constraints :metric");
}

TEST(StructureChecker, NullGrammarSkipsOrder)
{
  DiagnosticBag diags;
  StructureChecker checker(&diags);
  EXPECT_TRUE(checker.check(
    SyntaxTreeBuilder::build("(define (domain d) (:predicates (p)) (:types t))"), nullptr));
  EXPECT_TRUE(diags.empty());
  EXPECT_EQ(checker.warning_count(), 0U);
}

TEST(StructureChecker, CountsWithoutABag)
{
  StructureChecker checker;
  const auto grammar = domain_grammar();
  EXPECT_FALSE(checker.check(
    SyntaxTreeBuilder::build(") (define (domain d) (:predicates (p)) (:types t))"), &grammar));
  EXPECT_EQ(checker.error_count(), 1U);
  EXPECT_EQ(checker.warning_count(), 1U);
}
