#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "pddl/lsp/scope_classifier.hpp"
#include "pddl/syntax/syntax_tree.hpp"
#include "pddl/test_support/completion_helpers.hpp"

using pddl::lsp::classify_scope;
using pddl::lsp::StructuralPosition;
using pddl::syntax::ConstructKind;
using pddl::test_support::invoked;
using pddl::test_support::load;
using pddl::test_support::triggered;

namespace
{

StructuralPosition position_at(const std::string & text, std::optional<char> trigger)
{
  const auto doc = load(text);
  const auto request = trigger ? triggered(doc.cursor, *trigger) : invoked(doc.cursor);
  const auto * node = doc.tree.node_at(request.offset);
  if (node == nullptr) {
    ADD_FAILURE() << "no node at " << request.offset;
    return StructuralPosition::Unknown;
  }
  return classify_scope(doc.tree, *node, request).position;
}

StructuralPosition invoked_at(const std::string & text) { return position_at(text, std::nullopt); }

StructuralPosition triggered_at(const std::string & text, char c) { return position_at(text, c); }

}  // namespace

TEST(ScopeClassifier, TopLevel)
{
  EXPECT_EQ(invoked_at("|"), StructuralPosition::BeforeDefine);
  EXPECT_EQ(invoked_at("; header|\n(define (domain d))"), StructuralPosition::BeforeDefine);
  EXPECT_EQ(invoked_at("(define (domain d))\n|"), StructuralPosition::BeforeDefine);
}

TEST(ScopeClassifier, CommentBelowDefineIsUnknown)
{
  EXPECT_EQ(invoked_at("(define (domain d)\n; x|\n)"), StructuralPosition::Unknown);
}

TEST(ScopeClassifier, InsideDefine)
{
  EXPECT_EQ(invoked_at("(define (domain d)\n|\n)"), StructuralPosition::InsideDefine);
  EXPECT_EQ(triggered_at("(define (domain d)\n(|)\n)", '('), StructuralPosition::InsideDefine);
  EXPECT_EQ(triggered_at("(define (domain d)\n(:|)\n)", ':'), StructuralPosition::InsideDefine);
}

TEST(ScopeClassifier, TriggerMovesCurrentToEnclosingBracket)
{
  const auto doc = load("(define (domain d)\n(:|)\n)");
  const auto * node = doc.tree.node_at(doc.cursor);
  ASSERT_NE(node, nullptr);
  EXPECT_EQ(node->token_text(), ":");

  const auto result = classify_scope(doc.tree, *node, triggered(doc.cursor, ':'));
  ASSERT_NE(result.current, nullptr);
  EXPECT_EQ(result.current->token_text(), "(");
  EXPECT_EQ(result.scope, doc.tree.define_node());
}

TEST(ScopeClassifier, NamedBracketIsNotASectionSlot)
{
  // a typed operator is no longer a bare bracket
  EXPECT_NE(
    triggered_at("(define (domain d)\n(:act|)\n)", ':'), StructuralPosition::InsideDefine);
}

TEST(ScopeClassifier, InsideRequirements)
{
  EXPECT_EQ(
    invoked_at("(define (domain d) (:requirements |))"), StructuralPosition::InsideRequirements);
  EXPECT_EQ(
    invoked_at("(define (domain d) (:requirements :strips |))"),
    StructuralPosition::InsideRequirements);
  EXPECT_EQ(
    triggered_at("(define (domain d) (:requirements :strips :|))", ':'),
    StructuralPosition::InsideRequirements);
}

TEST(ScopeClassifier, ActionLikeBodies)
{
  EXPECT_EQ(invoked_at("(define (domain d) (:action a\n|\n))"), StructuralPosition::InsideActionBody);
  EXPECT_EQ(
    invoked_at("(define (domain d) (:process a\n|\n))"), StructuralPosition::InsideActionBody);
  EXPECT_EQ(invoked_at("(define (domain d) (:event a\n|\n))"), StructuralPosition::InsideActionBody);
  EXPECT_EQ(
    invoked_at("(define (domain d) (:durative-action a\n|\n))"),
    StructuralPosition::InsideDurativeActionBody);
  EXPECT_EQ(
    invoked_at("(define (domain d) (:job a\n|\n))"), StructuralPosition::InsideDurativeActionBody);
}

TEST(ScopeClassifier, KeywordSlotAnchorsOnPrecedingKeyword)
{
  const auto doc = load("(define (domain d) (:action a :parameters (?x)\n|\n))");
  const auto * node = doc.tree.node_at(doc.cursor);
  ASSERT_NE(node, nullptr);

  const auto result = classify_scope(doc.tree, *node, invoked(doc.cursor));
  EXPECT_EQ(result.position, StructuralPosition::InsideActionBody);
  ASSERT_NE(result.reference, nullptr);
  EXPECT_EQ(result.reference->construct(), ConstructKind::Parameters);
  ASSERT_NE(result.scope, nullptr);
  EXPECT_EQ(result.scope->construct(), ConstructKind::Action);
}

TEST(ScopeClassifier, Effects)
{
  EXPECT_EQ(
    invoked_at("(define (domain d) (:action a :effect (and |)))"), StructuralPosition::InsideEffect);
  EXPECT_EQ(
    invoked_at("(define (domain d) (:durative-action a :effect (and (at end (and |)))))"),
    StructuralPosition::InsideEffect);
}

TEST(ScopeClassifier, DurativeConditions)
{
  EXPECT_EQ(
    invoked_at("(define (domain d) (:durative-action a :condition (and |)))"),
    StructuralPosition::InsideCondition);
  EXPECT_EQ(
    invoked_at("(define (domain d) (:durative-action a :condition (and (over all (and |)))))"),
    StructuralPosition::Unknown);
}

TEST(ScopeClassifier, ParameterReference)
{
  EXPECT_EQ(
    triggered_at("(define (domain d) (:action a :effect (and (p ?|))))", '?'),
    StructuralPosition::ParameterReference);
}

TEST(ScopeClassifier, InstantaneousPreconditionIsUnknown)
{
  EXPECT_EQ(
    invoked_at("(define (domain d) (:action a :precondition (and |)))"),
    StructuralPosition::Unknown);
}

TEST(ScopeClassifier, InsideInit)
{
  EXPECT_EQ(
    invoked_at("(define (problem p) (:domain d) (:init\n|\n))"), StructuralPosition::InsideInit);
  EXPECT_EQ(
    triggered_at("(define (problem p) (:domain d) (:init (at a) (|)))", '('),
    StructuralPosition::InsideInit);
  EXPECT_EQ(
    invoked_at("(define (problem p) (:domain d) (:goal (and |)))"), StructuralPosition::Unknown);

  const auto doc = load("(define (problem p) (:domain d) (:init (|)))");
  const auto request = invoked(doc.cursor);
  const auto * node = doc.tree.node_at(doc.cursor);
  ASSERT_NE(node, nullptr);
  const auto result = classify_scope(doc.tree, *node, request);
  ASSERT_NE(result.scope, nullptr);
  EXPECT_EQ(result.scope->construct(), ConstructKind::Init);
}

TEST(ScopeClassifier, PositionNames)
{
  EXPECT_EQ(pddl::lsp::to_string(StructuralPosition::InsideDefine), "InsideDefine");
  EXPECT_EQ(pddl::lsp::to_string(StructuralPosition::ParameterReference), "ParameterReference");
  EXPECT_EQ(pddl::lsp::to_string(StructuralPosition::InsideInit), "InsideInit");
}
