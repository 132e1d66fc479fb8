#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "pddl/syntax/sections.hpp"
#include "pddl/syntax/syntax_tree.hpp"

using pddl::syntax::domain_grammar;
using pddl::syntax::durative_action_grammar;
using pddl::syntax::GrammarTable;
using pddl::syntax::k_domain_sections;
using pddl::syntax::preceding_keyword_or_self;
using pddl::syntax::SectionList;
using pddl::syntax::section_name;
using pddl::syntax::sections_after;
using pddl::syntax::sections_before;
using pddl::syntax::supported_sections_here;
using pddl::syntax::SyntaxTreeBuilder;
using pddl::syntax::TokenKind;

TEST(Sections, BeforeAndAfter)
{
  EXPECT_EQ(sections_before(":types", k_domain_sections), (SectionList{"domain", ":requirements"}));
  EXPECT_EQ(sections_after(":predicates", k_domain_sections), (SectionList{":functions", ":constraints"}));
  EXPECT_TRUE(sections_before("domain", k_domain_sections).empty());
  EXPECT_TRUE(sections_after(":constraints", k_domain_sections).empty());
}

TEST(Sections, BeforeAndAfterPartitionEveryTable)
{
  const std::vector<GrammarTable> grammars = {
    domain_grammar(true),
    pddl::syntax::problem_grammar(),
    pddl::syntax::action_grammar(),
    durative_action_grammar(),
    pddl::syntax::job_grammar(),
  };
  for (const auto & grammar : grammars) {
    for (const auto name : grammar.ordered) {
      SectionList joined = sections_before(name, grammar.ordered);
      joined.push_back(name);
      const auto after = sections_after(name, grammar.ordered);
      joined.insert(joined.end(), after.begin(), after.end());
      EXPECT_EQ(joined, grammar.ordered) << name;
    }
  }
}

TEST(Sections, UnknownNameKeepsTheList)
{
  EXPECT_EQ(sections_before(":bogus", k_domain_sections).size(), k_domain_sections.size());
  EXPECT_EQ(sections_after(":bogus", k_domain_sections).size(), k_domain_sections.size());
}

TEST(Sections, GrammarTables)
{
  EXPECT_FALSE(domain_grammar().is_structure(":job"));
  EXPECT_TRUE(domain_grammar(true).is_structure(":job"));
  EXPECT_TRUE(domain_grammar().is_structure(":derived"));
  EXPECT_FALSE(domain_grammar().is_structure(":types"));
  EXPECT_TRUE(pddl::syntax::problem_grammar().structures.empty());
  EXPECT_EQ(pddl::syntax::job_grammar().ordered.size(), 3U);
}

TEST(Sections, RequirementNames)
{
  EXPECT_EQ(pddl::syntax::requirement_names().size(), 25U);
  const auto with_jobs = pddl::syntax::requirement_names(true);
  ASSERT_EQ(with_jobs.size(), 26U);
  EXPECT_EQ(with_jobs.back(), ":job-scheduling");
}

TEST(Sections, SupportedBetweenNeighbours)
{
  const auto tree = SyntaxTreeBuilder::build("(define (domain d) (:types t)\n\n(:functions (f)))");
  const auto * gap = tree.node_at(30);
  ASSERT_NE(gap, nullptr);

  const auto grammar = domain_grammar();
  EXPECT_EQ(
    supported_sections_here(
      *gap, *gap, TokenKind::OpenBracketOperator, grammar.ordered, grammar.structures),
    (SectionList{":constants", ":predicates"}));
}

TEST(Sections, SupportedAtTheEndIncludesStructures)
{
  const auto tree = SyntaxTreeBuilder::build("(define (domain d) (:functions (f))\n\n)");
  const auto * gap = tree.node_at(37);
  ASSERT_NE(gap, nullptr);
  ASSERT_EQ(gap->kind(), TokenKind::Whitespace);

  const auto grammar = domain_grammar();
  EXPECT_EQ(
    supported_sections_here(
      *gap, *gap, TokenKind::OpenBracketOperator, grammar.ordered, grammar.structures),
    (SectionList{":constraints", ":derived", ":action", ":durative-action", ":process", ":event"}));
}

TEST(Sections, OnlyStructuresAfterAStructure)
{
  const auto tree = SyntaxTreeBuilder::build("(define (domain d) (:action a)\n\n)");
  const auto * gap = tree.node_at(32);
  ASSERT_NE(gap, nullptr);
  ASSERT_EQ(gap->kind(), TokenKind::Whitespace);

  const auto grammar = domain_grammar(true);
  EXPECT_EQ(
    supported_sections_here(
      *gap, *gap, TokenKind::OpenBracketOperator, grammar.ordered, grammar.structures),
    grammar.structures);
}

TEST(Sections, StructuresStayExclusiveFurtherDown)
{
  const std::string text = "(define (domain d) (:action a)\n\n(:functions f)\n\n)";
  const auto tree = SyntaxTreeBuilder::build(text);
  const auto grammar = domain_grammar();

  const uint32_t gaps[] = {
    static_cast<uint32_t>(text.find(")\n\n(:functions") + 2),
    static_cast<uint32_t>(text.find("f)\n\n)") + 3),
  };
  for (const auto offset : gaps) {
    const auto * gap = tree.node_at(offset);
    ASSERT_NE(gap, nullptr) << offset;
    ASSERT_EQ(gap->kind(), TokenKind::Whitespace) << offset;
    EXPECT_EQ(
      supported_sections_here(
        *gap, *gap, TokenKind::OpenBracketOperator, grammar.ordered, grammar.structures),
      grammar.structures)
      << offset;
  }
}

TEST(Sections, DurativeBodyBetweenParametersAndEffect)
{
  const std::string text =
    "(define (domain d) (:durative-action a :parameters (?x)\n\n:effect (and)))";
  const auto tree = SyntaxTreeBuilder::build(text);
  const auto * gap = tree.node_at(static_cast<uint32_t>(text.find(")\n\n:effect") + 2));
  ASSERT_NE(gap, nullptr);
  ASSERT_EQ(gap->kind(), TokenKind::Whitespace);

  const auto & reference = preceding_keyword_or_self(*gap);
  ASSERT_EQ(reference.token_text(), ":parameters");
  EXPECT_EQ(
    supported_sections_here(
      reference, *gap, TokenKind::Keyword, durative_action_grammar().ordered, {}),
    (SectionList{":duration", ":condition"}));
}

TEST(Sections, SectionNameIsLowerCased)
{
  const auto tree = SyntaxTreeBuilder::build("(define (domain d) (:ACTION a :Effect (p)))");
  const auto * action = tree.node_at(20);
  ASSERT_NE(action, nullptr);
  EXPECT_EQ(section_name(*action), ":action");

  const auto * effect = tree.node_at(32);
  ASSERT_NE(effect, nullptr);
  EXPECT_EQ(effect->kind(), TokenKind::Keyword);
  EXPECT_EQ(section_name(*effect), ":effect");
}

TEST(Sections, PrecedingKeywordOrSelf)
{
  const std::string text = "(define (domain d) (:action a :effect (and)))";
  const auto tree = SyntaxTreeBuilder::build(text);

  const auto * conjunction = tree.node_at(static_cast<uint32_t>(text.find("(and") + 1));
  ASSERT_NE(conjunction, nullptr);
  EXPECT_EQ(preceding_keyword_or_self(*conjunction).token_text(), ":effect");

  const auto * name = tree.node_at(static_cast<uint32_t>(text.find(" a ") + 2));
  ASSERT_NE(name, nullptr);
  EXPECT_EQ(name->token_text(), "a");
  EXPECT_EQ(&preceding_keyword_or_self(*name), name);
}
