#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "pddl/model/file_scope.hpp"
#include "pddl/syntax/syntax_tree.hpp"

using pddl::model::classify_file;
using pddl::model::DomainScope;
using pddl::model::FileScope;
using pddl::model::ProblemScope;
using pddl::model::UnknownScope;
using pddl::syntax::SyntaxTreeBuilder;

namespace
{

FileScope classify(const std::string & text)
{
  return classify_file(SyntaxTreeBuilder::build(text));
}

}  // namespace

TEST(FileScope, Domain)
{
  const auto scope = classify("; header\n(define (domain logistics) (:requirements :strips))");
  ASSERT_TRUE(pddl::model::is_domain(scope));
  EXPECT_EQ(std::get<DomainScope>(scope).name, "logistics");
}

TEST(FileScope, Problem)
{
  const auto scope = classify("(define (problem p1) (:domain logistics) (:init))");
  ASSERT_TRUE(pddl::model::is_problem(scope));
  const auto & problem = std::get<ProblemScope>(scope);
  EXPECT_EQ(problem.name, "p1");
  EXPECT_EQ(problem.domain_name, "logistics");
}

TEST(FileScope, ProblemWithoutDomainReference)
{
  const auto scope = classify("(define (problem p1)\n");
  ASSERT_TRUE(pddl::model::is_problem(scope));
  EXPECT_TRUE(std::get<ProblemScope>(scope).domain_name.empty());
}

TEST(FileScope, Unknown)
{
  EXPECT_TRUE(std::holds_alternative<UnknownScope>(classify("")));
  EXPECT_TRUE(std::holds_alternative<UnknownScope>(classify("(define (foo bar))")));
  EXPECT_TRUE(std::holds_alternative<UnknownScope>(classify("(define ")));
  EXPECT_TRUE(std::holds_alternative<UnknownScope>(classify("(domain d)")));
}
