#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "pddl/model/problem_info.hpp"
#include "pddl/syntax/syntax_tree.hpp"

using pddl::model::extract_problem_info;
using pddl::model::objects_of_types;
using pddl::model::TypedName;
using pddl::syntax::SyntaxTreeBuilder;

using Strings = std::vector<std::string>;

TEST(ProblemInfo, ObjectsWithTypes)
{
  const auto info = extract_problem_info(SyntaxTreeBuilder::build(
    "(define (problem p) (:domain d)\n"
    "(:objects a b - city\n"
    "  ; trucks\n"
    "  t1 - truck x)\n"
    "(:init))"));

  EXPECT_EQ(
    info.objects,
    (std::vector<TypedName>{{"a", "city"}, {"b", "city"}, {"t1", "truck"}, {"x", "object"}}));
}

TEST(ProblemInfo, MissingObjectsStayEmpty)
{
  EXPECT_TRUE(extract_problem_info(SyntaxTreeBuilder::build("(define (problem p) (:init))"))
                .objects.empty());
  EXPECT_TRUE(extract_problem_info(SyntaxTreeBuilder::build("")).objects.empty());
}

TEST(ProblemInfo, ObjectsOfTypesGroupsByDeclaredType)
{
  const std::vector<TypedName> objects = {
    {"home", "place"}, {"t1", "truck"}, {"work", "place"}, {"c1", "car"}, {"home", "place"},
  };

  EXPECT_EQ(objects_of_types(objects, {"place"}), (Strings{"home", "work"}));
  EXPECT_EQ(objects_of_types(objects, {"car", "truck"}), (Strings{"t1", "c1"}));
  EXPECT_TRUE(objects_of_types(objects, {"boat"}).empty());
}
