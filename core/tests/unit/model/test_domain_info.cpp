#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "pddl/model/domain_info.hpp"
#include "pddl/syntax/syntax_tree.hpp"

using pddl::model::extract_domain_info;
using pddl::model::parse_declaration;
using pddl::model::TypedName;
using pddl::model::strip_types;
using pddl::syntax::SyntaxTreeBuilder;

using Strings = std::vector<std::string>;

namespace
{

constexpr const char * k_domain =
  "(define (domain robots)\n"
  "(:types car truck - vehicle)\n"
  "(:constants home depot - location)\n"
  "(:predicates\n"
  "  ; robot location\n"
  "  (at ?r - robot ?l - location)\n"
  "  (free ?r) ; nothing held\n"
  "\n"
  "  ; orphan\n"
  "\n"
  "  (idle)\n"
  ")\n"
  "(:functions (fuel ?v - vehicle))\n"
  "(:derived (busy ?r) (not (free ?r)))\n"
  ")";

}  // namespace

TEST(DomainInfo, ExtractsEveryDeclarationKind)
{
  const auto tree = SyntaxTreeBuilder::build(k_domain);
  const auto info = extract_domain_info(tree);

  EXPECT_EQ(info.name, "robots");
  EXPECT_EQ(info.types, (Strings{"car", "truck", "vehicle"}));
  EXPECT_EQ(
    info.constants,
    (std::vector<TypedName>{{"home", "location"}, {"depot", "location"}}));

  ASSERT_EQ(info.predicates.size(), 3U);
  EXPECT_EQ(info.predicates[0].declared_name, "at ?r - robot ?l - location");
  EXPECT_EQ(info.predicates[1].declared_name, "free ?r");
  EXPECT_EQ(info.predicates[2].name, "idle");

  ASSERT_EQ(info.functions.size(), 1U);
  EXPECT_EQ(info.functions[0].name, "fuel");

  ASSERT_EQ(info.derived.size(), 1U);
  EXPECT_EQ(info.derived[0].declared_name, "busy ?r");
}

TEST(DomainInfo, CommentsDocumentDeclarations)
{
  const auto info = extract_domain_info(SyntaxTreeBuilder::build(k_domain));
  ASSERT_EQ(info.predicates.size(), 3U);

  EXPECT_EQ(info.predicates[0].documentation, "robot location");
  EXPECT_EQ(info.predicates[1].documentation, "nothing held");
  // a blank line detaches a comment from the next declaration
  EXPECT_TRUE(info.predicates[2].documentation.empty());
}

TEST(DomainInfo, DeclarationRangeCoversBrackets)
{
  const std::string text = k_domain;
  const auto info = extract_domain_info(SyntaxTreeBuilder::build(text));
  ASSERT_FALSE(info.functions.empty());

  const auto start = static_cast<uint32_t>(text.find("(fuel"));
  EXPECT_EQ(info.functions[0].range.get_begin().get_offset(), start);
  EXPECT_EQ(info.functions[0].range.get_end().get_offset(), start + 19U);
}

TEST(DomainInfo, MissingSectionsStayEmpty)
{
  const auto info = extract_domain_info(SyntaxTreeBuilder::build("(define (domain d)"));
  EXPECT_EQ(info.name, "d");
  EXPECT_TRUE(info.predicates.empty());
  EXPECT_TRUE(info.types.empty());

  const auto nothing = extract_domain_info(SyntaxTreeBuilder::build("; empty"));
  EXPECT_TRUE(nothing.name.empty());
}

TEST(DomainInfo, TypedListDefaultsToObject)
{
  const auto tree = SyntaxTreeBuilder::build("(define (domain d) (:constants a b - t c))");
  const auto * constants = tree.node_at(20);
  ASSERT_NE(constants, nullptr);
  ASSERT_EQ(constants->construct(), pddl::syntax::ConstructKind::Constants);

  EXPECT_EQ(
    pddl::model::typed_list(*constants),
    (std::vector<TypedName>{{"a", "t"}, {"b", "t"}, {"c", "object"}}));
}

TEST(DomainInfo, SubtypesFollowTheHierarchy)
{
  const auto info = extract_domain_info(SyntaxTreeBuilder::build(
    "(define (domain d) (:types car truck - vehicle vehicle - thing place))"));

  ASSERT_EQ(info.type_parents.size(), 4U);
  EXPECT_EQ(info.type_parents[3], (TypedName{"place", "object"}));
  EXPECT_EQ(info.subtypes_of("thing"), (Strings{"vehicle", "car", "truck"}));
  EXPECT_EQ(info.subtypes_of("vehicle"), (Strings{"car", "truck"}));
  EXPECT_TRUE(info.subtypes_of("car").empty());
}

TEST(DomainInfo, ParseDeclaration)
{
  const auto decl = parse_declaration("at  ?r ?l - location\n ?x");

  EXPECT_EQ(decl.name, "at");
  EXPECT_EQ(decl.declared_name, "at ?r ?l - location ?x");
  EXPECT_EQ(decl.declared_name_without_types, "at ?r ?l ?x");
  ASSERT_EQ(decl.parameters.size(), 3U);
  EXPECT_EQ(decl.parameters[0].name, "?r");
  EXPECT_EQ(decl.parameters[0].type, "location");
  EXPECT_EQ(decl.parameters[1].type, "location");
  EXPECT_EQ(decl.parameters[2].name, "?x");
  EXPECT_EQ(decl.parameters[2].type, "object");

  EXPECT_TRUE(parse_declaration("   ").name.empty());
}

TEST(DomainInfo, StripTypes)
{
  EXPECT_EQ(strip_types("at ?r - robot ?l - location"), "at ?r ?l");
  EXPECT_EQ(strip_types("road-free ?a-b"), "road-free ?a-b");
  EXPECT_EQ(strip_types("idle"), "idle");
}
