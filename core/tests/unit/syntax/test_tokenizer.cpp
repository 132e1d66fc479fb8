#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

#include "pddl/syntax/token.hpp"
#include "pddl/syntax/tokenizer.hpp"

using pddl::syntax::Token;
using pddl::syntax::TokenKind;
using pddl::syntax::tokenize;

namespace
{

std::vector<TokenKind> kinds_of(const std::vector<Token> & tokens)
{
  std::vector<TokenKind> out;
  for (const auto & t : tokens) {
    out.push_back(t.kind);
  }
  return out;
}

std::vector<std::string> texts_of(const std::vector<Token> & tokens)
{
  std::vector<std::string> out;
  for (const auto & t : tokens) {
    out.push_back(t.text);
  }
  return out;
}

}  // namespace

TEST(SyntaxTokenizer, DefineHeader)
{
  const auto tokens = tokenize("(define (domain d)");

  EXPECT_EQ(
    kinds_of(tokens),
    (std::vector<TokenKind>{
      TokenKind::OpenBracketOperator, TokenKind::Whitespace, TokenKind::OpenBracketOperator,
      TokenKind::Whitespace, TokenKind::Other, TokenKind::CloseBracket}));
  EXPECT_EQ(texts_of(tokens), (std::vector<std::string>{"(define", " ", "(domain", " ", "d", ")"}));
  EXPECT_EQ(tokens[2].start, 8U);
  EXPECT_EQ(tokens[2].end(), 15U);
}

TEST(SyntaxTokenizer, EveryByteLandsInAToken)
{
  const std::string_view src = "(define (domain d) @ \xC5\xBE (:action a :parameters (?x - t)))\n";
  const auto tokens = tokenize(src);

  std::string joined;
  uint32_t expected_start = 0;
  for (const auto & t : tokens) {
    EXPECT_EQ(t.start, expected_start) << t.text;
    expected_start = t.end();
    joined += t.text;
  }
  EXPECT_EQ(joined, src);
}

TEST(SyntaxTokenizer, ColonWithoutNameIsAGap)
{
  const auto tokens = tokenize("(:)");

  EXPECT_EQ(
    kinds_of(tokens),
    (std::vector<TokenKind>{TokenKind::OpenBracket, TokenKind::Other, TokenKind::CloseBracket}));
  EXPECT_EQ(tokens[1].text, ":");
}

TEST(SyntaxTokenizer, QuestionMarkWithoutNameIsAGap)
{
  const auto tokens = tokenize("?)");
  ASSERT_EQ(tokens.size(), 2U);
  EXPECT_EQ(tokens[0].kind, TokenKind::Other);
  EXPECT_EQ(tokens[0].text, "?");
}

TEST(SyntaxTokenizer, BracketOperators)
{
  EXPECT_EQ(tokenize("(:durative-action")[0].text, "(:durative-action");
  EXPECT_EQ(tokenize("( at start x")[0].text, "( at start");
  EXPECT_EQ(tokenize("(at end x")[0].text, "(at end");
  EXPECT_EQ(tokenize("(at ?x")[0].text, "(at");
  EXPECT_EQ(tokenize("(at-most-once x")[0].text, "(at-most-once");
  EXPECT_EQ(tokenize("(>= a b")[0].text, "(>=");
  EXPECT_EQ(tokenize("(< a b")[0].text, "(<");
  EXPECT_EQ(tokenize("(* #t 2")[0].text, "(*");
  EXPECT_EQ(tokenize("(increase (f)")[0].text, "(increase");
}

TEST(SyntaxTokenizer, NamesThatMerelyStartWithAnOperator)
{
  const auto andx = tokenize("(andx)");
  ASSERT_GE(andx.size(), 2U);
  EXPECT_EQ(andx[0].kind, TokenKind::OpenBracket);
  EXPECT_EQ(andx[1].text, "andx");

  const auto at_x = tokenize("(at-x)");
  ASSERT_GE(at_x.size(), 2U);
  EXPECT_EQ(at_x[0].kind, TokenKind::OpenBracket);
  EXPECT_EQ(at_x[1].text, "at-x");
}

TEST(SyntaxTokenizer, KeywordsParametersAndDashes)
{
  const auto tokens = tokenize(":parameters (?from-loc ?to_loc - place)");

  EXPECT_EQ(tokens[0].kind, TokenKind::Keyword);
  EXPECT_EQ(tokens[0].text, ":parameters");
  EXPECT_EQ(tokens[3].kind, TokenKind::Parameter);
  EXPECT_EQ(tokens[3].text, "?from-loc");
  EXPECT_EQ(tokens[5].kind, TokenKind::Parameter);
  EXPECT_EQ(tokens[5].text, "?to_loc");
  EXPECT_EQ(tokens[7].kind, TokenKind::Dash);
}

TEST(SyntaxTokenizer, NumbersAndTime)
{
  const auto tokens = tokenize("-1.5 #t 42");
  EXPECT_EQ(texts_of(tokens), (std::vector<std::string>{"-1.5", " ", "#t", " ", "42"}));
  EXPECT_EQ(tokens[0].kind, TokenKind::Other);
  EXPECT_EQ(tokens[2].kind, TokenKind::Other);
}

TEST(SyntaxTokenizer, CommentStopsBeforeLineBreak)
{
  const auto tokens = tokenize("; note\r\n(define");
  ASSERT_GE(tokens.size(), 3U);
  EXPECT_EQ(tokens[0].kind, TokenKind::Comment);
  EXPECT_EQ(tokens[0].text, "; note");
  EXPECT_EQ(tokens[1].kind, TokenKind::Whitespace);
  EXPECT_EQ(tokens[1].text, "\r\n");
}

TEST(SyntaxTokenizer, TokenIncludesBothEnds)
{
  const Token token{TokenKind::Other, "abc", 4};
  EXPECT_FALSE(token.includes(3));
  EXPECT_TRUE(token.includes(4));
  EXPECT_TRUE(token.includes(7));
  EXPECT_FALSE(token.includes(8));
}

TEST(SyntaxTokenizer, KindNames)
{
  EXPECT_EQ(pddl::syntax::to_string(TokenKind::OpenBracketOperator), "OPEN_BRACKET_OPERATOR");
  EXPECT_EQ(pddl::syntax::to_string(TokenKind::Document), "DOCUMENT");
}
