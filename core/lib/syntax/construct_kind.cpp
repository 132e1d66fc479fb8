// pddl/syntax/construct_kind.cpp - Token text to construct tag
#include "pddl/syntax/construct_kind.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace pddl::syntax
{
namespace
{

using Entry = std::pair<std::string_view, ConstructKind>;

inline constexpr std::array<Entry, 28> k_bracket_constructs = {{
  {"define", ConstructKind::Define},
  {"domain", ConstructKind::DomainHeader},
  {"problem", ConstructKind::ProblemHeader},
  {":requirements", ConstructKind::Requirements},
  {":types", ConstructKind::Types},
  {":constants", ConstructKind::Constants},
  {":predicates", ConstructKind::Predicates},
  {":functions", ConstructKind::Functions},
  {":constraints", ConstructKind::Constraints},
  {":domain", ConstructKind::DomainReference},
  {":objects", ConstructKind::Objects},
  {":init", ConstructKind::Init},
  {":goal", ConstructKind::Goal},
  {":metric", ConstructKind::Metric},
  {":derived", ConstructKind::Derived},
  {":action", ConstructKind::Action},
  {":durative-action", ConstructKind::DurativeAction},
  {":process", ConstructKind::Process},
  {":event", ConstructKind::Event},
  {":job", ConstructKind::Job},
  {"and", ConstructKind::And},
  {"not", ConstructKind::Not},
  {"at start", ConstructKind::AtStart},
  {"at end", ConstructKind::AtEnd},
  {"over all", ConstructKind::OverAll},
  {"forall", ConstructKind::Forall},
  {"exists", ConstructKind::Exists},
  {"when", ConstructKind::When},
}};

inline constexpr std::array<Entry, 5> k_keyword_constructs = {{
  {":parameters", ConstructKind::Parameters},
  {":precondition", ConstructKind::Precondition},
  {":effect", ConstructKind::Effect},
  {":duration", ConstructKind::Duration},
  {":condition", ConstructKind::Condition},
}};

std::string normalize(std::string_view text)
{
  if (!text.empty() && text.front() == '(') {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

template <size_t N>
ConstructKind lookup(const std::array<Entry, N> & table, std::string_view key, ConstructKind dflt)
{
  auto it = std::find_if(table.begin(), table.end(), [key](const Entry & e) {
    return e.first == key;
  });
  return it == table.end() ? dflt : it->second;
}

}  // namespace

ConstructKind classify_construct(TokenKind kind, std::string_view text)
{
  switch (kind) {
    case TokenKind::OpenBracketOperator:
      return lookup(k_bracket_constructs, normalize(text), ConstructKind::OtherOperator);
    case TokenKind::Keyword:
      return lookup(k_keyword_constructs, normalize(text), ConstructKind::OtherKeyword);
    default:
      return ConstructKind::None;
  }
}

std::string_view to_string(ConstructKind kind) noexcept
{
  switch (kind) {
    case ConstructKind::None:
      return "none";
    case ConstructKind::Define:
      return "define";
    case ConstructKind::DomainHeader:
      return "domain";
    case ConstructKind::ProblemHeader:
      return "problem";
    case ConstructKind::Requirements:
      return ":requirements";
    case ConstructKind::Types:
      return ":types";
    case ConstructKind::Constants:
      return ":constants";
    case ConstructKind::Predicates:
      return ":predicates";
    case ConstructKind::Functions:
      return ":functions";
    case ConstructKind::Constraints:
      return ":constraints";
    case ConstructKind::DomainReference:
      return ":domain";
    case ConstructKind::Objects:
      return ":objects";
    case ConstructKind::Init:
      return ":init";
    case ConstructKind::Goal:
      return ":goal";
    case ConstructKind::Metric:
      return ":metric";
    case ConstructKind::Derived:
      return ":derived";
    case ConstructKind::Action:
      return ":action";
    case ConstructKind::DurativeAction:
      return ":durative-action";
    case ConstructKind::Process:
      return ":process";
    case ConstructKind::Event:
      return ":event";
    case ConstructKind::Job:
      return ":job";
    case ConstructKind::And:
      return "and";
    case ConstructKind::Not:
      return "not";
    case ConstructKind::AtStart:
      return "at start";
    case ConstructKind::AtEnd:
      return "at end";
    case ConstructKind::OverAll:
      return "over all";
    case ConstructKind::Forall:
      return "forall";
    case ConstructKind::Exists:
      return "exists";
    case ConstructKind::When:
      return "when";
    case ConstructKind::OtherOperator:
      return "operator";
    case ConstructKind::Parameters:
      return ":parameters";
    case ConstructKind::Precondition:
      return ":precondition";
    case ConstructKind::Effect:
      return ":effect";
    case ConstructKind::Duration:
      return ":duration";
    case ConstructKind::Condition:
      return ":condition";
    case ConstructKind::OtherKeyword:
      return "keyword";
  }
  return "none";
}

}  // namespace pddl::syntax
