// pddl/model/domain_info.cpp - Declaration extraction from a domain tree
#include "pddl/model/domain_info.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace pddl::model
{
namespace
{

using syntax::ConstructKind;
using syntax::SyntaxNode;
using syntax::TokenKind;

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

bool is_type_char(char c)
{
  return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_' || c == '-';
}

/// Collapse whitespace runs to one space and trim both ends
std::string normalize_space(std::string_view text)
{
  std::string out;
  bool pending_space = false;
  for (const char c : text) {
    if (is_space(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out += ' ';
      pending_space = false;
    }
    out += c;
  }
  return out;
}

/// Body of a declaration bracket, e.g. "at ?r - robot" for `(at ?r - robot)`
std::string declaration_text(const SyntaxNode & bracket)
{
  std::string text(bracket.token_text());
  if (!text.empty() && text.front() == '(') {
    text.erase(0, 1);
  }
  text += bracket.nested_text();
  return normalize_space(text);
}

std::string_view comment_body(std::string_view comment)
{
  while (!comment.empty() && comment.front() == ';') {
    comment.remove_prefix(1);
  }
  while (!comment.empty() && is_space(comment.front())) {
    comment.remove_prefix(1);
  }
  return comment;
}

void append_doc(std::string & doc, std::string_view comment)
{
  if (!doc.empty()) {
    doc += '\n';
  }
  doc += comment_body(comment);
}

size_t count_newlines(std::string_view text)
{
  return static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
}

/**
 * Declarations listed in a section such as `(:predicates ...)`.
 *
 * A comment on the same line as a declaration documents it; comment lines
 * directly above a declaration (no blank line in between) document the next
 * declaration.
 */
std::vector<Declaration> declarations_in(const SyntaxNode & section)
{
  std::vector<Declaration> out;
  std::string pending_doc;
  bool newline_since_last = true;

  for (const auto * child : section.nested_children()) {
    switch (child->kind()) {
      case TokenKind::OpenBracket:
      case TokenKind::OpenBracketOperator: {
        Declaration decl = parse_declaration(declaration_text(*child));
        decl.documentation = std::move(pending_doc);
        decl.range = child->range();
        pending_doc.clear();
        newline_since_last = false;
        if (!decl.name.empty()) {
          out.push_back(std::move(decl));
        }
        break;
      }
      case TokenKind::Comment:
        if (!newline_since_last && !out.empty()) {
          append_doc(out.back().documentation, child->token_text());
        } else {
          append_doc(pending_doc, child->token_text());
        }
        break;
      case TokenKind::Whitespace: {
        const size_t newlines = count_newlines(child->token_text());
        if (newlines > 0) {
          newline_since_last = true;
        }
        if (newlines > 1) {
          pending_doc.clear();
        }
        break;
      }
      default:
        break;
    }
  }
  return out;
}

/// Every name in a `(:types ...)` section, parents included, first occurrence first
std::vector<std::string> types_in(const SyntaxNode & section)
{
  std::vector<std::string> out;
  for (const auto * child : section.nested_children()) {
    if (!child->is(TokenKind::Other)) {
      continue;
    }
    std::string name(child->token_text());
    if (std::find(out.begin(), out.end(), name) == out.end()) {
      out.push_back(std::move(name));
    }
  }
  return out;
}

}  // namespace

std::string strip_types(std::string_view declared_name)
{
  std::string out;
  size_t i = 0;
  while (i < declared_name.size()) {
    // match \s+-\s+[\w-]+ starting at i
    size_t j = i;
    while (j < declared_name.size() && is_space(declared_name[j])) {
      ++j;
    }
    if (j > i && j < declared_name.size() && declared_name[j] == '-') {
      size_t k = j + 1;
      const size_t after_dash = k;
      while (k < declared_name.size() && is_space(declared_name[k])) {
        ++k;
      }
      const size_t type_start = k;
      while (k < declared_name.size() && is_type_char(declared_name[k])) {
        ++k;
      }
      if (type_start > after_dash && k > type_start) {
        i = k;
        continue;
      }
    }
    out += declared_name[i];
    ++i;
  }
  return out;
}

Declaration parse_declaration(std::string_view declared_name)
{
  Declaration decl;
  decl.declared_name = normalize_space(declared_name);
  decl.declared_name_without_types = strip_types(decl.declared_name);

  std::vector<std::string> words;
  size_t i = 0;
  const std::string & text = decl.declared_name;
  while (i < text.size()) {
    while (i < text.size() && is_space(text[i])) {
      ++i;
    }
    const size_t start = i;
    while (i < text.size() && !is_space(text[i])) {
      ++i;
    }
    if (i > start) {
      words.emplace_back(text.substr(start, i - start));
    }
  }
  if (words.empty()) {
    return decl;
  }

  decl.name = words.front();

  // parameters without a type yet wait for the next `- type`
  size_t untyped_from = 0;
  for (size_t w = 1; w < words.size(); ++w) {
    if (words[w] == "-" && w + 1 < words.size()) {
      for (size_t p = untyped_from; p < decl.parameters.size(); ++p) {
        decl.parameters[p].type = words[w + 1];
      }
      untyped_from = decl.parameters.size();
      ++w;
    } else if (words[w].front() == '?') {
      decl.parameters.push_back(Parameter{words[w], "object"});
    }
  }
  return decl;
}

std::vector<std::string> typed_list_names(const SyntaxNode & list)
{
  std::vector<std::string> out;
  bool after_dash = false;
  for (const auto * child : list.non_whitespace_children()) {
    if (child->is(TokenKind::Dash)) {
      after_dash = true;
      continue;
    }
    if (child->is(TokenKind::Other) || child->is(TokenKind::Parameter)) {
      if (!after_dash) {
        out.emplace_back(child->token_text());
      }
    }
    after_dash = false;
  }
  return out;
}

std::vector<TypedName> typed_list(const SyntaxNode & list)
{
  std::vector<TypedName> out;
  size_t untyped_from = 0;
  bool after_dash = false;
  for (const auto * child : list.non_whitespace_children()) {
    if (child->is(TokenKind::Dash)) {
      after_dash = true;
      continue;
    }
    if (!child->is(TokenKind::Other)) {
      after_dash = false;
      continue;
    }
    if (after_dash) {
      for (size_t i = untyped_from; i < out.size(); ++i) {
        out[i].type = std::string(child->token_text());
      }
      untyped_from = out.size();
      after_dash = false;
      continue;
    }
    out.push_back(TypedName{std::string(child->token_text()), "object"});
  }
  return out;
}

std::vector<std::string> DomainInfo::subtypes_of(std::string_view type) const
{
  std::vector<std::string> out;
  std::vector<std::string> frontier{std::string(type)};
  while (!frontier.empty()) {
    const std::string parent = std::move(frontier.back());
    frontier.pop_back();
    for (const auto & entry : type_parents) {
      if (entry.type != parent || entry.name == type) {
        continue;
      }
      if (std::find(out.begin(), out.end(), entry.name) == out.end()) {
        out.push_back(entry.name);
        frontier.push_back(entry.name);
      }
    }
  }
  return out;
}

DomainInfo extract_domain_info(const syntax::SyntaxTree & tree)
{
  DomainInfo info;
  const SyntaxNode * define = tree.define_node();
  if (define == nullptr) {
    return info;
  }

  for (const auto * child : define->non_whitespace_children()) {
    if (!child->is(TokenKind::OpenBracketOperator)) {
      continue;
    }
    switch (child->construct()) {
      case ConstructKind::DomainHeader:
        if (auto names = typed_list_names(*child); !names.empty()) {
          info.name = names.front();
        }
        break;
      case ConstructKind::Predicates:
        info.predicates = declarations_in(*child);
        break;
      case ConstructKind::Functions:
        info.functions = declarations_in(*child);
        break;
      case ConstructKind::Types:
        info.types = types_in(*child);
        info.type_parents = typed_list(*child);
        break;
      case ConstructKind::Constants:
        info.constants = typed_list(*child);
        break;
      case ConstructKind::Derived: {
        auto derived = declarations_in(*child);
        if (!derived.empty()) {
          info.derived.push_back(std::move(derived.front()));
        }
        break;
      }
      default:
        break;
    }
  }
  return info;
}

}  // namespace pddl::model
