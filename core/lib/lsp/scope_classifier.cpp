// pddl/lsp/scope_classifier.cpp - Structural position of the cursor
#include "pddl/lsp/scope_classifier.hpp"

#include "pddl/syntax/sections.hpp"

namespace pddl::lsp
{

using syntax::ConstructKind;
using syntax::SyntaxNode;
using syntax::TokenKind;

std::string_view to_string(StructuralPosition position) noexcept
{
  switch (position) {
    case StructuralPosition::BeforeDefine:
      return "BeforeDefine";
    case StructuralPosition::InsideDefine:
      return "InsideDefine";
    case StructuralPosition::InsideRequirements:
      return "InsideRequirements";
    case StructuralPosition::InsideActionBody:
      return "InsideActionBody";
    case StructuralPosition::InsideDurativeActionBody:
      return "InsideDurativeActionBody";
    case StructuralPosition::InsideEffect:
      return "InsideEffect";
    case StructuralPosition::InsideCondition:
      return "InsideCondition";
    case StructuralPosition::ParameterReference:
      return "ParameterReference";
    case StructuralPosition::InsideInit:
      return "InsideInit";
    case StructuralPosition::Unknown:
      return "Unknown";
  }
  return "Unknown";
}

namespace
{

const SyntaxNode * bracket_ancestor(const SyntaxNode & node, ConstructKind construct) noexcept
{
  return node.find_ancestor(TokenKind::OpenBracketOperator, construct);
}

bool has_durative_ancestor(const SyntaxNode & node) noexcept
{
  return bracket_ancestor(node, ConstructKind::DurativeAction) != nullptr ||
         bracket_ancestor(node, ConstructKind::Job) != nullptr;
}

/// `(` or `(:` with nothing typed after the colon yet
bool is_bare_bracket(const SyntaxNode & bracket) noexcept
{
  std::string_view text = bracket.token_text();
  if (text.empty() || text.front() != '(') {
    return false;
  }
  text.remove_prefix(1);
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t' || text.front() == '\r' ||
                           text.front() == '\n')) {
    text.remove_prefix(1);
  }
  return text.empty() || text == ":";
}

/// Enclosing bracket when it opens an action-like body, else nullptr
const SyntaxNode * enclosing_structure(const SyntaxNode & node) noexcept
{
  const SyntaxNode * scope = node.expand();
  if (scope == nullptr || !scope->is(TokenKind::OpenBracketOperator)) {
    return nullptr;
  }
  return scope;
}

}  // namespace

bool is_top_level(const SyntaxNode & node) noexcept
{
  if (node.is_document()) {
    return true;
  }
  const bool blank = node.is(TokenKind::Whitespace) || node.is(TokenKind::Comment);
  return blank && node.parent() != nullptr && node.parent()->is_document();
}

bool is_inside_define(
  const syntax::SyntaxTree & tree, const SyntaxNode & node,
  const CompletionRequest & request) noexcept
{
  const SyntaxNode * define = tree.define_node();
  if (define == nullptr) {
    return false;
  }
  if (request.trigger_kind == TriggerKind::Invoke) {
    return node.parent() == define;
  }
  const SyntaxNode * enclosing = node.expand();
  return enclosing != nullptr && is_bare_bracket(*enclosing) && enclosing->parent() == define;
}

bool is_inside_requirements(const syntax::SyntaxTree & tree, const SyntaxNode & node) noexcept
{
  const SyntaxNode * define = tree.define_node();
  if (define == nullptr) {
    return false;
  }
  const SyntaxNode * requirements =
    define->first_child(TokenKind::OpenBracketOperator, ConstructKind::Requirements);
  // flags are keywords, so whitespace after `:strips` hangs below that keyword
  return requirements != nullptr && &node != requirements && node.expand() == requirements;
}

bool is_inside_effect(const SyntaxNode & node) noexcept
{
  return node.find_ancestor(TokenKind::Keyword, ConstructKind::Effect) != nullptr;
}

bool is_inside_action_or_event(const SyntaxNode & node) noexcept
{
  return bracket_ancestor(node, ConstructKind::Action) != nullptr ||
         bracket_ancestor(node, ConstructKind::Event) != nullptr;
}

bool is_inside_process(const SyntaxNode & node) noexcept
{
  return bracket_ancestor(node, ConstructKind::Process) != nullptr;
}

bool is_inside_durative_discrete_effect(const SyntaxNode & node) noexcept
{
  return has_durative_ancestor(node) &&
         node.find_ancestor_any({ConstructKind::AtStart, ConstructKind::AtEnd}) != nullptr;
}

bool is_inside_durative_unqualified_effect(const SyntaxNode & node) noexcept
{
  return has_durative_ancestor(node) &&
         node.find_ancestor_any({ConstructKind::AtStart, ConstructKind::AtEnd}) == nullptr;
}

bool is_inside_durative_unqualified_condition(const SyntaxNode & node) noexcept
{
  return node.find_ancestor(TokenKind::Keyword, ConstructKind::Condition) != nullptr &&
         has_durative_ancestor(node) &&
         node.find_ancestor_any(
           {ConstructKind::AtStart, ConstructKind::AtEnd, ConstructKind::OverAll}) == nullptr;
}

bool is_inside_init(const SyntaxNode & node) noexcept
{
  return bracket_ancestor(node, ConstructKind::Init) != nullptr;
}

ScopeClassification classify_scope(
  const syntax::SyntaxTree & tree, const SyntaxNode & node, const CompletionRequest & request)
{
  ScopeClassification result;
  result.current = &node;
  result.reference = &node;

  if (is_top_level(node)) {
    result.position = StructuralPosition::BeforeDefine;
    return result;
  }

  if (node.is(TokenKind::Comment)) {
    return result;
  }

  if (is_inside_define(tree, node, request)) {
    if (request.trigger_character.has_value()) {
      if (const SyntaxNode * enclosing = node.expand()) {
        result.current = enclosing;
        result.reference = enclosing;
      }
    }
    result.position = StructuralPosition::InsideDefine;
    result.scope = tree.define_node();
    return result;
  }

  if (is_inside_requirements(tree, node)) {
    result.position = StructuralPosition::InsideRequirements;
    result.scope = node.expand();
    return result;
  }

  if (const SyntaxNode * structure = enclosing_structure(node)) {
    switch (structure->construct()) {
      case ConstructKind::Action:
      case ConstructKind::Process:
      case ConstructKind::Event:
        result.position = StructuralPosition::InsideActionBody;
        break;
      case ConstructKind::DurativeAction:
      case ConstructKind::Job:
        result.position = StructuralPosition::InsideDurativeActionBody;
        break;
      default:
        break;
    }
    if (result.position != StructuralPosition::Unknown) {
      result.reference = &syntax::preceding_keyword_or_self(node);
      result.scope = structure;
      return result;
    }
  }

  if (request.triggered_by('?')) {
    result.position = StructuralPosition::ParameterReference;
    return result;
  }

  if (is_inside_effect(node)) {
    result.position = StructuralPosition::InsideEffect;
    return result;
  }

  if (is_inside_durative_unqualified_condition(node)) {
    result.position = StructuralPosition::InsideCondition;
    return result;
  }

  if (const SyntaxNode * init = bracket_ancestor(node, ConstructKind::Init)) {
    result.position = StructuralPosition::InsideInit;
    result.scope = init;
    return result;
  }

  return result;
}

}  // namespace pddl::lsp
