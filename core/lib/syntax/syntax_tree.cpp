// pddl/syntax/syntax_tree.cpp - Syntax tree construction and navigation
#include "pddl/syntax/syntax_tree.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <utility>

#include "pddl/syntax/tokenizer.hpp"

namespace pddl::syntax
{

// ============================================================================
// SyntaxNode
// ============================================================================

SyntaxNode::SyntaxNode(Token token, SyntaxNode * parent)
: token_(std::move(token)),
  construct_(classify_construct(token_.kind, token_.text)),
  parent_(parent),
  max_end_(token_.end())
{
}

void SyntaxNode::add_child(SyntaxNode * child)
{
  children_.push_back(child);
  recalculate_end(child->end());
}

void SyntaxNode::set_close_bracket(SyntaxNode * close)
{
  close_ = close;
  add_child(close);
}

void SyntaxNode::recalculate_end(uint32_t child_end) noexcept
{
  max_end_ = std::max(max_end_, child_end);
  if (parent_ != nullptr) {
    parent_->recalculate_end(max_end_);
  }
}

std::vector<const SyntaxNode *> SyntaxNode::nested_children() const
{
  std::vector<const SyntaxNode *> out;
  out.reserve(children_.size());
  for (const auto * child : children_) {
    if (child != close_) {
      out.push_back(child);
    }
  }
  return out;
}

std::vector<const SyntaxNode *> SyntaxNode::non_whitespace_children() const
{
  std::vector<const SyntaxNode *> out;
  for (const auto * child : children_) {
    if (child != close_ && !child->is(TokenKind::Whitespace)) {
      out.push_back(child);
    }
  }
  return out;
}

bool SyntaxNode::has_nested_children() const noexcept
{
  return children_.size() > (close_ != nullptr ? 1U : 0U);
}

std::string SyntaxNode::nested_text() const
{
  std::string out;
  for (const auto * child : nested_children()) {
    out += child->text();
  }
  return out;
}

std::string SyntaxNode::text() const
{
  std::string out = token_.text + nested_text();
  if (close_ != nullptr) {
    out += close_->token_text();
  }
  return out;
}

std::string_view SyntaxNode::stripped_text() const noexcept
{
  std::string_view text = token_.text;
  if (!text.empty() && text.front() == '(') {
    text.remove_prefix(1);
  }
  const auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

const SyntaxNode * SyntaxNode::expand() const noexcept
{
  const SyntaxNode * node = this;
  while (node != nullptr && !node->is_open_bracket() && !node->is_document()) {
    node = node->parent_;
  }
  if (node != nullptr && node->is_document()) {
    return nullptr;
  }
  return node;
}

const SyntaxNode * SyntaxNode::find_ancestor(TokenKind kind, ConstructKind construct) const noexcept
{
  for (const SyntaxNode * p = parent_; p != nullptr && !p->is_document(); p = p->parent_) {
    if (p->is(kind) && p->construct_ == construct) {
      return p;
    }
  }
  return nullptr;
}

const SyntaxNode * SyntaxNode::find_ancestor_any(
  std::initializer_list<ConstructKind> constructs) const noexcept
{
  for (const SyntaxNode * p = parent_; p != nullptr && !p->is_document(); p = p->parent_) {
    if (std::find(constructs.begin(), constructs.end(), p->construct_) != constructs.end()) {
      return p;
    }
  }
  return nullptr;
}

const SyntaxNode * SyntaxNode::first_child(TokenKind kind, ConstructKind construct) const noexcept
{
  auto it = std::find_if(children_.begin(), children_.end(), [&](const SyntaxNode * c) {
    return c->is(kind) && c->construct_ == construct;
  });
  return it == children_.end() ? nullptr : *it;
}

std::vector<const SyntaxNode *> SyntaxNode::preceding_siblings(
  TokenKind kind, const SyntaxNode * central) const
{
  std::vector<const SyntaxNode *> out;
  if (parent_ == nullptr) {
    return out;
  }
  const uint32_t pivot = (central != nullptr ? central : this)->start();
  for (const auto * sibling : parent_->children_) {
    if (sibling->is(kind) && sibling->start() < pivot) {
      out.push_back(sibling);
    }
  }
  return out;
}

std::vector<const SyntaxNode *> SyntaxNode::following_siblings(
  TokenKind kind, const SyntaxNode * central) const
{
  std::vector<const SyntaxNode *> out;
  if (parent_ == nullptr) {
    return out;
  }
  const uint32_t pivot = (central != nullptr ? central : this)->start();
  for (const auto * sibling : parent_->children_) {
    if (sibling->is(kind) && sibling->start() > pivot) {
      out.push_back(sibling);
    }
  }
  return out;
}

const SyntaxNode * SyntaxNode::keyword_open_bracket(ConstructKind keyword) const
{
  const SyntaxNode * keyword_node = first_child(TokenKind::Keyword, keyword);
  if (keyword_node == nullptr) {
    return nullptr;
  }
  const auto children = keyword_node->non_whitespace_children();
  auto it = std::find_if(children.begin(), children.end(), [](const SyntaxNode * c) {
    return c->is_open_bracket();
  });
  return it == children.end() ? nullptr : *it;
}

std::vector<const SyntaxNode *> SyntaxNode::parametrisable_scopes() const
{
  std::vector<const SyntaxNode *> scopes;
  for (const SyntaxNode * p = parent_; p != nullptr && !p->is_document(); p = p->parent_) {
    if (p->is(TokenKind::OpenBracketOperator) && is_parametrisable(p->construct_)) {
      scopes.push_back(p);
    }
  }
  return scopes;
}

const SyntaxNode * SyntaxNode::parameter_definition() const
{
  if (has_parameters_keyword(construct_)) {
    return keyword_open_bracket(ConstructKind::Parameters);
  }
  for (const auto * child : children_) {
    if (child == close_ || child->is(TokenKind::Whitespace)) {
      continue;
    }
    return child->is_open_bracket() ? child : nullptr;
  }
  return nullptr;
}

std::string SyntaxNode::to_string() const
{
  std::string text;
  for (const char c : token_.text) {
    if (c == '\n') {
      text += "\\n";
    } else if (c != '\r') {
      text += c;
    }
  }
  return fmt::format(
    "{}: text: '{}', range: {}~{}", syntax::to_string(token_.kind), text, start(), end());
}

// ============================================================================
// SyntaxTree
// ============================================================================

SyntaxTree::SyntaxTree()
{
  root_ = make_node(Token{TokenKind::Document, "", 0}, nullptr);
}

SyntaxNode * SyntaxTree::make_node(Token token, SyntaxNode * parent)
{
  nodes_.push_back(std::make_unique<SyntaxNode>(std::move(token), parent));
  return nodes_.back().get();
}

const SyntaxNode * SyntaxTree::node_at(uint32_t offset) const noexcept
{
  const SyntaxNode * node = root_;
  if (!node->includes(offset)) {
    return nullptr;
  }
  while (node->has_nested_children() && !node->token().includes(offset)) {
    const auto children = node->children();
    auto it = std::find_if(children.begin(), children.end(), [offset](const SyntaxNode * c) {
      return c->includes(offset);
    });
    if (it == children.end()) {
      return nullptr;
    }
    node = *it;
  }
  return node;
}

const SyntaxNode * SyntaxTree::define_node() const noexcept
{
  return root_->first_child(TokenKind::OpenBracketOperator, ConstructKind::Define);
}

namespace
{

void dump_node(const SyntaxNode & node, int depth, std::string & out)
{
  out.append(static_cast<size_t>(depth) * 2, ' ');
  out += node.to_string();
  out += '\n';
  for (const auto * child : node.children()) {
    dump_node(*child, depth + 1, out);
  }
}

}  // namespace

std::string SyntaxTree::dump() const
{
  std::string out;
  dump_node(*root_, 0, out);
  return out;
}

// ============================================================================
// SyntaxTreeBuilder
// ============================================================================

SyntaxTree SyntaxTreeBuilder::build(std::string_view text)
{
  SyntaxTree tree;
  SyntaxTreeBuilder builder(tree);
  for (auto & token : tokenize(text)) {
    builder.on_token(std::move(token));
  }
  return tree;
}

SyntaxTreeBuilder::SyntaxTreeBuilder(SyntaxTree & tree) : tree_(tree), current_(tree.root_) {}

void SyntaxTreeBuilder::on_token(Token token)
{
  switch (token.kind) {
    case TokenKind::Keyword:
      close_keyword();
      add_child(std::move(token));
      break;
    case TokenKind::CloseBracket:
      close_bracket(std::move(token));
      break;
    default:
      if (is_leaf_kind(current_->kind())) {
        current_ = current_->parent_;
      }
      add_child(std::move(token));
      break;
  }
}

void SyntaxTreeBuilder::add_child(Token token)
{
  SyntaxNode * child = tree_.make_node(std::move(token), current_);
  current_->add_child(child);
  current_ = child;
}

void SyntaxTreeBuilder::close_keyword()
{
  // climb out of nested leaves until the previous keyword or the enclosing bracket
  while (!current_->is(TokenKind::Keyword) && !current_->is_open_bracket()) {
    if (current_->parent_ == nullptr) {
      return;
    }
    current_ = current_->parent_;
  }
  if (current_->is(TokenKind::Keyword)) {
    current_ = current_->parent_;
  }
}

void SyntaxTreeBuilder::close_bracket(Token token)
{
  while (!current_->is_open_bracket()) {
    if (current_->parent_ == nullptr) {
      tree_.offending_tokens_.push_back(std::move(token));
      return;
    }
    current_ = current_->parent_;
  }
  SyntaxNode * bracket = current_;
  current_ = bracket->parent_;
  bracket->set_close_bracket(tree_.make_node(std::move(token), bracket));
}

}  // namespace pddl::syntax
