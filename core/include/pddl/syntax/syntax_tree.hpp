// pddl/syntax/syntax_tree.hpp - Error-tolerant bracket tree over PDDL tokens
//
// The tree is built for every keystroke, so it never rejects input: unmatched
// close brackets are recorded as offending tokens and unclosed brackets simply
// extend to the end of the document.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "pddl/syntax/construct_kind.hpp"
#include "pddl/syntax/token.hpp"

namespace pddl::syntax
{

class SyntaxTreeBuilder;

// ============================================================================
// SyntaxNode
// ============================================================================

/**
 * One token of the document placed in the bracket hierarchy.
 *
 * Open brackets own the tokens up to their matching close bracket, and a
 * keyword owns the tokens up to the next keyword of the same bracket. The
 * close bracket itself is appended as the last child of its open bracket but
 * is excluded from nested_children().
 */
class SyntaxNode
{
public:
  SyntaxNode(Token token, SyntaxNode * parent);

  SyntaxNode(const SyntaxNode &) = delete;
  SyntaxNode & operator=(const SyntaxNode &) = delete;

  [[nodiscard]] const Token & token() const noexcept { return token_; }
  [[nodiscard]] TokenKind kind() const noexcept { return token_.kind; }
  [[nodiscard]] ConstructKind construct() const noexcept { return construct_; }
  [[nodiscard]] std::string_view token_text() const noexcept { return token_.text; }

  [[nodiscard]] bool is(TokenKind kind) const noexcept { return token_.kind == kind; }
  [[nodiscard]] bool is_document() const noexcept { return is(TokenKind::Document); }
  [[nodiscard]] bool is_open_bracket() const noexcept
  {
    return syntax::is_open_bracket(token_.kind);
  }

  [[nodiscard]] uint32_t start() const noexcept { return token_.start; }
  /// End of the last descendant (close bracket included)
  [[nodiscard]] uint32_t end() const noexcept { return max_end_; }
  [[nodiscard]] SourceRange range() const noexcept { return {start(), end()}; }
  [[nodiscard]] bool includes(uint32_t offset) const noexcept
  {
    return offset >= start() && offset <= end();
  }

  [[nodiscard]] const SyntaxNode * parent() const noexcept { return parent_; }

  /// All children including the close bracket node
  [[nodiscard]] gsl::span<const SyntaxNode * const> children() const noexcept
  {
    return {children_.data(), children_.size()};
  }
  [[nodiscard]] std::vector<const SyntaxNode *> nested_children() const;
  [[nodiscard]] std::vector<const SyntaxNode *> non_whitespace_children() const;
  [[nodiscard]] bool has_nested_children() const noexcept;

  [[nodiscard]] bool is_closed() const noexcept { return close_ != nullptr; }
  [[nodiscard]] const SyntaxNode * close_bracket() const noexcept { return close_; }

  /// Token text plus the text of every nested child (and the close bracket)
  [[nodiscard]] std::string text() const;
  [[nodiscard]] std::string nested_text() const;

  /// Token text without the leading '(' and surrounding whitespace
  [[nodiscard]] std::string_view stripped_text() const noexcept;

  /// Nearest open-bracket node among self and ancestors; nullptr at top level.
  [[nodiscard]] const SyntaxNode * expand() const noexcept;

  /// Nearest proper ancestor (below the document) of the given kind and tag.
  [[nodiscard]] const SyntaxNode * find_ancestor(
    TokenKind kind, ConstructKind construct) const noexcept;

  /// Nearest proper ancestor tagged as any of the given constructs.
  [[nodiscard]] const SyntaxNode * find_ancestor_any(
    std::initializer_list<ConstructKind> constructs) const noexcept;

  [[nodiscard]] const SyntaxNode * first_child(
    TokenKind kind, ConstructKind construct) const noexcept;

  /// Siblings of the given kind (this node included) starting before `central`
  [[nodiscard]] std::vector<const SyntaxNode *> preceding_siblings(
    TokenKind kind, const SyntaxNode * central = nullptr) const;
  /// Siblings of the given kind (this node included) starting after `central`
  [[nodiscard]] std::vector<const SyntaxNode *> following_siblings(
    TokenKind kind, const SyntaxNode * central = nullptr) const;

  /// Bracket nested directly under the given keyword child, e.g. `:parameters (...)`
  [[nodiscard]] const SyntaxNode * keyword_open_bracket(ConstructKind keyword) const;

  /// Parametrisable structures enclosing this node, innermost first
  [[nodiscard]] std::vector<const SyntaxNode *> parametrisable_scopes() const;

  /// Bracket declaring the parameters of this parametrisable scope
  [[nodiscard]] const SyntaxNode * parameter_definition() const;

  /// One-line description for tree dumps
  [[nodiscard]] std::string to_string() const;

private:
  friend class SyntaxTreeBuilder;

  void add_child(SyntaxNode * child);
  void set_close_bracket(SyntaxNode * close);
  void recalculate_end(uint32_t child_end) noexcept;

  Token token_;
  ConstructKind construct_;
  SyntaxNode * parent_;
  std::vector<const SyntaxNode *> children_;
  const SyntaxNode * close_ = nullptr;
  uint32_t max_end_;
};

// ============================================================================
// SyntaxTree
// ============================================================================

/// Owns every node; node pointers stay valid while the tree lives.
class SyntaxTree
{
public:
  SyntaxTree();

  SyntaxTree(SyntaxTree &&) noexcept = default;
  SyntaxTree & operator=(SyntaxTree &&) noexcept = default;
  SyntaxTree(const SyntaxTree &) = delete;
  SyntaxTree & operator=(const SyntaxTree &) = delete;

  [[nodiscard]] const SyntaxNode & root() const noexcept { return *root_; }

  /// Innermost node covering the offset; nullptr when the offset is outside the document.
  [[nodiscard]] const SyntaxNode * node_at(uint32_t offset) const noexcept;

  /// The `(define` bracket, if any
  [[nodiscard]] const SyntaxNode * define_node() const noexcept;

  /// Close brackets that had no matching open bracket
  [[nodiscard]] const std::vector<Token> & offending_tokens() const noexcept
  {
    return offending_tokens_;
  }

  /// Indented dump of the whole tree, one node per line
  [[nodiscard]] std::string dump() const;

private:
  friend class SyntaxTreeBuilder;

  SyntaxNode * make_node(Token token, SyntaxNode * parent);

  std::vector<std::unique_ptr<SyntaxNode>> nodes_;
  SyntaxNode * root_ = nullptr;
  std::vector<Token> offending_tokens_;
};

// ============================================================================
// SyntaxTreeBuilder
// ============================================================================

class SyntaxTreeBuilder
{
public:
  /// Tokenize and build in one go
  [[nodiscard]] static SyntaxTree build(std::string_view text);

  explicit SyntaxTreeBuilder(SyntaxTree & tree);

  void on_token(Token token);

private:
  void add_child(Token token);
  void close_keyword();
  void close_bracket(Token token);

  SyntaxTree & tree_;
  SyntaxNode * current_;
};

}  // namespace pddl::syntax
