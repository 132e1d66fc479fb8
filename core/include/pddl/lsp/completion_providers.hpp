// pddl/lsp/completion_providers.hpp - Completion providers per file kind
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pddl/basic/source_manager.hpp"
#include "pddl/lsp/completion_types.hpp"
#include "pddl/lsp/scope_classifier.hpp"
#include "pddl/lsp/suggestion.hpp"
#include "pddl/model/domain_info.hpp"
#include "pddl/syntax/sections.hpp"
#include "pddl/syntax/syntax_tree.hpp"

namespace pddl::lsp
{

/// Everything a provider needs to know about one request
struct CompletionContext
{
  const syntax::SyntaxTree & tree;
  const SourceManager & source;
  const CompletionRequest & request;
  const syntax::SyntaxNode & node;  // innermost node at the cursor
  const ScopeClassification & scope;
};

/// Range replaced by a keyword item: set for `(` and `:` triggers only
[[nodiscard]] std::optional<SourceRange> trigger_replace_range(
  const CompletionRequest & request, const syntax::SyntaxNode & current);

/// Requirement flags inside `(:requirements`, shared by domain and problem files
[[nodiscard]] std::vector<CompletionItem> requirement_items(
  const SuggestionTable & table, const CompletionContext & ctx, bool job_scheduling);

/// Declared names without their types, comma separated, for snippet choices
[[nodiscard]] std::string to_type_less_names_csv(const std::vector<model::Declaration> & declarations);

// ============================================================================
// DomainCompletionProvider
// ============================================================================

/**
 * Section, structure, keyword, effect and parameter suggestions for domain files.
 */
class DomainCompletionProvider
{
public:
  DomainCompletionProvider(std::shared_ptr<const SuggestionTable> table, CompletionOptions options);

  [[nodiscard]] std::vector<CompletionItem> provide(
    const CompletionContext & ctx, const model::DomainInfo & domain) const;

private:
  [[nodiscard]] std::vector<CompletionItem> define_items(const CompletionContext & ctx) const;
  [[nodiscard]] std::vector<CompletionItem> body_items(
    const CompletionContext & ctx, const syntax::GrammarTable & grammar) const;
  [[nodiscard]] std::vector<CompletionItem> effect_items(
    const CompletionContext & ctx, const model::DomainInfo & domain) const;
  [[nodiscard]] std::vector<CompletionItem> condition_items(const CompletionContext & ctx) const;
  [[nodiscard]] std::vector<CompletionItem> parameter_items(const CompletionContext & ctx) const;

  [[nodiscard]] std::optional<std::string> define_snippet(std::string_view section) const;

  std::shared_ptr<const SuggestionTable> table_;
  CompletionOptions options_;
};

// ============================================================================
// ProblemCompletionProvider
// ============================================================================

/**
 * Pre-parsing directives, problem sections, requirements and `(:init`
 * snippets for problem files.
 *
 * Init snippets draw on the declarations of the problem's domain and are not
 * offered when that domain is unknown (`domain == nullptr`).
 */
class ProblemCompletionProvider
{
public:
  explicit ProblemCompletionProvider(std::shared_ptr<const SuggestionTable> table);

  [[nodiscard]] std::vector<CompletionItem> provide(
    const CompletionContext & ctx, const model::DomainInfo * domain) const;

  [[nodiscard]] static std::vector<CompletionItem> pre_parsing_items();

  /// Symmetric, sequence and timed initial literal snippets
  [[nodiscard]] static std::vector<CompletionItem> init_items(
    const CompletionContext & ctx, const model::DomainInfo & domain);

private:
  [[nodiscard]] std::vector<CompletionItem> define_items(const CompletionContext & ctx) const;

  std::shared_ptr<const SuggestionTable> table_;
};

// ============================================================================
// UnknownCompletionProvider
// ============================================================================

/// Domain / problem skeletons for a document without a recognizable header
class UnknownCompletionProvider
{
public:
  [[nodiscard]] std::vector<CompletionItem> provide(const CompletionContext & ctx) const;
};

// ============================================================================
// SymbolCompletionProvider
// ============================================================================

/**
 * Operators, predicate / function / derived names and type names declared in
 * the domain, keyed on the text before the cursor on the same line.
 */
class SymbolCompletionProvider
{
public:
  explicit SymbolCompletionProvider(std::shared_ptr<const SuggestionTable> table);

  [[nodiscard]] std::vector<CompletionItem> provide(
    const CompletionContext & ctx, const model::DomainInfo * domain) const;

  [[nodiscard]] std::vector<CompletionItem> operator_items() const;
  [[nodiscard]] static std::vector<CompletionItem> variable_items(const model::DomainInfo & domain);
  [[nodiscard]] static std::vector<CompletionItem> type_items(const model::DomainInfo & domain);

private:
  std::shared_ptr<const SuggestionTable> table_;
};

}  // namespace pddl::lsp
