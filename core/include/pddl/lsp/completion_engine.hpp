// pddl/lsp/completion_engine.hpp - Completion entry point
#pragma once

#include <memory>
#include <vector>

#include "pddl/basic/source_manager.hpp"
#include "pddl/lsp/completion_providers.hpp"
#include "pddl/lsp/completion_types.hpp"
#include "pddl/lsp/suggestion.hpp"
#include "pddl/model/domain_info.hpp"
#include "pddl/model/file_scope.hpp"
#include "pddl/syntax/syntax_tree.hpp"

namespace pddl::lsp
{

/**
 * Grammar-aware completion over a syntax tree snapshot.
 *
 * Never throws on malformed input: an offset outside the document, an
 * unrecognized scope or a cancelled request all produce an empty list.
 * The engine keeps no per-request state, so one instance may serve any
 * number of documents.
 */
class CompletionEngine
{
public:
  explicit CompletionEngine(
    CompletionOptions options = {},
    std::shared_ptr<const SuggestionTable> table = SuggestionTable::create_default());

  [[nodiscard]] const CompletionOptions & options() const noexcept { return options_; }

  /**
   * Suggestions at `request.offset`.
   *
   * @param domain  Declarations offered as predicate / function / type names:
   *                the document's own for a domain file, the referenced
   *                domain's for a problem file. May be null.
   * @param cancel  Checked once at entry. May be null.
   */
  [[nodiscard]] std::vector<CompletionItem> complete(
    const syntax::SyntaxTree & tree, const SourceManager & source, const model::FileScope & scope,
    const model::DomainInfo * domain, const CompletionRequest & request,
    const CancellationToken * cancel = nullptr) const;

private:
  std::shared_ptr<const SuggestionTable> table_;
  CompletionOptions options_;

  DomainCompletionProvider domain_provider_;
  ProblemCompletionProvider problem_provider_;
  UnknownCompletionProvider unknown_provider_;
  SymbolCompletionProvider symbol_provider_;
};

}  // namespace pddl::lsp
