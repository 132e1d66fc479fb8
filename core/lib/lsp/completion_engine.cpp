// pddl/lsp/completion_engine.cpp - Completion entry point
#include "pddl/lsp/completion_engine.hpp"

#include <fmt/format.h>

#include <iterator>
#include <type_traits>
#include <utility>
#include <variant>

#include "pddl/lsp/scope_classifier.hpp"

namespace pddl::lsp
{
namespace
{

/// True for nodes nested somewhere below the `(define` bracket
bool is_below_define(const syntax::SyntaxTree & tree, const syntax::SyntaxNode & node) noexcept
{
  const syntax::SyntaxNode * define = tree.define_node();
  if (define == nullptr) {
    return false;
  }
  for (const auto * p = node.parent(); p != nullptr; p = p->parent()) {
    if (p == define) {
      return true;
    }
  }
  return false;
}

}  // namespace

CompletionEngine::CompletionEngine(
  CompletionOptions options, std::shared_ptr<const SuggestionTable> table)
: table_(std::move(table)),
  options_(options),
  domain_provider_(table_, options_),
  problem_provider_(table_),
  symbol_provider_(table_)
{
}

std::vector<CompletionItem> CompletionEngine::complete(
  const syntax::SyntaxTree & tree, const SourceManager & source, const model::FileScope & scope,
  const model::DomainInfo * domain, const CompletionRequest & request,
  const CancellationToken * cancel) const
{
  if (cancel != nullptr && cancel->is_cancellation_requested()) {
    return {};
  }

  const syntax::SyntaxNode * node = tree.node_at(request.offset);
  if (node == nullptr) {
    return {};
  }

  const ScopeClassification classification = classify_scope(tree, *node, request);
  const CompletionContext ctx{tree, source, request, *node, classification};

  // expression positions that no structural provider answers fall back to names;
  // init facts get the names after the init snippets
  const auto with_symbols = [&](std::vector<CompletionItem> items) {
    const bool init = classification.position == StructuralPosition::InsideInit;
    const bool fallback = items.empty() &&
                          classification.position == StructuralPosition::Unknown &&
                          is_below_define(tree, *node);
    if (!init && !fallback) {
      return items;
    }
    auto symbols = symbol_provider_.provide(ctx, domain);
    if (items.empty()) {
      return symbols;
    }
    items.insert(
      items.end(), std::make_move_iterator(symbols.begin()), std::make_move_iterator(symbols.end()));
    for (size_t i = 0; i < items.size(); ++i) {
      items[i].sort_text = fmt::format("item{:03}", i);
    }
    return items;
  };

  return std::visit(
    [&](const auto & file) -> std::vector<CompletionItem> {
      using T = std::decay_t<decltype(file)>;
      if constexpr (std::is_same_v<T, model::DomainScope>) {
        const model::DomainInfo empty{};
        return with_symbols(domain_provider_.provide(ctx, domain != nullptr ? *domain : empty));
      } else if constexpr (std::is_same_v<T, model::ProblemScope>) {
        return with_symbols(problem_provider_.provide(ctx, domain));
      } else {
        return unknown_provider_.provide(ctx);
      }
    },
    scope);
}

}  // namespace pddl::lsp
