// pddl/test_support/completion_helpers.hpp - helpers for completion tests
//
// A test document is written with a single '|' marking the cursor. The marker
// is removed before the text is analyzed.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pddl/basic/source_manager.hpp"
#include "pddl/lsp/completion_engine.hpp"
#include "pddl/model/domain_info.hpp"
#include "pddl/model/file_scope.hpp"
#include "pddl/syntax/syntax_tree.hpp"

namespace pddl::test_support
{

struct TestDocument
{
  SourceManager source;
  syntax::SyntaxTree tree;
  model::FileScope scope;
  model::DomainInfo domain;
  uint32_t cursor = 0;

  /// 0-based line and column of a byte offset, the way editors report them
  [[nodiscard]] std::pair<uint32_t, uint32_t> position(uint32_t offset) const noexcept
  {
    const LineColumn lc = source.get_line_column(offset);
    return {lc.line - 1, lc.column - 1};
  }
};

[[nodiscard]] inline TestDocument load(std::string text_with_cursor)
{
  TestDocument doc;
  const auto marker = text_with_cursor.find('|');
  if (marker != std::string::npos) {
    doc.cursor = static_cast<uint32_t>(marker);
    text_with_cursor.erase(marker, 1);
  }
  doc.source.set_source(std::move(text_with_cursor));
  doc.tree = syntax::SyntaxTreeBuilder::build(doc.source.get_source());
  doc.scope = model::classify_file(doc.tree);
  if (model::is_domain(doc.scope)) {
    doc.domain = model::extract_domain_info(doc.tree);
  }
  return doc;
}

[[nodiscard]] inline lsp::CompletionRequest invoked(
  uint32_t offset, std::optional<char> trigger_character = std::nullopt)
{
  lsp::CompletionRequest request;
  request.offset = offset;
  request.trigger_kind = lsp::TriggerKind::Invoke;
  request.trigger_character = trigger_character;
  return request;
}

[[nodiscard]] inline lsp::CompletionRequest triggered(uint32_t offset, char trigger_character)
{
  lsp::CompletionRequest request;
  request.offset = offset;
  request.trigger_kind = lsp::TriggerKind::TriggerCharacter;
  request.trigger_character = trigger_character;
  return request;
}

[[nodiscard]] inline std::vector<lsp::CompletionItem> complete(
  const TestDocument & doc, const lsp::CompletionRequest & request,
  lsp::CompletionOptions options = {})
{
  const lsp::CompletionEngine engine(options);
  return engine.complete(doc.tree, doc.source, doc.scope, &doc.domain, request);
}

[[nodiscard]] inline std::vector<std::string> filter_texts(
  const std::vector<lsp::CompletionItem> & items)
{
  std::vector<std::string> out;
  out.reserve(items.size());
  for (const auto & item : items) {
    out.push_back(item.filter_text);
  }
  return out;
}

[[nodiscard]] inline std::vector<std::string> labels(const std::vector<lsp::CompletionItem> & items)
{
  std::vector<std::string> out;
  out.reserve(items.size());
  for (const auto & item : items) {
    out.push_back(item.label);
  }
  return out;
}

[[nodiscard]] inline const lsp::CompletionItem * find_label(
  const std::vector<lsp::CompletionItem> & items, std::string_view label)
{
  for (const auto & item : items) {
    if (item.label == label) {
      return &item;
    }
  }
  return nullptr;
}

}  // namespace pddl::test_support
