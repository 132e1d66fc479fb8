// pddl/lsp/completion_types.hpp - Completion request and result types
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "pddl/basic/source_manager.hpp"

namespace pddl::lsp
{

enum class TriggerKind : uint8_t {
  Invoke,            // explicit request (Ctrl+Space) or typing a word character
  TriggerCharacter,  // one of the registered trigger characters was typed
};

/**
 * One completion request at a byte offset.
 *
 * The trigger character is carried independently of the trigger kind because
 * hosts also report it on re-triggered Invoke requests.
 */
struct CompletionRequest
{
  uint32_t offset = 0;
  TriggerKind trigger_kind = TriggerKind::Invoke;
  std::optional<char> trigger_character;

  [[nodiscard]] bool triggered_by(char c) const noexcept
  {
    return trigger_character.has_value() && *trigger_character == c;
  }
};

/// Subset of the LSP CompletionItemKind enumeration used by the providers
enum class CompletionItemKind : uint8_t {
  Text,
  Method,
  Function,
  Class,
  Interface,
  Module,
  Property,
  Unit,
  Value,
  Keyword,
  Snippet,
  Struct,
  Event,
  Operator,
  TypeParameter,
};

[[nodiscard]] std::string_view to_string(CompletionItemKind kind) noexcept;

enum class InsertTextFormat : uint8_t {
  PlainText,
  Snippet,
};

/**
 * A rendered suggestion.
 *
 * `replace_range` is set only when the inserted text must overwrite the
 * characters that triggered the request (e.g. the typed `(` or `(:`).
 */
struct CompletionItem
{
  std::string label;
  CompletionItemKind kind = CompletionItemKind::Keyword;
  std::string detail;
  std::string documentation;  // markdown
  std::string insert_text;
  InsertTextFormat insert_text_format = InsertTextFormat::Snippet;
  std::string filter_text;
  std::string sort_text;
  std::optional<SourceRange> replace_range;
};

/// Settings that change which suggestions are offered
struct CompletionOptions
{
  bool job_scheduling = false;
};

/**
 * Cooperative cancellation flag shared between the request owner and the engine.
 */
class CancellationToken
{
public:
  void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }

  [[nodiscard]] bool is_cancellation_requested() const noexcept
  {
    return cancelled_.load(std::memory_order_relaxed);
  }

private:
  std::atomic<bool> cancelled_{false};
};

}  // namespace pddl::lsp
