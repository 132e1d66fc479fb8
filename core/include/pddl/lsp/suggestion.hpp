// pddl/lsp/suggestion.hpp - Suggestions and the shared documentation table
#pragma once

#include <array>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "pddl/lsp/completion_types.hpp"

namespace pddl::lsp
{

/**
 * A grammar name eligible at the cursor, before rendering.
 *
 * `filter_text` is the required prefix (e.g. "(") followed by the name, so the
 * host's fuzzy matcher ranks it against what the user already typed.
 */
struct Suggestion
{
  std::string section_name;
  std::string filter_text;

  /// Nothing when a `:` trigger rules the name out.
  [[nodiscard]] static std::optional<Suggestion> from(
    std::string_view section_name, std::optional<char> trigger_character,
    std::string_view filter_text_prefix);
};

/// Labels repeat across contexts (`increase` is discrete or continuous), so
/// documentation is looked up per group.
enum class SuggestionGroup : uint8_t {
  Domain,
  Problem,
  DiscreteEffect,
  ContinuousEffect,
  DurativeEffect,
  DurativeCondition,
  Operator,
};

inline constexpr size_t k_suggestion_group_count = 7;

struct SuggestionDetails
{
  std::string label;
  std::string detail;
  std::string documentation;  // markdown
  std::optional<CompletionItemKind> kind;
};

/**
 * Per-label documentation and kind, built once and shared read-only between
 * every provider and every request.
 */
class SuggestionTable
{
public:
  void add(
    SuggestionGroup group, std::string label, std::string detail, std::string documentation,
    std::optional<CompletionItemKind> kind = std::nullopt);

  [[nodiscard]] const SuggestionDetails * find(
    SuggestionGroup group, std::string_view label) const;

  [[nodiscard]] size_t size() const noexcept;

  /// The table with the documentation of every built-in keyword
  [[nodiscard]] static std::shared_ptr<const SuggestionTable> create_default();

private:
  std::array<std::unordered_map<std::string, SuggestionDetails>, k_suggestion_group_count> groups_;
};

// ============================================================================
// Rendering helpers
// ============================================================================

/**
 * Render a suggestion as a snippet item.
 *
 * Labels missing from the table fall back to a plain Keyword item without
 * documentation. `index` becomes the sort key ("item<index>").
 */
[[nodiscard]] CompletionItem make_snippet_item(
  const SuggestionTable & table, SuggestionGroup group, const Suggestion & suggestion,
  std::string snippet, std::optional<SourceRange> replace_range, size_t index);

/// `${n|a,b|}` when there are options, else `${n:default}`
[[nodiscard]] std::string to_selection(
  int tabstop, std::string_view options_csv, std::string_view or_default);

/// "\n\nThis language feature requires `:a`, `:b`."
[[nodiscard]] std::string requires_features(std::initializer_list<std::string_view> requirements);

/// Fenced markdown code block
[[nodiscard]] std::string code_block(std::string_view code, std::string_view language = "pddl");

}  // namespace pddl::lsp
