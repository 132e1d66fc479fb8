// pddl/lsp/scope_classifier.hpp - Structural position of the cursor
#pragma once

#include <cstdint>
#include <string_view>

#include "pddl/lsp/completion_types.hpp"
#include "pddl/syntax/syntax_tree.hpp"

namespace pddl::lsp
{

enum class StructuralPosition : uint8_t {
  BeforeDefine,              // document top level, outside `(define`
  InsideDefine,              // a section slot directly under `(define`
  InsideRequirements,        // within `(:requirements ...)`
  InsideActionBody,          // keyword slot of `(:action`, `(:process` or `(:event`
  InsideDurativeActionBody,  // keyword slot of `(:durative-action` or `(:job`
  InsideEffect,              // somewhere below an `:effect` keyword
  InsideCondition,           // unqualified part of a durative `:condition`
  ParameterReference,        // a `?` was typed
  InsideInit,                // somewhere below a problem's `(:init`
  Unknown,
};

[[nodiscard]] std::string_view to_string(StructuralPosition position) noexcept;

/**
 * Result of classifying one cursor node.
 *
 * `current` is the node the sibling scan stops at (the cursor node, or its
 * enclosing bracket when a trigger character opened it). `reference` anchors
 * the scan. `scope` is the structure that selects the grammar table, if any.
 */
struct ScopeClassification
{
  StructuralPosition position = StructuralPosition::Unknown;
  const syntax::SyntaxNode * current = nullptr;
  const syntax::SyntaxNode * reference = nullptr;
  const syntax::SyntaxNode * scope = nullptr;
};

/**
 * Decide which structural position applies at `node`.
 *
 * Checks run from the most specific construct outward; the first match wins.
 * Nothing is cached, every call re-derives the position from the live tree.
 */
[[nodiscard]] ScopeClassification classify_scope(
  const syntax::SyntaxTree & tree, const syntax::SyntaxNode & node,
  const CompletionRequest & request);

// ============================================================================
// Individual predicates
// ============================================================================

/// The Document itself, or whitespace / comment directly under it
[[nodiscard]] bool is_top_level(const syntax::SyntaxNode & node) noexcept;

[[nodiscard]] bool is_inside_define(
  const syntax::SyntaxTree & tree, const syntax::SyntaxNode & node,
  const CompletionRequest & request) noexcept;

[[nodiscard]] bool is_inside_requirements(
  const syntax::SyntaxTree & tree, const syntax::SyntaxNode & node) noexcept;

[[nodiscard]] bool is_inside_effect(const syntax::SyntaxNode & node) noexcept;
[[nodiscard]] bool is_inside_action_or_event(const syntax::SyntaxNode & node) noexcept;
[[nodiscard]] bool is_inside_process(const syntax::SyntaxNode & node) noexcept;

/// Under `(at start` or `(at end` of a durative action
[[nodiscard]] bool is_inside_durative_discrete_effect(const syntax::SyntaxNode & node) noexcept;

/// In a durative action's effect, outside any `(at start` / `(at end`
[[nodiscard]] bool is_inside_durative_unqualified_effect(const syntax::SyntaxNode & node) noexcept;

/// In a durative action's `:condition`, outside any time qualifier
[[nodiscard]] bool is_inside_durative_unqualified_condition(
  const syntax::SyntaxNode & node) noexcept;

[[nodiscard]] bool is_inside_init(const syntax::SyntaxNode & node) noexcept;

}  // namespace pddl::lsp
