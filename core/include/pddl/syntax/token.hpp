// pddl/syntax/token.hpp - Lexical tokens of a PDDL document
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "pddl/basic/source_manager.hpp"

namespace pddl::syntax
{

enum class TokenKind : uint8_t {
  Document,             // synthetic root, empty text
  OpenBracketOperator,  // `(` + optional whitespace + operator, e.g. `(:action`, `(and`, `(>=`
  OpenBracket,          // `(`
  CloseBracket,         // `)`
  Keyword,              // `:parameters`, `:effect`, ...
  Dash,                 // `-`
  Parameter,            // `?name`
  Whitespace,
  Comment,  // `;` up to (not including) the line break
  Other,    // names, numbers, `#t` and any unmatched text
};

[[nodiscard]] std::string_view to_string(TokenKind kind) noexcept;

/// Kinds that open a bracketed form
[[nodiscard]] constexpr bool is_open_bracket(TokenKind kind) noexcept
{
  return kind == TokenKind::OpenBracketOperator || kind == TokenKind::OpenBracket;
}

/// Kinds that never own children in the syntax tree
[[nodiscard]] constexpr bool is_leaf_kind(TokenKind kind) noexcept
{
  return kind == TokenKind::Comment || kind == TokenKind::Other || kind == TokenKind::Parameter ||
         kind == TokenKind::Dash || kind == TokenKind::Whitespace;
}

struct Token
{
  TokenKind kind = TokenKind::Other;
  std::string text;
  uint32_t start = 0;

  [[nodiscard]] uint32_t end() const noexcept
  {
    return start + static_cast<uint32_t>(text.size());
  }

  [[nodiscard]] SourceRange range() const noexcept { return {start, end()}; }

  /// Inclusive on both ends, so a cursor just after the token still hits it.
  [[nodiscard]] bool includes(uint32_t offset) const noexcept
  {
    return offset >= start && offset <= end();
  }
};

}  // namespace pddl::syntax
