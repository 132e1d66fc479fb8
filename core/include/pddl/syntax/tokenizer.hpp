// pddl/syntax/tokenizer.hpp - Splits PDDL text into tokens
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "pddl/syntax/token.hpp"

namespace pddl::syntax
{

/**
 * Tokenizer producing a gapless token stream.
 *
 * Every byte of the input ends up in exactly one token; text that no rule
 * recognizes is emitted as an Other token, so the concatenation of all token
 * texts equals the input.
 */
class Tokenizer
{
public:
  explicit Tokenizer(std::string_view src) : src_(src) {}

  [[nodiscard]] std::vector<Token> tokenize();

private:
  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }

  // Each matcher returns the length of the token at pos_ (0 = no match).
  [[nodiscard]] size_t match_open_bracket_operator() const noexcept;
  [[nodiscard]] size_t match_keyword() const noexcept;
  [[nodiscard]] size_t match_comment() const noexcept;
  [[nodiscard]] size_t match_parameter() const noexcept;
  [[nodiscard]] size_t match_number() const noexcept;
  [[nodiscard]] size_t match_word() const noexcept;
  [[nodiscard]] size_t match_whitespace() const noexcept;

  /// Token starting exactly at pos_, or nullopt when no rule applies there.
  [[nodiscard]] std::optional<Token> next_token();

  [[nodiscard]] Token make_token(TokenKind kind, size_t start, size_t len) const;

  std::string_view src_;
  size_t pos_ = 0;
};

/// Convenience wrapper over Tokenizer
[[nodiscard]] std::vector<Token> tokenize(std::string_view src);

}  // namespace pddl::syntax
