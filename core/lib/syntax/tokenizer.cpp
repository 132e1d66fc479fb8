// pddl/syntax/tokenizer.cpp - PDDL tokenizer
#include "pddl/syntax/tokenizer.hpp"

#include <array>
#include <cctype>

namespace pddl::syntax
{
namespace
{

bool is_word(char c) { return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_'; }
bool is_word_or_dash(char c) { return is_word(c) || c == '-'; }
bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

// Operators recognized right after an opening bracket. Order matters: the
// first entry that matches (and is not followed by '-') wins, so `at start`
// precedes `at`, and `at` yields to `at-most-once` through the '-' rule.
inline constexpr std::array<std::string_view, 24> k_bracket_operators = {
  "define",   "domain",   "problem",  "and",    "or",     "not",
  "at start", "at end",   "over all", "at",     "=",      "assign",
  "increase", "decrease", "always",   "sometime", "forall", "exists",
  "when",     "within",   "at-most-once", "sometime-before", "always-within", "supply-demand",
};

}  // namespace

std::string_view to_string(TokenKind kind) noexcept
{
  switch (kind) {
    case TokenKind::Document:
      return "DOCUMENT";
    case TokenKind::OpenBracketOperator:
      return "OPEN_BRACKET_OPERATOR";
    case TokenKind::OpenBracket:
      return "OPEN_BRACKET";
    case TokenKind::CloseBracket:
      return "CLOSE_BRACKET";
    case TokenKind::Keyword:
      return "KEYWORD";
    case TokenKind::Dash:
      return "DASH";
    case TokenKind::Parameter:
      return "PARAMETER";
    case TokenKind::Whitespace:
      return "WHITESPACE";
    case TokenKind::Comment:
      return "COMMENT";
    case TokenKind::Other:
      return "OTHER";
  }
  return "OTHER";
}

size_t Tokenizer::match_open_bracket_operator() const noexcept
{
  if (peek() != '(') {
    return 0;
  }
  size_t i = pos_ + 1;
  while (i < src_.size() && is_space(src_[i])) {
    ++i;
  }
  if (i >= src_.size()) {
    return 0;
  }

  const auto char_at = [this](size_t j) { return j < src_.size() ? src_[j] : '\0'; };
  const auto accept = [&](size_t end) -> size_t {
    return char_at(end) == '-' ? 0 : end - pos_;
  };

  // `(:name`; the name swallows every trailing '-'
  if (src_[i] == ':' && is_word(char_at(i + 1))) {
    size_t j = i + 2;
    while (j < src_.size() && is_word_or_dash(src_[j])) {
      ++j;
    }
    return j - pos_;
  }

  const char c = src_[i];
  if (c == '-' || c == '/' || c == '+' || c == '*') {
    return accept(i + 1);
  }
  if (c == '>' || c == '<') {
    if (char_at(i + 1) == '=') {
      if (const size_t n = accept(i + 2); n != 0) {
        return n;
      }
    }
    return accept(i + 1);
  }

  const std::string_view rest = src_.substr(i);
  for (const auto op : k_bracket_operators) {
    if (rest.substr(0, op.size()) != op) {
      continue;
    }
    const char next = char_at(i + op.size());
    if (next == '-') {
      continue;
    }
    // `(andx` is a plain bracket followed by the name `andx`
    if (is_word(op.back()) && is_word(next)) {
      continue;
    }
    return i + op.size() - pos_;
  }
  return 0;
}

size_t Tokenizer::match_keyword() const noexcept
{
  if (peek() != ':' || !is_word_or_dash(peek(1))) {
    return 0;
  }
  size_t n = 2;
  while (is_word_or_dash(peek(n))) {
    ++n;
  }
  return n;
}

size_t Tokenizer::match_comment() const noexcept
{
  if (peek() != ';') {
    return 0;
  }
  size_t end = src_.find('\n', pos_);
  if (end == std::string_view::npos) {
    return src_.size() - pos_;
  }
  if (end > pos_ + 1 && src_[end - 1] == '\r') {
    --end;
  }
  return end - pos_;
}

size_t Tokenizer::match_parameter() const noexcept
{
  if (peek() != '?' || !is_word(peek(1))) {
    return 0;
  }
  size_t n = 2;
  while (is_word_or_dash(peek(n))) {
    ++n;
  }
  return n;
}

size_t Tokenizer::match_number() const noexcept
{
  size_t n = (peek() == '-' || peek() == '+') ? 1 : 0;
  size_t digits = 0;
  while (is_digit(peek(n + digits))) {
    ++digits;
  }
  if (peek(n + digits) == '.' && is_digit(peek(n + digits + 1))) {
    size_t fraction = 1;
    while (is_digit(peek(n + digits + 1 + fraction))) {
      ++fraction;
    }
    return n + digits + 1 + fraction;
  }
  return digits > 0 ? n + digits : 0;
}

size_t Tokenizer::match_word() const noexcept
{
  if (!is_word(peek())) {
    return 0;
  }
  size_t n = 1;
  while (is_word_or_dash(peek(n))) {
    ++n;
  }
  return n;
}

size_t Tokenizer::match_whitespace() const noexcept
{
  size_t n = 0;
  while (pos_ + n < src_.size() && is_space(src_[pos_ + n])) {
    ++n;
  }
  return n;
}

Token Tokenizer::make_token(TokenKind kind, size_t start, size_t len) const
{
  return Token{kind, std::string(src_.substr(start, len)), static_cast<uint32_t>(start)};
}

std::optional<Token> Tokenizer::next_token()
{
  if (const size_t n = match_open_bracket_operator(); n != 0) {
    return make_token(TokenKind::OpenBracketOperator, pos_, n);
  }
  if (peek() == '(') {
    return make_token(TokenKind::OpenBracket, pos_, 1);
  }
  if (const size_t n = match_keyword(); n != 0) {
    return make_token(TokenKind::Keyword, pos_, n);
  }
  if (peek() == ')') {
    return make_token(TokenKind::CloseBracket, pos_, 1);
  }
  if (const size_t n = match_comment(); n != 0) {
    return make_token(TokenKind::Comment, pos_, n);
  }
  if (const size_t n = match_parameter(); n != 0) {
    return make_token(TokenKind::Parameter, pos_, n);
  }
  if (const size_t n = match_number(); n != 0) {
    return make_token(TokenKind::Other, pos_, n);
  }
  if (peek() == '-') {
    return make_token(TokenKind::Dash, pos_, 1);
  }
  if (peek() == '#' && peek(1) == 't') {
    return make_token(TokenKind::Other, pos_, 2);
  }
  if (const size_t n = match_word(); n != 0) {
    return make_token(TokenKind::Other, pos_, n);
  }
  if (const size_t n = match_whitespace(); n != 0) {
    return make_token(TokenKind::Whitespace, pos_, n);
  }
  return std::nullopt;
}

std::vector<Token> Tokenizer::tokenize()
{
  std::vector<Token> out;
  size_t gap_start = pos_;

  while (!eof()) {
    auto tok = next_token();
    if (!tok) {
      ++pos_;
      continue;
    }
    if (pos_ > gap_start) {
      out.push_back(make_token(TokenKind::Other, gap_start, pos_ - gap_start));
    }
    pos_ += tok->text.size();
    gap_start = pos_;
    out.push_back(std::move(*tok));
  }
  if (pos_ > gap_start) {
    out.push_back(make_token(TokenKind::Other, gap_start, pos_ - gap_start));
  }
  return out;
}

std::vector<Token> tokenize(std::string_view src) { return Tokenizer(src).tokenize(); }

}  // namespace pddl::syntax
