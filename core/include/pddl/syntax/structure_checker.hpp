// pddl/syntax/structure_checker.hpp - Bracket balance and section order checks
//
// The syntax tree accepts any input, so this pass is where malformed
// structure becomes visible to the user:
//   E0001  a ')' without a matching '('
//   E0002  a '(' that is never closed (with a fix-it inserting the ')')
//   W0001  a section written out of the grammar's order
//
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "pddl/basic/diagnostic.hpp"
#include "pddl/syntax/sections.hpp"
#include "pddl/syntax/syntax_tree.hpp"

namespace pddl::syntax
{

class StructureChecker
{
public:
  explicit StructureChecker(DiagnosticBag * diags = nullptr) : diags_(diags) {}

  /**
   * Check a whole document.
   *
   * @param grammar  Section order of the `(define` block; null skips W0001.
   * @return true when no error was found (warnings do not count).
   */
  bool check(const SyntaxTree & tree, const GrammarTable * grammar);

  [[nodiscard]] bool has_errors() const noexcept { return error_count_ > 0; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }
  [[nodiscard]] size_t warning_count() const noexcept { return warning_count_; }

private:
  void check_unclosed(const SyntaxNode & node);
  void check_section_order(const SyntaxNode & define, const GrammarTable & grammar);

  void report_error(
    SourceRange range, std::string_view code, std::string message, std::string label,
    std::optional<FixIt> fixit = std::nullopt);
  void report_warning(
    SourceRange range, std::string message, std::string label, SourceRange related,
    std::string related_label, const GrammarTable & grammar);

  DiagnosticBag * diags_ = nullptr;
  size_t error_count_ = 0;
  size_t warning_count_ = 0;
};

}  // namespace pddl::syntax
