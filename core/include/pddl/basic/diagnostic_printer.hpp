// pddl/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "pddl/basic/diagnostic.hpp"
#include "pddl/basic/source_manager.hpp"

namespace pddl
{

/**
 * Produces output like:
 *   error[E0002]: unclosed '('
 *     --> domain.pddl:3:5
 *      |
 *    3 |     (:action move
 *      |     ^^^^^^^^ opened here
 *      |
 *      = help: add ')' at the end of the construct
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to emit terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceManager & source);

  /// Print every diagnostic of the bag, ordered by primary location.
  void print_all(const DiagnosticBag & diags, const SourceManager & source);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label_context(const Label & label, const SourceManager & source);
  void print_source_line(
    std::string_view line, uint32_t line_num, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);
  void print_fixit(const FixIt & fixit, const SourceManager & source);
  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace pddl
