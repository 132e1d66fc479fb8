// pddl/basic/diagnostic.hpp - Structural diagnostics for PDDL documents
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pddl/basic/source_manager.hpp"

namespace pddl
{

enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

enum class LabelStyle {
  Primary,
  Secondary,
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

/// Text to insert at (or replace over) a range
struct FixIt
{
  SourceRange range;
  std::string replacement_text;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g. "E0001"
  std::string message;

  std::vector<Label> labels;
  std::vector<FixIt> fixits;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

/// Diagnostic codes reported by the structural checker
namespace diag_code
{
inline constexpr const char * k_unmatched_close = "E0001";
inline constexpr const char * k_unclosed_open = "E0002";
inline constexpr const char * k_section_order = "W0001";
}  // namespace diag_code

class DiagnosticBag;

/**
 * Fluent builder; the diagnostic is committed to its bag when the builder
 * is destroyed.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);
  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);
  DiagnosticBuilder & with_fixit(SourceRange range, std::string replacement);
  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBuilder report(
    Severity severity, SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  [[nodiscard]] std::vector<Diagnostic> filter(Severity severity) const;

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace pddl
