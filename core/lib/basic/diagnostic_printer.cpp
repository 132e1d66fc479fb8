// pddl/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "pddl/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace pddl
{

namespace
{

const char * severity_name(Severity s)
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

rang::fg severity_color(Severity s)
{
  switch (s) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
    case Severity::Info:
      return rang::fg::cyan;
    case Severity::Hint:
      return rang::fg::green;
  }
  return rang::fg::red;
}

// Tabs are widened to four columns in snippets.
std::string clean_line(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += "    ";
    } else if (c != '\r' && c != '\n') {
      out += c;
    }
  }
  return out;
}

std::string display_name(const SourceManager & source)
{
  if (!source.has_file_path()) {
    return "<input>";
  }
  std::error_code ec;
  auto rel = std::filesystem::relative(source.get_file_path(), std::filesystem::current_path(), ec);
  return ec || rel.empty() ? source.get_file_path().string() : rel.string();
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceManager & source)
{
  const FullSourceRange primary = source.get_full_range(diag.primary_range());
  const std::string filename = display_name(source);

  print_severity_header(diag);

  if (primary.is_valid()) {
    fmt::print(
      os_, "{} {}:{}:{}\n", gutter_arrow(), filename, primary.start_line, primary.start_column);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }
  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label_context(label, source);
  }
  for (const auto & f : diag.fixits) {
    print_fixit(f, source);
  }
  if (diag.help_message) {
    print_trailer("help", *diag.help_message);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceManager & source)
{
  std::vector<Diagnostic> sorted(diags.begin(), diags.end());
  std::stable_sort(sorted.begin(), sorted.end(), [](const Diagnostic & a, const Diagnostic & b) {
    return a.primary_range().get_begin() < b.primary_range().get_begin();
  });
  for (const auto & d : sorted) {
    print(d, source);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string code = diag.code.empty() ? "" : fmt::format("[{}]", diag.code);
  if (use_color_) {
    os_ << rang::style::bold << severity_color(diag.severity) << severity_name(diag.severity)
        << code << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}{}: {}\n", severity_name(diag.severity), code, diag.message);
  }
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceManager & source)
{
  const FullSourceRange fr = source.get_full_range(label.range);
  if (!fr.is_valid()) {
    if (!label.message.empty()) {
      print_trailer("note", label.message);
    }
    return;
  }

  const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                             ? fr.end_column
                             : (fr.start_column + 1);
  print_source_line(
    source.get_line(fr.start_line - 1), fr.start_line, fr.start_column, end_col, label.style,
    label.message);
}

void DiagnosticPrinter::print_source_line(
  std::string_view line, uint32_t line_num, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", clean_line(line));

  std::string marker_prefix;
  for (size_t i = 0; i + 1 < start_col && i < line.size(); ++i) {
    marker_prefix += line[i] == '\t' ? "    " : " ";
  }
  const std::string markers(
    std::max<uint32_t>(end_col - start_col, 1), style == LabelStyle::Primary ? '^' : '-');

  fmt::print(os_, "      | {}", marker_prefix);
  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{}", markers);
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_fixit(const FixIt & fixit, const SourceManager & source)
{
  const FullSourceRange fr = source.get_full_range(fixit.range);
  fmt::print(os_, "{}\n", gutter_pipe());
  if (!fr.is_valid()) {
    fmt::print(os_, "   = fix: insert \"{}\"\n", fixit.replacement_text);
    return;
  }

  fmt::print(os_, "help: insert '{}' at {}:{}\n", fixit.replacement_text, fr.start_line,
    fr.start_column);
  const std::string line = clean_line(source.get_line(fr.start_line - 1));
  const size_t at = std::min<size_t>(fr.start_column - 1, line.size());
  fmt::print(os_, " {:>4} | {}{}{}\n", fr.start_line, line.substr(0, at), fixit.replacement_text,
    line.substr(at));
  fmt::print(os_, "      | {}", std::string(at, ' '));
  if (use_color_) {
    os_ << rang::fg::green << rang::style::bold;
  }
  fmt::print(os_, "{}", std::string(std::max<size_t>(fixit.replacement_text.size(), 1), '+'));
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "{}: {}\n", kind, message);
  } else {
    fmt::print(os_, "   = {}: {}\n", kind, message);
  }
}

std::string DiagnosticPrinter::gutter_arrow() const
{
  return use_color_ ? "\033[1;36m  -->\033[0m" : "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  return use_color_ ? "\033[1;36m      |\033[0m" : "      |";
}

}  // namespace pddl
