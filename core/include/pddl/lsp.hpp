// pddl/lsp.hpp - LSP-like language service APIs (serverless)
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "pddl/lsp/completion_types.hpp"

namespace pddl::lsp
{

/**
 * Serverless language service for PDDL domain and problem files.
 *
 * Provides completion and structural diagnostics over the documents the host
 * has loaded, without implementing an LSP server itself. A problem document
 * draws its symbol suggestions from the loaded domain document whose name
 * matches its `(:domain ...)` reference.
 *
 * All positions are expressed in UTF-8 byte offsets; the host is responsible
 * for converting them to editor positions.
 */
class Workspace
{
public:
  Workspace();
  ~Workspace();

  Workspace(const Workspace &) = delete;
  Workspace & operator=(const Workspace &) = delete;

  Workspace(Workspace && other) noexcept;
  Workspace & operator=(Workspace && other) noexcept;

  void set_document(std::string uri, std::string text);
  void remove_document(std::string_view uri);
  [[nodiscard]] bool has_document(std::string_view uri) const;

  /// Applies to every later completion request
  void set_options(CompletionOptions options);
  [[nodiscard]] const CompletionOptions & options() const noexcept;

  // Diagnostics (bracket balance + section order)
  std::string diagnostics_json(std::string_view uri) const;

  // Completion
  //
  // An empty trigger is an Invoke request; otherwise its first character is
  // reported as the trigger character.
  std::string completion_json(
    std::string_view uri, uint32_t byte_offset, std::string_view trigger = {},
    const CancellationToken * cancel = nullptr) const;
  std::string completion_json(
    std::string_view uri, const CompletionRequest & request,
    const CancellationToken * cancel = nullptr) const;

  // Indented syntax tree dump (debugging aid)
  std::string tree_dump(std::string_view uri) const;

private:
  struct Impl;
  Impl * impl_;
};

}  // namespace pddl::lsp
