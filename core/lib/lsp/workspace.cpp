#include <algorithm>
#include <cctype>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>

#include "pddl/basic/diagnostic.hpp"
#include "pddl/basic/source_manager.hpp"
#include "pddl/lsp.hpp"
#include "pddl/lsp/completion_engine.hpp"
#include "pddl/model/domain_info.hpp"
#include "pddl/model/file_scope.hpp"
#include "pddl/syntax/sections.hpp"
#include "pddl/syntax/structure_checker.hpp"
#include "pddl/syntax/syntax_tree.hpp"

namespace pddl::lsp
{
namespace
{

using json = nlohmann::json;

// -----------------------------
// Range helpers
// -----------------------------

uint32_t clamp_byte_offset(uint32_t off, size_t text_size)
{
  if (off > text_size) {
    return static_cast<uint32_t>(text_size);
  }
  return off;
}

json range_to_json(const FullSourceRange & r)
{
  return json{
    {"startByte", r.start_byte},     {"endByte", r.end_byte}, {"startLine", r.start_line},
    {"startColumn", r.start_column}, {"endLine", r.end_line}, {"endColumn", r.end_column},
  };
}

json byte_range_to_json(const SourceRange & r)
{
  return json{{"startByte", r.get_begin().get_offset()}, {"endByte", r.get_end().get_offset()}};
}

std::string severity_to_string(Severity s)
{
  switch (s) {
    case Severity::Error:
      return "Error";
    case Severity::Warning:
      return "Warning";
    case Severity::Info:
      return "Info";
    case Severity::Hint:
      return "Hint";
  }
  return "Error";
}

std::string insert_format_to_string(InsertTextFormat f)
{
  return f == InsertTextFormat::Snippet ? "Snippet" : "PlainText";
}

bool iequals(std::string_view a, std::string_view b)
{
  return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
    return std::tolower(static_cast<unsigned char>(x)) ==
           std::tolower(static_cast<unsigned char>(y));
  });
}

json item_to_json(const CompletionItem & item)
{
  json j;
  j["label"] = item.label;
  j["kind"] = to_string(item.kind);
  if (!item.detail.empty()) {
    j["detail"] = item.detail;
  }
  if (!item.documentation.empty()) {
    j["documentation"] = item.documentation;
  }
  j["insertText"] = item.insert_text;
  j["insertTextFormat"] = insert_format_to_string(item.insert_text_format);
  if (!item.filter_text.empty()) {
    j["filterText"] = item.filter_text;
  }
  j["sortText"] = item.sort_text;
  if (item.replace_range) {
    j["replaceRange"] = byte_range_to_json(*item.replace_range);
  }
  return j;
}

}  // namespace

// =============================================================================
// Workspace::Impl
// =============================================================================

struct Workspace::Impl
{
  struct Document
  {
    std::string uri;
    SourceManager source;
    syntax::SyntaxTree tree;
    model::FileScope scope = model::UnknownScope{};
    model::DomainInfo domain;
  };

  std::unordered_map<std::string, Document> docs;
  CompletionEngine engine;

  const Document * get_doc(std::string_view uri) const
  {
    auto it = docs.find(std::string(uri));
    if (it == docs.end()) {
      return nullptr;
    }
    return &it->second;
  }

  void analyze(Document & d)
  {
    d.tree = syntax::SyntaxTreeBuilder::build(d.source.get_source());
    d.scope = model::classify_file(d.tree);
    d.domain = model::is_domain(d.scope) ? model::extract_domain_info(d.tree) : model::DomainInfo{};
  }

  /// Declarations visible from `d`: its own for a domain, the referenced domain's for a problem.
  const model::DomainInfo * domain_for(const Document & d) const
  {
    if (model::is_domain(d.scope)) {
      return &d.domain;
    }
    const auto * problem = std::get_if<model::ProblemScope>(&d.scope);
    if (problem == nullptr || problem->domain_name.empty()) {
      return nullptr;
    }
    for (const auto & [uri, other] : docs) {
      const auto * dom = std::get_if<model::DomainScope>(&other.scope);
      if (dom != nullptr && iequals(dom->name, problem->domain_name)) {
        return &other.domain;
      }
    }
    return nullptr;
  }

  const syntax::GrammarTable * grammar_for(const Document & d, syntax::GrammarTable & storage) const
  {
    if (model::is_domain(d.scope)) {
      storage = syntax::domain_grammar(engine.options().job_scheduling);
      return &storage;
    }
    if (model::is_problem(d.scope)) {
      storage = syntax::problem_grammar();
      return &storage;
    }
    return nullptr;
  }

  json diagnostics_json_impl(std::string_view uri) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["items"] = json::array();

    const auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return out;
    }

    DiagnosticBag diags;
    syntax::GrammarTable grammar;
    syntax::StructureChecker checker(&diags);
    (void)checker.check(doc->tree, grammar_for(*doc, grammar));

    for (const auto & d0 : diags.all()) {
      json item;
      item["source"] = "pddl";
      item["message"] = d0.message;
      item["severity"] = severity_to_string(d0.severity);
      if (!d0.code.empty()) {
        item["code"] = d0.code;
      }
      if (d0.help_message) {
        item["help"] = *d0.help_message;
      }
      const auto fr = doc->source.get_full_range(d0.primary_range());
      item["range"] = range_to_json(fr);
      out["items"].push_back(std::move(item));
    }

    return out;
  }

  json completion_json_impl(
    std::string_view uri, CompletionRequest request, const CancellationToken * cancel) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["isIncomplete"] = false;
    out["items"] = json::array();

    const auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return out;
    }

    request.offset = clamp_byte_offset(request.offset, doc->source.size());

    const auto items =
      engine.complete(doc->tree, doc->source, doc->scope, domain_for(*doc), request, cancel);
    for (const auto & item : items) {
      out["items"].push_back(item_to_json(item));
    }
    return out;
  }
};

// =============================================================================
// Workspace public API
// =============================================================================

Workspace::Workspace() : impl_(new Impl()) {}

Workspace::~Workspace() { delete impl_; }

Workspace::Workspace(Workspace && other) noexcept : impl_(other.impl_) { other.impl_ = nullptr; }

Workspace & Workspace::operator=(Workspace && other) noexcept
{
  if (this == &other) {
    return *this;
  }
  delete impl_;
  impl_ = other.impl_;
  other.impl_ = nullptr;
  return *this;
}

void Workspace::set_document(std::string uri, std::string text)
{
  // Replacing an entry re-analyzes it; domains referenced by problems are looked up per request.
  auto & d = impl_->docs[uri];
  d.uri = std::move(uri);
  d.source.set_source(std::move(text));
  impl_->analyze(d);
}

void Workspace::remove_document(std::string_view uri) { impl_->docs.erase(std::string(uri)); }

bool Workspace::has_document(std::string_view uri) const
{
  return impl_->docs.find(std::string(uri)) != impl_->docs.end();
}

void Workspace::set_options(CompletionOptions options)
{
  impl_->engine = CompletionEngine(options);
}

const CompletionOptions & Workspace::options() const noexcept { return impl_->engine.options(); }

std::string Workspace::diagnostics_json(std::string_view uri) const
{
  const json j = impl_->diagnostics_json_impl(uri);
  return j.dump();
}

std::string Workspace::completion_json(
  std::string_view uri, uint32_t byte_offset, std::string_view trigger,
  const CancellationToken * cancel) const
{
  CompletionRequest request;
  request.offset = byte_offset;
  if (!trigger.empty()) {
    request.trigger_kind = TriggerKind::TriggerCharacter;
    request.trigger_character = trigger.front();
  }
  return completion_json(uri, request, cancel);
}

std::string Workspace::completion_json(
  std::string_view uri, const CompletionRequest & request, const CancellationToken * cancel) const
{
  const json j = impl_->completion_json_impl(uri, request, cancel);
  return j.dump();
}

std::string Workspace::tree_dump(std::string_view uri) const
{
  const auto * doc = impl_->get_doc(uri);
  if (doc == nullptr) {
    return {};
  }
  return doc->tree.dump();
}

}  // namespace pddl::lsp
