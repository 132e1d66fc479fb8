// pddl/lsp/completion_types.cpp - Completion item kind names
#include "pddl/lsp/completion_types.hpp"

namespace pddl::lsp
{

std::string_view to_string(CompletionItemKind kind) noexcept
{
  switch (kind) {
    case CompletionItemKind::Text:
      return "Text";
    case CompletionItemKind::Method:
      return "Method";
    case CompletionItemKind::Function:
      return "Function";
    case CompletionItemKind::Class:
      return "Class";
    case CompletionItemKind::Interface:
      return "Interface";
    case CompletionItemKind::Module:
      return "Module";
    case CompletionItemKind::Property:
      return "Property";
    case CompletionItemKind::Unit:
      return "Unit";
    case CompletionItemKind::Value:
      return "Value";
    case CompletionItemKind::Keyword:
      return "Keyword";
    case CompletionItemKind::Snippet:
      return "Snippet";
    case CompletionItemKind::Struct:
      return "Struct";
    case CompletionItemKind::Event:
      return "Event";
    case CompletionItemKind::Operator:
      return "Operator";
    case CompletionItemKind::TypeParameter:
      return "TypeParameter";
  }
  return "Text";
}

}  // namespace pddl::lsp
