// pddl/lsp/symbol_completion.cpp - Operator, variable and type name completion
#include <fmt/format.h>

#include <array>
#include <utility>

#include "pddl/lsp/completion_providers.hpp"

namespace pddl::lsp
{
namespace
{

bool ends_with(std::string_view text, std::string_view suffix)
{
  return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

inline constexpr std::array<std::string_view, 17> k_operators = {
  "and", "not", "at start", "at end", "over all", "=",      ">",      "<",  ">=",
  "<=",  "+",   "-",        "/",      "*",        "forall", "exists", ":",
};

CompletionItem symbol_item(
  const model::Declaration & symbol, std::string_view title, CompletionItemKind kind)
{
  CompletionItem item;
  item.label = symbol.declared_name;
  item.kind = kind;
  item.detail = std::string(title);
  item.documentation = code_block(fmt::format("({})", symbol.declared_name)) + "---\n" +
                       symbol.documentation;
  item.insert_text = symbol.declared_name_without_types;
  item.insert_text_format = InsertTextFormat::PlainText;
  item.filter_text = symbol.declared_name;
  return item;
}

}  // namespace

SymbolCompletionProvider::SymbolCompletionProvider(std::shared_ptr<const SuggestionTable> table)
: table_(std::move(table))
{
}

std::vector<CompletionItem> SymbolCompletionProvider::provide(
  const CompletionContext & ctx, const model::DomainInfo * domain) const
{
  const std::string_view leading = ctx.source.get_line_prefix(ctx.request.offset);
  if (leading.find(';') != std::string_view::npos) {
    return {};
  }

  std::vector<CompletionItem> items;
  if (!leading.empty() && leading.back() == '(') {
    items = operator_items();
    if (domain != nullptr) {
      auto variables = variable_items(*domain);
      items.insert(items.end(), variables.begin(), variables.end());
    }
  } else if (ends_with(leading, " -")) {
    if (domain != nullptr) {
      items = type_items(*domain);
    }
  }

  for (size_t i = 0; i < items.size(); ++i) {
    items[i].sort_text = fmt::format("item{:03}", i);
  }
  return items;
}

std::vector<CompletionItem> SymbolCompletionProvider::operator_items() const
{
  std::vector<CompletionItem> items;
  items.reserve(k_operators.size());
  for (const auto op : k_operators) {
    CompletionItem item;
    item.label = std::string(op);
    item.insert_text = item.label;
    item.insert_text_format = InsertTextFormat::PlainText;
    item.filter_text = item.label;
    item.kind = CompletionItemKind::Function;
    if (const auto * details = table_->find(SuggestionGroup::Operator, op)) {
      item.kind = details->kind.value_or(CompletionItemKind::Function);
      item.detail = details->detail;
      item.documentation = details->documentation;
    }
    items.push_back(std::move(item));
  }
  return items;
}

std::vector<CompletionItem> SymbolCompletionProvider::variable_items(const model::DomainInfo & domain)
{
  std::vector<CompletionItem> items;
  for (const auto & p : domain.predicates) {
    items.push_back(symbol_item(p, "Predicate", CompletionItemKind::Value));
  }
  for (const auto & f : domain.functions) {
    items.push_back(symbol_item(f, "Function", CompletionItemKind::Unit));
  }
  for (const auto & d : domain.derived) {
    items.push_back(symbol_item(d, "Derived predicate/function", CompletionItemKind::Interface));
  }
  return items;
}

std::vector<CompletionItem> SymbolCompletionProvider::type_items(const model::DomainInfo & domain)
{
  std::vector<CompletionItem> items;
  items.reserve(domain.types.size());
  for (const auto & type : domain.types) {
    CompletionItem item;
    item.label = type;
    item.kind = CompletionItemKind::Class;
    item.detail = "Type";
    // leading space keeps `?x - type` formatted
    item.insert_text = " " + type;
    item.insert_text_format = InsertTextFormat::PlainText;
    item.filter_text = type;
    items.push_back(std::move(item));
  }
  return items;
}

}  // namespace pddl::lsp
