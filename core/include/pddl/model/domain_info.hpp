// pddl/model/domain_info.hpp - Declarations collected from a domain file
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "pddl/basic/source_manager.hpp"
#include "pddl/syntax/syntax_tree.hpp"

namespace pddl::model
{

struct Parameter
{
  std::string name;  // including '?'
  std::string type;  // "object" when untyped
};

/**
 * A predicate, function or derived variable, e.g. `(at ?r - robot ?l - location)`.
 */
struct Declaration
{
  std::string name;                         // "at"
  std::string declared_name;                // "at ?r - robot ?l - location"
  std::string declared_name_without_types;  // "at ?r ?l"
  std::vector<Parameter> parameters;
  std::string documentation;  // text of `;` comments attached to the declaration
  SourceRange range;
};

/// A name from a typed list such as `a b - t c`; untyped names are of type "object"
struct TypedName
{
  std::string name;
  std::string type;

  [[nodiscard]] bool operator==(const TypedName & other) const
  {
    return name == other.name && type == other.type;
  }
};

struct DomainInfo
{
  std::string name;
  std::vector<Declaration> predicates;
  std::vector<Declaration> functions;
  std::vector<Declaration> derived;
  std::vector<std::string> types;
  std::vector<TypedName> type_parents;  // every `(:types` entry with its parent type
  std::vector<TypedName> constants;

  /// Types inheriting from `type`, directly or through other types
  [[nodiscard]] std::vector<std::string> subtypes_of(std::string_view type) const;
};

/// Collect the declarations of a domain document. Missing sections stay empty.
[[nodiscard]] DomainInfo extract_domain_info(const syntax::SyntaxTree & tree);

/// Parse a declared variable body such as "at ?r - robot ?l"
[[nodiscard]] Declaration parse_declaration(std::string_view declared_name);

/// Remove every ` - type` annotation: "at ?r - robot ?l - location" -> "at ?r ?l"
[[nodiscard]] std::string strip_types(std::string_view declared_name);

/// Names declared in a typed list such as `a b - t c`, skipping the types
[[nodiscard]] std::vector<std::string> typed_list_names(const syntax::SyntaxNode & list);

/// Names of a typed list with their types: `a b - t c` -> a:t b:t c:object
[[nodiscard]] std::vector<TypedName> typed_list(const syntax::SyntaxNode & list);

}  // namespace pddl::model
