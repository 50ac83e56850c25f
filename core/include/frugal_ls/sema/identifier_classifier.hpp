// frugal_ls/sema/identifier_classifier.hpp - Declaration vs reference classification
//
// Classification is purely structural: it looks at the identifier's parent
// (and, for fields, grandparent) node kinds. No name binding is involved.
//
#pragma once

#include <cstdint>
#include <optional>

#include "frugal_ls/sema/symbol.hpp"
#include "frugal_ls/syntax/ts_ll.hpp"

namespace frugal_ls
{

enum class IdentifierRole : uint8_t {
  Declaration,    ///< names the entity being defined
  TypeReference,  ///< used as a type name
  Reference,      ///< any other use (const values, defaults, ...)
  Unknown,        ///< not an identifier, or detached from a parent
};

struct IdentifierInfo
{
  IdentifierRole role = IdentifierRole::Unknown;
  /// Kind of the declared entity (Declaration only)
  std::optional<SymbolKind> declared_kind;

  [[nodiscard]] bool is_declaration() const noexcept
  {
    return role == IdentifierRole::Declaration;
  }
};

[[nodiscard]] IdentifierInfo classify_identifier(ts_ll::Node identifier);

}  // namespace frugal_ls
