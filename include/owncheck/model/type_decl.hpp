// owncheck/model/type_decl.hpp - Type declarations consumed by the validator
//
// Declarations are extracted from real source by a surrounding tool and handed
// over wholesale; the validator never mutates them.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace owncheck
{

/**
 * Declared kind of a type.
 *
 * Reference types are identity-based and take part in retain-cycle analysis.
 * Value types are copied and act as transparent conduits for whatever
 * references they may carry.
 */
enum class TypeKind : uint8_t {
  Reference,
  Value,
};

[[nodiscard]] std::string_view to_string(TypeKind kind) noexcept;

/// Parse "reference" / "value" (also "class" / "struct").
[[nodiscard]] std::optional<TypeKind> parse_type_kind(std::string_view text) noexcept;

/**
 * A field (or stored parameter) a declaration directly contains.
 */
struct StoredMember
{
  std::string name;
  std::string type;

  /// Set when the member is only reached through intermediate value types.
  bool via_value_type_chain = false;
};

struct TypeDeclaration
{
  std::string name;
  TypeKind kind = TypeKind::Reference;

  /// Whether an explicit @owns(...) list was supplied.
  bool is_annotated = false;

  /// Types this declaration may hold strong references to (set semantics).
  std::vector<std::string> owns_list;

  std::vector<StoredMember> stored_members;

  [[nodiscard]] bool is_reference() const noexcept { return kind == TypeKind::Reference; }
  [[nodiscard]] bool is_value() const noexcept { return kind == TypeKind::Value; }

  /// True if `type_name` appears in the owns-list.
  [[nodiscard]] bool lists(std::string_view type_name) const noexcept;
};

/**
 * Render a declaration in attribute syntax, e.g. "@owns(B, C) class A".
 */
[[nodiscard]] std::string describe(const TypeDeclaration & decl);

}  // namespace owncheck
