// owncheck/model/type_decl.cpp - Type declaration helpers
#include "owncheck/model/type_decl.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace owncheck
{

std::string_view to_string(TypeKind kind) noexcept
{
  switch (kind) {
    case TypeKind::Reference:
      return "reference";
    case TypeKind::Value:
      return "value";
  }
  return "reference";
}

std::optional<TypeKind> parse_type_kind(std::string_view text) noexcept
{
  if (text == "reference" || text == "class") {
    return TypeKind::Reference;
  }
  if (text == "value" || text == "struct") {
    return TypeKind::Value;
  }
  return std::nullopt;
}

bool TypeDeclaration::lists(std::string_view type_name) const noexcept
{
  return std::find(owns_list.begin(), owns_list.end(), type_name) != owns_list.end();
}

std::string describe(const TypeDeclaration & decl)
{
  const char * keyword = decl.is_reference() ? "class" : "struct";
  if (!decl.is_annotated) {
    return fmt::format("{} {}", keyword, decl.name);
  }

  std::string owned;
  for (size_t i = 0; i < decl.owns_list.size(); ++i) {
    if (i > 0) owned += ", ";
    owned += decl.owns_list[i];
  }
  return fmt::format("@owns({}) {} {}", owned, keyword, decl.name);
}

}  // namespace owncheck
