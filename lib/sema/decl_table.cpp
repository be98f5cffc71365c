// owncheck/sema/decl_table.cpp - Declaration lookup table
#include "owncheck/sema/decl_table.hpp"

#include <fmt/core.h>

#include <string>

namespace owncheck
{

bool DeclTable::build(gsl::span<const TypeDeclaration> decls)
{
  decls_.clear();
  index_.clear();
  decls_.reserve(decls.size());
  index_.reserve(decls.size());

  bool ok = true;
  for (const auto & decl : decls) {
    const auto [it, inserted] = index_.emplace(std::string_view(decl.name), decls_.size());
    if (!inserted) {
      ok = false;
      if (diags_) {
        const TypeDeclaration * first = decls_[it->second];
        diags_
          ->report(
            DiagnosticKind::DuplicateDeclaration, decl.name,
            fmt::format("duplicate declaration of '{}'", decl.name))
          .with_help(fmt::format("the first declaration ('{}') is kept", describe(*first)));
      }
      continue;
    }
    decls_.push_back(&decl);
  }
  return ok;
}

const TypeDeclaration * DeclTable::find(std::string_view name) const
{
  const auto it = index_.find(name);
  if (it == index_.end()) {
    return nullptr;
  }
  return decls_[it->second];
}

size_t DeclTable::order_of(std::string_view name) const
{
  const auto it = index_.find(name);
  return it == index_.end() ? npos : it->second;
}

}  // namespace owncheck
