// owncheck/sema/decl_table.hpp - Name lookup over a declaration set
//
// Filters duplicate names (first occurrence wins) and provides by-name lookup
// for the later passes. Holds non-owning pointers into the caller's input.
//
#pragma once

#include <cstddef>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <gsl/span>

#include "owncheck/basic/diagnostic.hpp"
#include "owncheck/model/type_decl.hpp"

namespace owncheck
{

class DeclTable
{
public:
  explicit DeclTable(DiagnosticBag * diags = nullptr) : diags_(diags) {}

  /**
   * Register every declaration of `decls` in order.
   *
   * A name seen before yields DuplicateDeclaration and the later copy is dropped.
   *
   * @return true if no duplicates were found
   */
  bool build(gsl::span<const TypeDeclaration> decls);

  [[nodiscard]] const TypeDeclaration * find(std::string_view name) const;

  /// Retained declarations in input order.
  [[nodiscard]] const std::vector<const TypeDeclaration *> & all() const noexcept
  {
    return decls_;
  }

  /// Position of a retained declaration in input order, or npos.
  [[nodiscard]] size_t order_of(std::string_view name) const;

  [[nodiscard]] size_t size() const noexcept { return decls_.size(); }

  static constexpr size_t npos = static_cast<size_t>(-1);

private:
  DiagnosticBag * diags_ = nullptr;
  std::vector<const TypeDeclaration *> decls_;
  std::unordered_map<std::string_view, size_t> index_;
};

}  // namespace owncheck
