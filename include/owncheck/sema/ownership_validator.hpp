// owncheck/sema/ownership_validator.hpp - @owns(...) validation
//
// Checks every annotated reference type's stored members against its effective
// owns-list (reachability in the ownership graph), and checks that every
// ownership cycle is declared by all of its members.
//
// The validator is a pure function of its input: it keeps no state between
// calls and independent calls may run concurrently.
//
#pragma once

#include <cstddef>
#include <vector>

#include <gsl/span>

#include "owncheck/basic/diagnostic.hpp"
#include "owncheck/model/type_decl.hpp"
#include "owncheck/sema/value_chain.hpp"

namespace owncheck
{

struct ValidatorOptions
{
  /// Nested value types followed before giving up with ValueChainTooDeep.
  size_t max_value_chain_depth = k_default_max_value_chain_depth;
};

class OwnershipValidator
{
public:
  explicit OwnershipValidator(ValidatorOptions options = {}) : options_(options) {}

  /**
   * Validate a declaration set.
   *
   * Never stops at the first problem: every irregularity in the input becomes
   * a Diagnostic. The result is sorted by subject type name, then kind.
   *
   * @throws InternalError on a broken internal invariant
   */
  [[nodiscard]] std::vector<Diagnostic> validate(gsl::span<const TypeDeclaration> declarations) const;

  /**
   * Validate into an existing bag (appended, sorted as a block).
   *
   * @return true if no errors were found
   */
  bool validate(gsl::span<const TypeDeclaration> declarations, DiagnosticBag & diags) const;

  [[nodiscard]] const ValidatorOptions & options() const noexcept { return options_; }

private:
  ValidatorOptions options_;
};

/**
 * Validate with default options.
 */
[[nodiscard]] std::vector<Diagnostic> validate(const std::vector<TypeDeclaration> & declarations);

}  // namespace owncheck
