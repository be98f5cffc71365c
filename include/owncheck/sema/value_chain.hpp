// owncheck/sema/value_chain.hpp - Walk what a value type may carry
//
// Value types are not ownership-graph nodes. Whatever reference types their
// owns-lists name (directly or through nested value types) are what a storing
// reference type must own instead.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#include "owncheck/model/type_decl.hpp"
#include "owncheck/sema/decl_table.hpp"

namespace owncheck
{

inline constexpr size_t k_default_max_value_chain_depth = 32;

struct ValueChainStep
{
  enum class Kind : uint8_t {
    /// A reference type the chain may carry.
    Reference,
    /// An unannotated value type: may carry anything, contents unchecked.
    UnannotatedValue,
    /// The chain continues past the depth limit at this value type.
    DepthExceeded,
  };

  Kind kind = Kind::Reference;
  const TypeDeclaration * decl = nullptr;
  /// 1 for the value type the walk starts at.
  size_t depth = 0;
};

/**
 * Visit every step reachable through the owns-list of `value`.
 *
 * Each nested value type is entered at most once, so cyclic value chains
 * terminate. Unknown owns-list entries are skipped (they are reported while
 * building the ownership graph). A reference type reached along several paths
 * is visited once per path.
 */
void walk_value_chain(
  const DeclTable & table, const TypeDeclaration & value, size_t max_depth,
  const std::function<void(const ValueChainStep &)> & visit);

}  // namespace owncheck
