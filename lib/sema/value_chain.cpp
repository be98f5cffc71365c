// owncheck/sema/value_chain.cpp - Value type chain traversal
#include "owncheck/sema/value_chain.hpp"

#include <unordered_set>

namespace owncheck
{

void walk_value_chain(
  const DeclTable & table, const TypeDeclaration & value, size_t max_depth,
  const std::function<void(const ValueChainStep &)> & visit)
{
  std::unordered_set<const TypeDeclaration *> entered;

  std::function<void(const TypeDeclaration *, size_t)> walk;
  walk = [&](const TypeDeclaration * v, size_t depth) {
    if (!v->is_annotated) {
      visit(ValueChainStep{ValueChainStep::Kind::UnannotatedValue, v, depth});
      return;
    }
    if (depth > max_depth) {
      visit(ValueChainStep{ValueChainStep::Kind::DepthExceeded, v, depth});
      return;
    }

    for (const auto & entry : v->owns_list) {
      const TypeDeclaration * owned = table.find(entry);
      if (!owned) {
        continue;
      }
      if (owned->is_reference()) {
        visit(ValueChainStep{ValueChainStep::Kind::Reference, owned, depth});
        continue;
      }
      if (entered.insert(owned).second) {
        walk(owned, depth + 1);
      }
    }
  };

  entered.insert(&value);
  walk(&value, 1);
}

}  // namespace owncheck
