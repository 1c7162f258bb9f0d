#pragma once
#include <pakdb/index.hpp>
#include <pakdb/pointer.hpp>
#include <pakdb/query.hpp>

#include <memory>
#include <string_view>

namespace pakdb {

// Where the evaluator finds indices by key name.
class IndexSource {
public:
  virtual ~IndexSource() = default;
  // nullptr when the key was never indexed
  virtual std::shared_ptr<const Index> find_index(std::string_view key) const = 0;
};

// Sorted-merge set algebra over PointerSets.
PointerSet intersect(const PointerSet& a, const PointerSet& b);
PointerSet unite(const PointerSet& a, const PointerSet& b);

// Evaluates the tree bottom-up. A predicate on an unknown key matches
// nothing; kind mismatches throw TypeMismatchError.
PointerSet evaluate(const Query& q, const IndexSource& src);

} // namespace pakdb
