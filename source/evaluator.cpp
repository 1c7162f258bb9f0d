#include <pakdb/evaluator.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>

namespace pakdb {

PointerSet intersect(const PointerSet& a, const PointerSet& b) {
  PointerSet out;
  out.reserve(std::min(a.size(), b.size()));
  size_t i = 0, j = 0;
  while (i < a.size() && j < b.size()) {
    if (a[i] < b[j]) {
      ++i;
    } else if (b[j] < a[i]) {
      ++j;
    } else {
      out.push_back(a[i]);
      ++i;
      ++j;
    }
  }
  return out;
}

PointerSet unite(const PointerSet& a, const PointerSet& b) {
  PointerSet out;
  out.reserve(a.size() + b.size());
  size_t i = 0, j = 0;
  while (i < a.size() && j < b.size()) {
    if (a[i] < b[j]) {
      out.push_back(a[i++]);
    } else if (b[j] < a[i]) {
      out.push_back(b[j++]);
    } else {
      out.push_back(a[i]);
      ++i;
      ++j;
    }
  }
  out.insert(out.end(), a.begin() + static_cast<std::ptrdiff_t>(i), a.end());
  out.insert(out.end(), b.begin() + static_cast<std::ptrdiff_t>(j), b.end());
  return out;
}

PointerSet evaluate(const Query& q, const IndexSource& src) {
  switch (q.kind()) {
  case Query::Kind::Predicate: {
    auto index = src.find_index(q.key());
    if (!index) {
      spdlog::debug("predicate on unindexed key '{}' matches nothing", q.key());
      return {};
    }
    return index->lookup(q.op(), q.value());
  }
  case Query::Kind::And: {
    // both sides run so that a type error on either side is reported
    PointerSet l = evaluate(q.left(), src);
    PointerSet r = evaluate(q.right(), src);
    return intersect(l, r);
  }
  case Query::Kind::Or: {
    PointerSet l = evaluate(q.left(), src);
    PointerSet r = evaluate(q.right(), src);
    return unite(l, r);
  }
  }
  return {};
}

} // namespace pakdb
