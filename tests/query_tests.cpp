#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <pakdb/error.hpp>
#include <pakdb/evaluator.hpp>
#include <pakdb/query.hpp>

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace pakdb;

namespace {

// In-memory indices over five people at offsets 0..4:
//   0 John 24, 1 Alice 28, 2 Bob 31, 3 John 28, 4 Eve 40
class FakeSource : public IndexSource {
public:
  FakeSource() {
    const std::vector<std::pair<std::string, int>> people{
        {"John", 24}, {"Alice", 28}, {"Bob", 31}, {"John", 28}, {"Eve", 40}};
    std::vector<IndexEntry> names, ages;
    for (size_t i = 0; i < people.size(); ++i) {
      const Pointer p{i, 1, 7};
      names.push_back({Value(people[i].first).encode(), p});
      ages.push_back({Value(people[i].second).encode(), p});
    }
    add("name", std::move(names));
    add("age", std::move(ages));
  }

  std::shared_ptr<const Index> find_index(std::string_view key) const override {
    ++lookups;
    auto it = indices_.find(std::string(key));
    return it == indices_.end() ? nullptr : it->second;
  }

  mutable int lookups = 0;

private:
  void add(const std::string& key, std::vector<IndexEntry> e) {
    Index::normalize(e);
    indices_[key] = std::make_shared<const Index>(key, std::move(e));
  }

  std::map<std::string, std::shared_ptr<const Index>> indices_;
};

std::vector<uint64_t> offsets(const PointerSet& s) {
  std::vector<uint64_t> out;
  for (const auto& p : s) out.push_back(p.offset);
  return out;
}

} // namespace

TEST_CASE("predicates evaluate against their index") {
  FakeSource src;
  REQUIRE(offsets(evaluate(equals("name", "John"), src)) == std::vector<uint64_t>{0, 3});
  REQUIRE(offsets(evaluate(less_than("age", 28), src)) == std::vector<uint64_t>{0});
  REQUIRE(offsets(evaluate(less_than_or_equal("age", 28), src)) == std::vector<uint64_t>{0, 1, 3});
  REQUIRE(offsets(evaluate(greater_than("age", 28), src)) == std::vector<uint64_t>{2, 4});
  REQUIRE(offsets(evaluate(greater_than_or_equal("age", 31), src)) == std::vector<uint64_t>{2, 4});
}

TEST_CASE("and intersects, or unites") {
  FakeSource src;
  auto q_and = equals("name", "John") & less_than("age", 28);
  REQUIRE(offsets(evaluate(q_and, src)) == std::vector<uint64_t>{0});

  auto q_or = equals("name", "Eve") | less_than("age", 28);
  REQUIRE(offsets(evaluate(q_or, src)) == std::vector<uint64_t>{0, 4});

  auto nested = any_of(all_of(equals("name", "John"), equals("age", 28)), equals("name", "Bob"));
  REQUIRE(offsets(evaluate(nested, src)) == std::vector<uint64_t>{2, 3});
}

TEST_CASE("boolean laws hold over pointer sets") {
  FakeSource src;
  const Query a = greater_than("age", 24);
  const Query b = equals("name", "John");
  const Query c = less_than("age", 40);

  REQUIRE(evaluate(a | b, src) == unite(evaluate(a, src), evaluate(b, src)));
  REQUIRE(evaluate(a & b, src) == intersect(evaluate(a, src), evaluate(b, src)));
  REQUIRE(evaluate(a & b, src) == evaluate(b & a, src));
  REQUIRE(evaluate(a | b, src) == evaluate(b | a, src));
  REQUIRE(evaluate((a & b) & c, src) == evaluate(a & (b & c), src));
  REQUIRE(evaluate((a | b) | c, src) == evaluate(a | (b | c), src));
  REQUIRE(evaluate(a & (b | c), src) == evaluate((a & b) | (a & c), src));
}

TEST_CASE("results are sorted and free of duplicates") {
  FakeSource src;
  auto q = greater_than_or_equal("age", 0) | equals("name", "John") | equals("name", "Alice");
  PointerSet r = evaluate(q, src);
  REQUIRE(offsets(r) == std::vector<uint64_t>{0, 1, 2, 3, 4});
}

TEST_CASE("unknown key matches nothing") {
  FakeSource src;
  REQUIRE(evaluate(equals("email", "x@y"), src).empty());
  REQUIRE(offsets(evaluate(equals("email", "x@y") | equals("name", "Bob"), src)) ==
          std::vector<uint64_t>{2});
  REQUIRE(evaluate(equals("email", "x@y") & equals("name", "Bob"), src).empty());
}

TEST_CASE("kind mismatch is reported even when the other side is empty") {
  FakeSource src;
  REQUIRE_THROWS_AS(evaluate(equals("age", "28"), src), TypeMismatchError);
  REQUIRE_THROWS_AS(evaluate(equals("email", "x") & equals("age", "28"), src), TypeMismatchError);
  REQUIRE_THROWS_AS(evaluate(equals("name", "Nobody") & less_than("name", 3), src),
                    TypeMismatchError);
}

TEST_CASE("both sides of a combinator are evaluated") {
  FakeSource src;
  (void)evaluate(equals("name", "Nobody") & equals("age", 28), src);
  REQUIRE(src.lookups == 2);
}

TEST_CASE("set primitives merge sorted inputs") {
  const PointerSet a{{0, 1, 1}, {2, 1, 1}, {4, 1, 1}};
  const PointerSet b{{1, 1, 1}, {2, 1, 1}, {5, 1, 1}};
  REQUIRE(offsets(intersect(a, b)) == std::vector<uint64_t>{2});
  REQUIRE(offsets(unite(a, b)) == std::vector<uint64_t>{0, 1, 2, 4, 5});
  REQUIRE(intersect(a, {}).empty());
  REQUIRE(unite({}, b) == b);
}

TEST_CASE("query tree accessors and rendering") {
  const Query q = equals("name", "John") | less_than("age", 28);
  REQUIRE(q.kind() == Query::Kind::Or);
  REQUIRE(q.left().key() == "name");
  REQUIRE(q.right().op() == Op::LessThan);
  REQUIRE(q.right().value() == Value(28));
  REQUIRE(q.to_string() == "(name == \"John\" | age < 28)");
  REQUIRE((q & equals("x", true)).to_string() == "((name == \"John\" | age < 28) & x == true)");

  REQUIRE_THROWS_AS(q.key(), std::logic_error);
  REQUIRE_THROWS_AS(equals("a", 1).left(), std::logic_error);
}

TEST_CASE("copies share structure and stay valid") {
  Query q = equals("age", 28);
  Query copy = q;
  q = q | equals("age", 31);
  REQUIRE(copy.kind() == Query::Kind::Predicate);
  REQUIRE(q.left().to_string() == copy.to_string());
}
