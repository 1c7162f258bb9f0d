#pragma once
#include <pakdb/index.hpp>
#include <pakdb/value.hpp>

#include <memory>
#include <string>
#include <utility>

namespace pakdb {

// Immutable boolean predicate tree. Copies share nodes.
class Query {
public:
  enum class Kind : uint8_t { Predicate, And, Or };

  static Query predicate(std::string key, Op op, Value value);
  static Query all_of(Query left, Query right);
  static Query any_of(Query left, Query right);

  Kind kind() const;

  // Predicate accessors; throw std::logic_error on And/Or nodes.
  const std::string& key() const;
  Op op() const;
  const Value& value() const;

  // And/Or accessors; throw std::logic_error on predicates.
  Query left() const;
  Query right() const;

  // Fully parenthesized infix form, e.g. (name == "John" | age < 28)
  std::string to_string() const;

private:
  struct Node;
  explicit Query(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

  std::shared_ptr<const Node> node_;
};

Query equals(std::string key, Value value);
Query less_than(std::string key, Value value);
Query less_than_or_equal(std::string key, Value value);
Query greater_than(std::string key, Value value);
Query greater_than_or_equal(std::string key, Value value);

inline Query all_of(Query left, Query right) { return Query::all_of(std::move(left), std::move(right)); }
inline Query any_of(Query left, Query right) { return Query::any_of(std::move(left), std::move(right)); }

inline Query operator&(Query left, Query right) { return all_of(std::move(left), std::move(right)); }
inline Query operator|(Query left, Query right) { return any_of(std::move(left), std::move(right)); }

} // namespace pakdb
