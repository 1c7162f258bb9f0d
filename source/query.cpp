#include <pakdb/query.hpp>

#include <fmt/format.h>

#include <optional>
#include <stdexcept>

namespace pakdb {

struct Query::Node {
  Kind kind = Kind::Predicate;

  std::string key;
  Op op = Op::Equal;
  std::optional<Value> value;

  std::shared_ptr<const Node> left;
  std::shared_ptr<const Node> right;
};

Query Query::predicate(std::string key, Op op, Value value) {
  auto n = std::make_shared<Node>();
  n->kind = Kind::Predicate;
  n->key = std::move(key);
  n->op = op;
  n->value.emplace(std::move(value));
  return Query(std::move(n));
}

Query Query::all_of(Query left, Query right) {
  auto n = std::make_shared<Node>();
  n->kind = Kind::And;
  n->left = std::move(left.node_);
  n->right = std::move(right.node_);
  return Query(std::move(n));
}

Query Query::any_of(Query left, Query right) {
  auto n = std::make_shared<Node>();
  n->kind = Kind::Or;
  n->left = std::move(left.node_);
  n->right = std::move(right.node_);
  return Query(std::move(n));
}

Query::Kind Query::kind() const { return node_->kind; }

const std::string& Query::key() const {
  if (node_->kind != Kind::Predicate) throw std::logic_error("Query::key on a combinator");
  return node_->key;
}

Op Query::op() const {
  if (node_->kind != Kind::Predicate) throw std::logic_error("Query::op on a combinator");
  return node_->op;
}

const Value& Query::value() const {
  if (node_->kind != Kind::Predicate) throw std::logic_error("Query::value on a combinator");
  return *node_->value;
}

Query Query::left() const {
  if (node_->kind == Kind::Predicate) throw std::logic_error("Query::left on a predicate");
  return Query(node_->left);
}

Query Query::right() const {
  if (node_->kind == Kind::Predicate) throw std::logic_error("Query::right on a predicate");
  return Query(node_->right);
}

std::string Query::to_string() const {
  switch (node_->kind) {
  case Kind::Predicate:
    return fmt::format("{} {} {}", node_->key, op_symbol(node_->op), node_->value->to_string());
  case Kind::And:
    return fmt::format("({} & {})", left().to_string(), right().to_string());
  case Kind::Or:
    return fmt::format("({} | {})", left().to_string(), right().to_string());
  }
  return {};
}

Query equals(std::string key, Value value) {
  return Query::predicate(std::move(key), Op::Equal, std::move(value));
}

Query less_than(std::string key, Value value) {
  return Query::predicate(std::move(key), Op::LessThan, std::move(value));
}

Query less_than_or_equal(std::string key, Value value) {
  return Query::predicate(std::move(key), Op::LessOrEqual, std::move(value));
}

Query greater_than(std::string key, Value value) {
  return Query::predicate(std::move(key), Op::GreaterThan, std::move(value));
}

Query greater_than_or_equal(std::string key, Value value) {
  return Query::predicate(std::move(key), Op::GreaterOrEqual, std::move(value));
}

} // namespace pakdb
