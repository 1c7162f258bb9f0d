#include <pakdb/cli.hpp>

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace pakdb {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

template <typename T>
static std::optional<T> parse_int(std::string_view s) {
  T v{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

static std::optional<double> parse_double(std::string_view s) {
  if (s.empty()) return std::nullopt;
  const std::string tmp(s);
  char *end = nullptr;
  errno = 0;
  const double d = std::strtod(tmp.c_str(), &end);
  if (errno == ERANGE || end != tmp.c_str() + tmp.size()) return std::nullopt;
  return d;
}

// [-]digits[.digits][(e|E)[+|-]digits], at least one mantissa digit
static bool is_decimal_literal(std::string_view s) {
  size_t i = 0;
  auto digits = [&]() {
    const size_t start = i;
    while (i < s.size() && s[i] >= '0' && s[i] <= '9') ++i;
    return i - start;
  };
  if (i < s.size() && s[i] == '-') ++i;
  size_t mantissa = digits();
  if (i < s.size() && s[i] == '.') {
    ++i;
    mantissa += digits();
  }
  if (mantissa == 0) return false;
  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    if (digits() == 0) return false;
  }
  return i == s.size();
}

static std::optional<bool> parse_bool(std::string_view s) {
  if (s == "true") return true;
  if (s == "false") return false;
  return std::nullopt;
}

static std::optional<Value> parse_integer(std::string_view s) {
  if (auto i = parse_int<int64_t>(s)) return Value(*i);
  if (auto u = parse_int<uint64_t>(s)) return Value(*u);
  return std::nullopt;
}

Value parse_value(std::string_view s) {
  if (s.size() >= 2 && s[1] == ':') {
    const std::string_view body = s.substr(2);
    switch (s[0]) {
    case 's':
      return Value(body);
    case 'i':
      if (auto v = parse_integer(body)) return *v;
      throw std::invalid_argument("not an integer: " + std::string(body));
    case 'f':
      if (auto d = parse_double(body)) return Value(*d);
      throw std::invalid_argument("not a float: " + std::string(body));
    case 'b':
      if (auto b = parse_bool(body)) return Value(*b);
      throw std::invalid_argument("not a bool: " + std::string(body));
    default:
      break;
    }
  }
  if (auto v = parse_integer(s)) return *v;
  if (is_decimal_literal(s)) {
    if (auto d = parse_double(s)) return Value(*d);
  }
  if (auto b = parse_bool(s)) return Value(*b);
  return Value(s);
}

std::optional<Op> parse_op(std::string_view s) {
  if (s == "==" || s == "=" || s == "eq") return Op::Equal;
  if (s == "<" || s == "lt") return Op::LessThan;
  if (s == "<=" || s == "le") return Op::LessOrEqual;
  if (s == ">" || s == "gt") return Op::GreaterThan;
  if (s == ">=" || s == "ge") return Op::GreaterOrEqual;
  return std::nullopt;
}

// KEY OP VALUE [and|or KEY OP VALUE]...
static std::optional<Query> parse_query_terms(int i, int argc, char **argv, std::string &error) {
  std::optional<Query> q;
  std::string_view joiner;
  while (i < argc) {
    if (i + 2 >= argc) {
      error = "query: expected KEY OP VALUE";
      return std::nullopt;
    }
    auto op = parse_op(argv[i + 1]);
    if (!op) {
      error = std::string("query: unknown operator ") + argv[i + 1];
      return std::nullopt;
    }
    Value v = [&]() -> Value {
      try {
        return parse_value(argv[i + 2]);
      } catch (const std::invalid_argument &e) {
        error = std::string("query: ") + e.what();
        return Value(false);
      }
    }();
    if (!error.empty()) return std::nullopt;

    Query term = Query::predicate(argv[i], *op, std::move(v));
    if (!q)
      q = std::move(term);
    else if (joiner == "and")
      q = all_of(std::move(*q), std::move(term));
    else
      q = any_of(std::move(*q), std::move(term));
    i += 3;

    if (i < argc) {
      joiner = argv[i];
      if (joiner != "and" && joiner != "or") {
        error = std::string("query: expected 'and' or 'or', got ") + argv[i];
        return std::nullopt;
      }
      ++i;
      if (i >= argc) {
        error = "query: dangling combinator";
        return std::nullopt;
      }
    }
  }
  if (!q) error = "query: expected KEY OP VALUE";
  return q;
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  int i = 1;
  for (; i < argc; ++i) {
    std::string_view a = argv[i];
    if (a == "--log-level") {
      if (!has_arg(i, argc)) {
        r.error = "--log-level: value required";
        return r;
      }
      r.log_level = argv[++i];
      continue;
    }
    if (a == "-h" || a == "--help") {
      r.cmd = CmdHelp{};
      return r;
    }
    if (a == "--version") {
      r.cmd = CmdVersion{};
      return r;
    }
    break;
  }

  if (i >= argc) {
    r.cmd = CmdHelp{};
    return r;
  }

  const std::string cmd = argv[i];
  const int rest = argc - i - 1;

  if (cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }

  if (cmd == "info" || cmd == "keys" || cmd == "verify") {
    if (rest != 1) {
      r.error = cmd + ": FILE required";
      return r;
    }
    if (cmd == "info")
      r.cmd = CmdInfo{argv[i + 1]};
    else if (cmd == "keys")
      r.cmd = CmdKeys{argv[i + 1]};
    else
      r.cmd = CmdVerify{argv[i + 1]};
    return r;
  }

  if (cmd == "dump") {
    if (rest != 2) {
      r.error = "dump: FILE KEY required";
      return r;
    }
    r.cmd = CmdDump{argv[i + 1], argv[i + 2]};
    return r;
  }

  if (cmd == "query") {
    if (rest < 4) {
      r.error = "query: FILE KEY OP VALUE required";
      return r;
    }
    std::string err;
    auto q = parse_query_terms(i + 2, argc, argv, err);
    if (!q) {
      r.error = err;
      return r;
    }
    r.cmd = CmdQuery{argv[i + 1], std::move(*q)};
    return r;
  }

  r.error = "unknown command: " + cmd;
  return r;
}

} // namespace pakdb
