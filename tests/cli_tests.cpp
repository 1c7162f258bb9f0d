#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "test_records.hpp"

#include <pakdb/app.hpp>
#include <pakdb/builder.hpp>
#include <pakdb/cli.hpp>

#include <filesystem>
#include <initializer_list>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace pakdb;
namespace fs = std::filesystem;

static ParseResult parse(std::initializer_list<const char*> args) {
  std::vector<std::string> storage{"pakctl"};
  for (const char* a : args) storage.emplace_back(a);
  std::vector<char*> argv;
  for (auto& s : storage) argv.push_back(s.data());
  argv.push_back(nullptr);
  return parse_cli(static_cast<int>(storage.size()), argv.data());
}

static std::string build_file(const fs::path& dir) {
  const auto path = (dir / "people.pak").string();
  Builder b({.name = "people", .author = "cli", .sync = false});
  b.pak(Person{"John", 30});
  b.pak(Person{"Jane", 25});
  b.pak(Pet{"Rex", 3, "dog"});
  (void)std::move(b).finalize_to_file(path);
  return path;
}

TEST_CASE("parse_value honours type prefixes") {
  REQUIRE(parse_value("s:42").kind() == ValueKind::String);
  REQUIRE(parse_value("s:42").as_string() == std::string("42"));
  REQUIRE(parse_value("i:-7").as_i64() == -7);
  REQUIRE(parse_value("i:18446744073709551615").as_u64() == 18446744073709551615ull);
  REQUIRE(parse_value("f:2").kind() == ValueKind::Number);
  REQUIRE(parse_value("f:inf").as_f64() == std::numeric_limits<double>::infinity());
  REQUIRE(parse_value("b:false").as_bool() == false);

  REQUIRE_THROWS_AS(parse_value("i:abc"), std::invalid_argument);
  REQUIRE_THROWS_AS(parse_value("f:1.5x"), std::invalid_argument);
  REQUIRE_THROWS_AS(parse_value("b:yes"), std::invalid_argument);
}

TEST_CASE("parse_value auto-detects untyped values") {
  REQUIRE(parse_value("28").kind() == ValueKind::Number);
  REQUIRE(parse_value("-3").as_i64() == -3);
  REQUIRE(parse_value("2.5").as_f64() == 2.5);
  REQUIRE(parse_value("true").as_bool() == true);
  REQUIRE(parse_value("John").as_string() == std::string("John"));
  REQUIRE(parse_value("x:1").as_string() == std::string("x:1"));
  REQUIRE(parse_value("").kind() == ValueKind::String);
  REQUIRE(parse_value("1e3").as_f64() == 1000.0);
  REQUIRE(parse_value("-.5").as_f64() == -0.5);
}

TEST_CASE("parse_value only auto-detects plain decimal floats") {
  for (const char* text : {"+5", "0x10", "nan", "inf", "1e", ".", "-", "1.2.3"}) {
    INFO(text);
    REQUIRE(parse_value(text).as_string() == std::string(text));
  }
}

TEST_CASE("parse_op accepts symbols and words") {
  REQUIRE(parse_op("==") == Op::Equal);
  REQUIRE(parse_op("eq") == Op::Equal);
  REQUIRE(parse_op("<") == Op::LessThan);
  REQUIRE(parse_op("le") == Op::LessOrEqual);
  REQUIRE(parse_op(">") == Op::GreaterThan);
  REQUIRE(parse_op("ge") == Op::GreaterOrEqual);
  REQUIRE_FALSE(parse_op("!=").has_value());
}

TEST_CASE("parse_cli recognises every command") {
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({}).cmd));
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({"--help"}).cmd));
  REQUIRE(std::holds_alternative<CmdVersion>(*parse({"version"}).cmd));

  auto info = parse({"info", "a.pak"});
  REQUIRE(std::get<CmdInfo>(*info.cmd).file == "a.pak");

  auto keys = parse({"--log-level", "debug", "keys", "a.pak"});
  REQUIRE(keys.log_level == std::string("debug"));
  REQUIRE(std::holds_alternative<CmdKeys>(*keys.cmd));

  auto dump = parse({"dump", "a.pak", "age"});
  REQUIRE(std::get<CmdDump>(*dump.cmd).key == "age");

  REQUIRE(std::holds_alternative<CmdVerify>(*parse({"verify", "a.pak"}).cmd));
}

TEST_CASE("parse_cli builds left-associative queries") {
  auto r = parse({"query", "a.pak", "name", "==", "John", "or", "age", "<", "28", "and", "kind", "eq", "s:dog"});
  REQUIRE(r.error.empty());
  const auto& q = std::get<CmdQuery>(*r.cmd).query;
  REQUIRE(q.to_string() == "((name == \"John\" | age < 28) & kind == \"dog\")");
}

TEST_CASE("parse_cli reports usage errors") {
  REQUIRE_FALSE(parse({"frobnicate"}).cmd.has_value());
  REQUIRE_FALSE(parse({"info"}).error.empty());
  REQUIRE_FALSE(parse({"dump", "a.pak"}).error.empty());
  REQUIRE_FALSE(parse({"query", "a.pak", "age", "<"}).error.empty());
  REQUIRE_FALSE(parse({"query", "a.pak", "age", "~", "3"}).error.empty());
  REQUIRE_FALSE(parse({"query", "a.pak", "age", "<", "i:x"}).error.empty());
  REQUIRE_FALSE(parse({"query", "a.pak", "age", "<", "3", "xor", "age", ">", "1"}).error.empty());
  REQUIRE_FALSE(parse({"query", "a.pak", "age", "<", "3", "and"}).error.empty());
  REQUIRE_FALSE(parse({"--log-level"}).error.empty());
}

TEST_CASE("execute prints query matches") {
  auto dir = mkd("pakdb_cli_");
  const auto path = build_file(dir);

  App app;
  std::ostringstream out;
  auto r = parse({"query", path.c_str(), "age", "<", "28"});
  REQUIRE(app.execute(*r.cmd, out) == 0);

  std::istringstream lines(out.str());
  std::string line;
  int n = 0;
  while (std::getline(lines, line)) ++n;
  REQUIRE(n == 2);
  REQUIRE(out.str().find("offset=") != std::string::npos);

  fs::remove_all(dir);
}

TEST_CASE("execute inspects an artifact") {
  auto dir = mkd("pakdb_cli_inspect_");
  const auto path = build_file(dir);
  App app;

  std::ostringstream info;
  REQUIRE(app.execute(CmdInfo{path}, info) == 0);
  REQUIRE(info.str().find("people") != std::string::npos);
  REQUIRE(info.str().find("records:     3") != std::string::npos);

  std::ostringstream keys;
  REQUIRE(app.execute(CmdKeys{path}, keys) == 0);
  REQUIRE(keys.str() == "age\tnumber\t3\nkind\tstring\t1\nname\tstring\t3\n");

  std::ostringstream dump;
  REQUIRE(app.execute(CmdDump{path, "name"}, dump) == 0);
  REQUIRE(dump.str().find("\"Jane\" -> ") == 0);

  std::ostringstream missing;
  REQUIRE(app.execute(CmdDump{path, "email"}, missing) == 1);

  std::ostringstream verify;
  REQUIRE(app.execute(CmdVerify{path}, verify) == 0);
  REQUIRE(verify.str().find(": ok") != std::string::npos);

  fs::remove_all(dir);
}

TEST_CASE("execute propagates library errors") {
  auto dir = mkd("pakdb_cli_err_");
  App app;
  std::ostringstream out;
  REQUIRE_THROWS_AS(app.execute(CmdInfo{(dir / "missing.pak").string()}, out), FormatError);

  const auto path = build_file(dir);
  auto r = parse({"query", path.c_str(), "age", "==", "s:old"});
  REQUIRE_THROWS_AS(app.execute(*r.cmd, out), TypeMismatchError);
  fs::remove_all(dir);
}

TEST_CASE("run maps outcomes to exit codes") {
  auto dir = mkd("pakdb_cli_run_");
  const auto path = build_file(dir);
  App app;

  auto run = [&](std::vector<std::string> args) {
    args.insert(args.begin(), "pakctl");
    std::vector<char*> argv;
    for (auto& s : args) argv.push_back(s.data());
    argv.push_back(nullptr);
    return app.run(static_cast<int>(args.size()), argv.data());
  };

  REQUIRE(run({"verify", path}) == 0);
  REQUIRE(run({"verify", (dir / "missing.pak").string()}) == 1);
  REQUIRE(run({"bogus"}) == 2);
  REQUIRE(run({"--log-level", "loud", "info", path}) == 2);

  fs::remove_all(dir);
}
