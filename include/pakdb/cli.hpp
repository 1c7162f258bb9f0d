#pragma once
#include <pakdb/index.hpp>
#include <pakdb/query.hpp>
#include <pakdb/value.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace pakdb {

struct CmdInfo {
  std::string file;
};
struct CmdKeys {
  std::string file;
};
struct CmdDump {
  std::string file;
  std::string key;
};
struct CmdQuery {
  std::string file;
  Query query;
};
struct CmdVerify {
  std::string file;
};

struct CmdHelp {};
struct CmdVersion {};

using Command =
    std::variant<CmdHelp, CmdVersion, CmdInfo, CmdKeys, CmdDump, CmdQuery, CmdVerify>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
  std::optional<std::string> log_level;
};

ParseResult parse_cli(int argc, char **argv);

// "==", "<", "<=", ">", ">=" or eq/lt/le/gt/ge
std::optional<Op> parse_op(std::string_view s);

// Typed with s:/i:/f:/b: prefixes, otherwise integer, plain decimal float,
// true/false, then string. Throws std::invalid_argument on a malformed typed value.
Value parse_value(std::string_view s);

} // namespace pakdb
