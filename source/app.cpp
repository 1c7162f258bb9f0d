#include <pakdb/app.hpp>
#include <pakdb/pak.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

#ifndef PAKDB_VERSION
#define PAKDB_VERSION "unknown"
#endif

namespace pakdb {

static void print_help() {
  std::cout <<
      R"(pakctl - inspect pak artifacts

Usage:
  pakctl [--log-level LEVEL] info   <file>
  pakctl [--log-level LEVEL] keys   <file>
  pakctl [--log-level LEVEL] dump   <file> <key>
  pakctl [--log-level LEVEL] query  <file> <key> <op> <value> [and|or <key> <op> <value>]...
  pakctl [--log-level LEVEL] verify <file>
  pakctl version

  op:    == < <= > >=   (or eq lt le gt ge)
  value: s:text i:42 f:1.5 b:true, or untyped (integer, float, true/false, string)

Environment:
  PAKCTL_LOG_LEVEL   default log level (trace, debug, info, warn, err, critical, off)
)";
}

static std::optional<spdlog::level::level_enum> parse_level(const std::string &s) {
  auto lvl = spdlog::level::from_str(s);
  if (lvl == spdlog::level::off && s != "off") return std::nullopt;
  return lvl;
}

int App::run(int argc, char **argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(spdlog::level::warn);

  if (const char *env = std::getenv("PAKCTL_LOG_LEVEL")) {
    if (auto lvl = parse_level(env))
      spdlog::set_level(*lvl);
    else
      spdlog::warn("ignoring PAKCTL_LOG_LEVEL={}", env);
  }

  auto pr = parse_cli(argc, argv);
  if (pr.log_level) {
    auto lvl = parse_level(*pr.log_level);
    if (!lvl) {
      spdlog::error("unknown log level: {}", *pr.log_level);
      print_help();
      return 2;
    }
    spdlog::set_level(*lvl);
  }

  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  try {
    return execute(*pr.cmd, std::cout);
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}

int App::execute(const Command &cmd, std::ostream &out) {
  return std::visit(
      [&](auto &&c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_help();
          return 0;

        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          out << fmt::format("pakctl {}\n", PAKDB_VERSION);
          return 0;

        } else if constexpr (std::is_same_v<T, CmdInfo>) {
          Pak pak = Pak::open(c.file);
          const Metadata &m = pak.metadata();
          out << fmt::format("file:        {}\n", c.file);
          out << fmt::format("name:        {}\n", m.name);
          out << fmt::format("version:     {}\n", m.version);
          out << fmt::format("description: {}\n", m.description);
          out << fmt::format("author:      {}\n", m.author);
          out << fmt::format("records:     {}\n", pak.record_count());
          out << fmt::format("keys:        {}\n", pak.keys().size());
          out << fmt::format("data bytes:  {}\n", pak.data_size());
          out << fmt::format("total bytes: {}\n", pak.size());
          return 0;

        } else if constexpr (std::is_same_v<T, CmdKeys>) {
          Pak pak = Pak::open(c.file);
          for (const auto &d : pak.keys()) {
            auto idx = pak.index(d.key);
            const char *kind = idx && idx->kind() ? kind_name(*idx->kind()) : "-";
            out << fmt::format("{}\t{}\t{}\n", d.key, kind, d.location.entry_count);
          }
          return 0;

        } else if constexpr (std::is_same_v<T, CmdDump>) {
          Pak pak = Pak::open(c.file);
          auto idx = pak.index(c.key);
          if (!idx) {
            spdlog::error("no index for key '{}' in {}", c.key, c.file);
            return 1;
          }
          for (const auto &e : idx->entries())
            out << fmt::format("{} -> {}\n", Value::decode(e.encoded_value).to_string(),
                               e.pointer.to_string());
          return 0;

        } else if constexpr (std::is_same_v<T, CmdQuery>) {
          Pak pak = Pak::open(c.file);
          spdlog::debug("query {}", c.query.to_string());
          const PointerSet ptrs = pak.query_pointers(c.query);
          for (const auto &p : ptrs) out << p.to_string() << "\n";
          spdlog::info("{} match(es)", ptrs.size());
          return 0;

        } else {
          static_assert(std::is_same_v<T, CmdVerify>);
          Pak pak = Pak::open(c.file);
          pak.verify();
          out << fmt::format("{}: ok ({} records, {} bytes)\n", c.file, pak.record_count(),
                             pak.size());
          return 0;
        }
      },
      cmd);
}

} // namespace pakdb
