#pragma once
#include <pakdb/cli.hpp>

#include <ostream>

namespace pakdb {

class App {
public:
  int run(int argc, char **argv);

  // Runs one parsed command, writing results to out. Library errors
  // propagate to the caller.
  int execute(const Command &cmd, std::ostream &out);
};

} // namespace pakdb
