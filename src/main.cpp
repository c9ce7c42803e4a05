#include "oac/cli/commands.hpp"

#include <csignal>

int main(int argc, char **argv) {
  std::signal(SIGPIPE, SIG_IGN);
  return oac::cli::run_cli(argc, argv);
}
