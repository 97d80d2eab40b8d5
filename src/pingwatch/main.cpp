#include "pingwatch/cli/router.hpp"

int main(int argc, char** argv) {
  // Keep the process entrypoint thin. Option parsing, stream wiring and the
  // exit-code contract live in the CLI router.
  return pingwatch::cli::Dispatch(argc, argv);
}
