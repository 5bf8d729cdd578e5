#include "tracr/cli/router.hpp"

int main(int argc, char** argv) {
  // Keep the process entrypoint thin. Command parsing and output/exit-code
  // contracts live in the CLI router.
  return tracr::cli::Dispatch(argc, argv);
}
