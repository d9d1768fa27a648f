#include "witdocs/cli/router.hpp"

int main(int argc, char** argv) {
  // Parsing, rendering and exit-code mapping all live in the router.
  return witdocs::cli::DispatchView(argc, argv);
}
