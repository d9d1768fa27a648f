#include "witdocs/cli/router.hpp"

int main(int argc, char** argv) {
  return witdocs::cli::DispatchInject(argc, argv);
}
