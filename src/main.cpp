#include "envtpl/App.hpp"

#include <iostream>

extern "C" {
  extern char** environ; // NOLINT
}

int main(int argc, char* argv[]) {
  envtpl::App app(std::cin, std::cout, environ);
  return app.run(argc, argv);
}
