#include "dynalias/App.hpp"

int main(int argc, char* argv[]) {
  dynalias::App app;
  return app.run(argc, argv);
}
