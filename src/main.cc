#include "Driver.hpp"

int
main(int argc, char* argv[]) {
  return distbuild::run(argc, argv).is_err();
}
