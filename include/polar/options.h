#ifndef H_POLAR_OPTIONS
#define H_POLAR_OPTIONS
#include <cstdlib>
#include <iostream>
#include <string>
#include <cxxopts.hpp>
#include "types.h"

namespace polar {

struct CLIOptions {
  // Decomposition parameters.
  std::string algorithm;
  i32 maxiter;
  real tol;
  bool verbose;
  bool piv;

  // Test matrix.
  std::string matrix;
  u32 size;
  u32 seed;

  CLIOptions(int argc, char *argv[]) {
    cxxopts::Options parser("polar", "Polar decomposition A = U * H of a test matrix.");
    parser.add_options()
      ("algorithm", "newton, schulz, hybrid, halley, qdwh or svd", cxxopts::value<std::string>()->default_value("newton"))
      ("maxiter", "Maximum number of iterations", cxxopts::value<i32>()->default_value("100"))
      ("tol", "Tolerance on the relative change between iterates", cxxopts::value<real>()->default_value("1e-6"))
      ("verbose", "Print relative error and objective after every iteration")
      ("no-pivot", "Use QR without column pivoting in qdwh")
      ("matrix", "Test matrix: random, hilbert, identity or orthogonal", cxxopts::value<std::string>()->default_value("random"))
      ("size", "Matrix dimension", cxxopts::value<u32>()->default_value("6"))
      ("seed", "Seed for random and orthogonal matrices", cxxopts::value<u32>()->default_value("1"))
      ("help", "Print usage");

    try {
      auto flags = parser.parse(argc, argv);
      if (flags.count("help")) {
        std::cout << parser.help() << std::endl;
        exit(0);
      }
      this->algorithm = flags["algorithm"].as<std::string>();
      this->maxiter = flags["maxiter"].as<i32>();
      this->tol = flags["tol"].as<real>();
      this->verbose = flags["verbose"].as<bool>();
      this->piv = !flags["no-pivot"].as<bool>();
      this->matrix = flags["matrix"].as<std::string>();
      this->size = flags["size"].as<u32>();
      this->seed = flags["seed"].as<u32>();
    } catch (const cxxopts::OptionException &error) {
      std::cout << error.what() << std::endl;
      exit(1);
    }
  }
};

}

#endif
