#include <iomanip>
#include <iostream>
#include <string>
#include "polar/options.h"
#include "polar/config.h"
#include "polar/errors.h"
#include "polar/factorize.h"
#include "polar/linalg.h"
#include "polar/utils.h"

using namespace polar;

Mat build_matrix(const CLIOptions &flags) {
  if (flags.matrix == "random") return random_matrix(flags.size, flags.size, flags.seed);
  if (flags.matrix == "hilbert") return hilbert(flags.size);
  if (flags.matrix == "identity") return Mat::Identity(flags.size, flags.size);
  if (flags.matrix == "orthogonal") return random_orthogonal(flags.size, flags.seed);
  throw InvalidConfig("unknown test matrix '" + flags.matrix + "'");
}

int main(int argc, char *argv[]) {
  CLIOptions flags(argc, argv);

  try {
    PolarConfig config(parse_algorithm(flags.algorithm), flags.maxiter, flags.tol, flags.verbose, flags.piv);
    Mat A = build_matrix(flags);

    Result result = factorize(A, config);

    std::cout << "algorithm:  " << algorithm_name(config.algorithm()) << std::endl;
    std::cout << "matrix:     " << flags.matrix << " " << A.rows() << "x" << A.cols() << std::endl;
    if (result.niters()) {
      std::cout << "iterations: " << *result.niters() << std::endl;
      std::cout << "converged:  " << (*result.converged() ? "yes" : "no") << std::endl;
    }
    std::cout << std::scientific << std::setprecision(3);
    std::cout << "||UH - A||_F / ||A||_F = " << (result.U() * result.H() - A).norm() / A.norm() << std::endl;
    std::cout << "||U^T U - I||_F        = " << linalg::gram_deviation(result.U()) << std::endl;
  } catch (const PolarError &error) {
    std::cout << error.what() << std::endl;
    return 1;
  }
  return 0;
}
