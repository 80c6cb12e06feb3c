#ifndef H_POLAR_CONFIG
#define H_POLAR_CONFIG
#include <string>
#include "types.h"

namespace polar {

enum class Algorithm { Newton, Schulz, Hybrid, Halley, QDWH, SVD };

// Accepts "newton", "schulz", "hybrid", "halley", "qdwh" and "svd".
Algorithm parse_algorithm(const std::string &name);
std::string algorithm_name(Algorithm algorithm);

inline bool is_iterative(Algorithm algorithm) {
  return algorithm != Algorithm::SVD;
}

class PolarConfig {
public:
  // Throws InvalidConfig if maxiter <= 1 or tol <= 0 for an iterative algorithm.
  // maxiter and tol are not checked for Algorithm::SVD, which ignores them.
  PolarConfig(Algorithm algorithm = Algorithm::Newton,
              i32 maxiter = 100,
              real tol = 1e-6,
              bool verbose = false,
              bool piv = true);

  Algorithm algorithm() const { return algorithm_; }
  u32 maxiter() const { return maxiter_; }
  real tol() const { return tol_; }
  bool verbose() const { return verbose_; }
  bool piv() const { return piv_; } // qdwh only

private:
  Algorithm algorithm_;
  u32 maxiter_;
  real tol_;
  bool verbose_;
  bool piv_;
};

}

#endif
