#include <cmath>
#include <sstream>
#include "polar/config.h"
#include "polar/errors.h"

namespace polar {

Algorithm parse_algorithm(const std::string &name) {
  if (name == "newton") return Algorithm::Newton;
  if (name == "schulz") return Algorithm::Schulz;
  if (name == "hybrid") return Algorithm::Hybrid;
  if (name == "halley") return Algorithm::Halley;
  if (name == "qdwh") return Algorithm::QDWH;
  if (name == "svd") return Algorithm::SVD;
  throw InvalidConfig("unknown algorithm '" + name + "'");
}

std::string algorithm_name(Algorithm algorithm) {
  switch (algorithm) {
    case Algorithm::Newton: return "newton";
    case Algorithm::Schulz: return "schulz";
    case Algorithm::Hybrid: return "hybrid";
    case Algorithm::Halley: return "halley";
    case Algorithm::QDWH: return "qdwh";
    case Algorithm::SVD: return "svd";
  }
  throw InvalidConfig("unknown algorithm");
}

PolarConfig::PolarConfig(Algorithm algorithm, i32 maxiter, real tol, bool verbose, bool piv)
  : algorithm_(algorithm),
    maxiter_(0),
    tol_(tol),
    verbose_(verbose),
    piv_(piv)
{
  if (is_iterative(algorithm)) {
    if (maxiter <= 1) {
      std::stringstream ss;
      ss << "maxiter must be greater than 1 (got " << maxiter << ")";
      throw InvalidConfig(ss.str());
    }
    if (!(tol > 0) || !std::isfinite(tol)) {
      std::stringstream ss;
      ss << "tol must be positive (got " << tol << ")";
      throw InvalidConfig(ss.str());
    }
  }
  maxiter_ = maxiter > 0 ? static_cast<u32>(maxiter) : 0;
}

}
