#include <iostream>
#include <utility>
#include "polar/factorize.h"
#include "polar/driver.h"
#include "polar/linalg.h"
#include "polar/updaters.h"

namespace polar {

Result factorize(const Mat &A, const PolarConfig &config, Reporter *reporter) {
  StreamReporter console(std::cout);
  Reporter *sink = nullptr;
  if (config.verbose()) {
    sink = reporter ? reporter : &console;
  }

  const u32 maxiter = config.maxiter();
  const real tol = config.tol();
  switch (config.algorithm()) {
    case Algorithm::Newton:
      return common_iteration(NewtonUpdater(), A, maxiter, tol, sink);
    case Algorithm::Schulz:
      return common_iteration(SchulzUpdater(), A, maxiter, tol, sink);
    case Algorithm::Hybrid:
      return common_iteration(HybridUpdater(tol), A, maxiter, tol, sink);
    case Algorithm::Halley:
      return common_iteration(HalleyUpdater(), A, maxiter, tol, sink);
    case Algorithm::QDWH:
      return common_iteration(QDWHUpdater(config.piv()), A, maxiter, tol, sink);
    case Algorithm::SVD:
      break;
  }

  Mat U, H;
  linalg::polar_decomposition(A, U, H);
  return Result(std::move(U), std::move(H));
}

Result factorize(const Mat &A, Algorithm algorithm, i32 maxiter, real tol, bool verbose, bool piv) {
  return factorize(A, PolarConfig(algorithm, maxiter, tol, verbose, piv));
}

}
