#ifndef H_POLAR_DRIVER
#define H_POLAR_DRIVER
#include <cmath>
#include <sstream>
#include <utility>
#include "types.h"
#include "linalg.h"
#include "result.h"
#include "reporter.h"
#include "updaters.h"

namespace polar {

// Precondition checks emitted before the first iteration.
// Only Newton-Schulz has one: it diverges unless ||A||_2 < sqrt(3).
template <class Updater>
void report_preconditions(const Updater &, const Mat &, Reporter &) {}

inline void report_preconditions(const SchulzUpdater &, const Mat &A, Reporter &reporter) {
  const real norm = linalg::norm2(A);
  if (norm >= std::sqrt(3.0)) {
    std::stringstream ss;
    ss << "schulz: ||A||_2 = " << norm << " >= sqrt(3), the iteration will not converge";
    reporter.warning(ss.str());
  }
}

// The iteration loop shared by all iterative methods.
//
// Runs updater.update() until the relative change ||U_k - U_{k-1}||_F / ||U_k||_F drops to
// tol or maxiter steps have been taken, then forms H = sym(U^T A) from the last iterate.
// If reporter is non-null it receives (k, relerr, ||U^T U - I||_F^2) after every step.
// If final_state is non-null it receives the updater state after the last step.
template <class Updater>
Result common_iteration(const Updater &updater,
                        const Mat &A,
                        u32 maxiter,
                        real tol,
                        Reporter *reporter = nullptr,
                        typename Updater::State *final_state = nullptr) {
  Mat U;
  typename Updater::State state = updater.initialize(A, U);
  if (reporter) {
    report_preconditions(updater, A, *reporter);
  }

  Mat U_prev;
  u32 niters = maxiter;
  bool converged = false;
  for (u32 k = 1; k <= maxiter; ++k) {
    U_prev = U;
    state = updater.update(U, state);

    const real relerr = linalg::relative_change(U, U_prev);
    if (reporter) {
      const real deviation = linalg::gram_deviation(U);
      reporter->iteration(k, relerr, deviation * deviation);
    }
    if (relerr <= tol) {
      converged = true;
      niters = k;
      break;
    }
  }

  if (final_state) {
    *final_state = state;
  }
  Mat H = linalg::symmetrize(U.transpose() * A);
  return Result(std::move(U), std::move(H), niters, converged);
}

}

#endif
