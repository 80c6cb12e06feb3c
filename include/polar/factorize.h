#ifndef H_POLAR_FACTORIZE
#define H_POLAR_FACTORIZE
#include "types.h"
#include "config.h"
#include "result.h"
#include "reporter.h"

namespace polar {

// Polar decomposition A = U * H with the method selected by config.
//
// With config.verbose() set, per-iteration diagnostics go to reporter, or to a
// StreamReporter on std::cout if reporter is null. Without it nothing is reported.
// Throws ShapeMismatch for shapes the method does not support and SingularMatrix when
// an inverse of a singular iterate is required.
Result factorize(const Mat &A, const PolarConfig &config = PolarConfig(), Reporter *reporter = nullptr);

Result factorize(const Mat &A,
                 Algorithm algorithm,
                 i32 maxiter = 100,
                 real tol = 1e-6,
                 bool verbose = false,
                 bool piv = true);

}

#endif
