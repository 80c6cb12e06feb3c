#ifndef H_POLAR_UTILS
#define H_POLAR_UTILS
#include "types.h"

namespace polar {

// H(i, j) = 1 / (i + j + 1); condition number grows like e^{3.5 n}.
Mat hilbert(u32 n);

// Entries uniform in [-1, 1], reproducible for a given seed.
Mat random_matrix(u32 rows, u32 cols, u32 seed);

// Orthogonal factor of the QR decomposition of random_matrix(n, n, seed).
Mat random_orthogonal(u32 n, u32 seed);

}

#endif
