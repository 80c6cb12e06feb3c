#ifndef H_POLAR_LINALG
#define H_POLAR_LINALG
#include <string>
#include <Eigen/Dense>
#include "types.h"

namespace polar {
namespace linalg {

// A = U * H from a thin SVD A = P * S * Q^T: U = P * Q^T, H = Q * S * Q^T.
void polar_decomposition(const Mat &A, Mat &U, Mat &H);

// (H + H^T) / 2, exactly symmetric.
Mat symmetrize(const Mat &H);

// ||G - I||_F with G the smaller Gram matrix of U (U^T U if rows >= cols, else U U^T).
real gram_deviation(const Mat &U);

// ||current - previous||_F / ||current||_F
real relative_change(const Mat &current, const Mat &previous);

// Largest singular value.
real norm2(const Mat &A);
real norm1(const Mat &A);

// Throws SingularMatrix if A is numerically singular.
Mat inverse(const Mat &A, const std::string &context);

void require_square(const Mat &A, const std::string &method);
void require_nonempty(const Mat &A, const std::string &method);

}
}

#endif
