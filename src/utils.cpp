#include <cstdlib>
#include <Eigen/Dense>
#include "polar/utils.h"

namespace polar {

Mat hilbert(u32 n) {
  Mat H(n, n);
  for (u32 i = 0; i < n; i++) {
    for (u32 j = 0; j < n; j++) {
      H(i, j) = 1.0 / real(i + j + 1);
    }
  }
  return H;
}

Mat random_matrix(u32 rows, u32 cols, u32 seed) {
  // Eigen's Random draws from rand().
  std::srand(seed);
  return Mat::Random(rows, cols);
}

Mat random_orthogonal(u32 n, u32 seed) {
  Eigen::HouseholderQR<Mat> qr(random_matrix(n, n, seed));
  return qr.householderQ() * Mat::Identity(n, n);
}

}
