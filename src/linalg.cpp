#include <cmath>
#include <sstream>
#include <Eigen/Dense>
#include "polar/linalg.h"
#include "polar/errors.h"

namespace polar {
namespace linalg {

void polar_decomposition(const Mat &A, Mat &U, Mat &H) {
  require_nonempty(A, "svd");
  Eigen::JacobiSVD<Mat> svd(A, Eigen::ComputeThinU | Eigen::ComputeThinV);
  const Vec &singularValues = svd.singularValues();
  const Mat &P = svd.matrixU();
  const Mat &Q = svd.matrixV();
  U = P * Q.transpose();
  H = symmetrize(Q * singularValues.asDiagonal() * Q.transpose());
}

Mat symmetrize(const Mat &H) {
  // a + b and b + a round identically, so the result is bit-for-bit symmetric.
  Mat S(H.rows(), H.cols());
  for (Eigen::Index j = 0; j < H.cols(); ++j) {
    for (Eigen::Index i = 0; i < H.rows(); ++i) {
      S(i, j) = 0.5 * (H(i, j) + H(j, i));
    }
  }
  return S;
}

real gram_deviation(const Mat &U) {
  if (U.rows() >= U.cols()) {
    Mat G = U.transpose() * U;
    G.diagonal().array() -= 1.0;
    return G.norm();
  }
  Mat G = U * U.transpose();
  G.diagonal().array() -= 1.0;
  return G.norm();
}

real relative_change(const Mat &current, const Mat &previous) {
  return (current - previous).stableNorm() / current.stableNorm();
}

real norm2(const Mat &A) {
  if (A.size() == 0) {
    return 0.0;
  }
  Eigen::JacobiSVD<Mat> svd(A);
  return svd.singularValues()(0);
}

real norm1(const Mat &A) {
  if (A.size() == 0) {
    return 0.0;
  }
  return A.cwiseAbs().colwise().sum().maxCoeff();
}

Mat inverse(const Mat &A, const std::string &context) {
  Eigen::FullPivLU<Mat> lu(A);
  if (!lu.isInvertible() || !std::isfinite(A.stableNorm())) {
    throw SingularMatrix(context + ": matrix is numerically singular");
  }
  return lu.inverse();
}

void require_square(const Mat &A, const std::string &method) {
  if (A.rows() != A.cols()) {
    std::stringstream ss;
    ss << method << " requires a square matrix (got " << A.rows() << "x" << A.cols() << ")";
    throw ShapeMismatch(ss.str());
  }
  require_nonempty(A, method);
}

void require_nonempty(const Mat &A, const std::string &method) {
  if (A.size() == 0) {
    throw ShapeMismatch(method + " requires a non-empty matrix");
  }
}

}
}
