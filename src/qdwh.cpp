#include <algorithm>
#include <cmath>
#include <complex>
#include <Eigen/Dense>
#include "polar/updaters.h"
#include "polar/linalg.h"
#include "polar/errors.h"

namespace polar {

real principal_cbrt_real(real x) {
  if (x >= 0) {
    return std::cbrt(x);
  }
  // Happens when round-off pushes L slightly above 1.
  std::complex<real> root = std::pow(std::complex<real>(x, 0.0), 1.0 / 3.0);
  return root.real();
}

DWHParameters dwh_parameters(real L) {
  const real L2 = L * L;
  const real dd = principal_cbrt_real(4.0 * (1.0 - L2) / (L2 * L2));
  const real sqd = std::sqrt(1.0 + dd);
  DWHParameters p;
  p.a = sqd + 0.5 * std::sqrt(8.0 - 4.0 * dd + 8.0 * (2.0 - L2) / (L2 * sqd));
  p.b = (p.a - 1.0) * (p.a - 1.0) / 4.0;
  p.c = p.a + p.b - 1.0;
  return p;
}

namespace {

// First n columns of the orthogonal factor of B ((m+n) x n).
Mat thin_q(const Mat &B, bool piv) {
  const Mat E = Mat::Identity(B.rows(), B.cols());
  if (piv) {
    // B P = Q R spans the same column space, so Q1 Q2^T does not depend on P.
    Eigen::ColPivHouseholderQR<Mat> qr(B);
    return qr.householderQ() * E;
  }
  Eigen::HouseholderQR<Mat> qr(B);
  return qr.householderQ() * E;
}

}

QDWHUpdater::QDWHUpdater(bool piv) : piv(piv) {}

QDWHUpdater::State QDWHUpdater::initialize(const Mat &A, Mat &U) const {
  // TODO: tall m > n input needs a rectangular L0 estimate; only the square case is handled.
  linalg::require_square(A, "qdwh");
  const real n = static_cast<real>(A.cols());

  const real alpha = linalg::norm2(A);
  if (!(alpha > 0)) {
    throw SingularMatrix("qdwh: zero matrix");
  }
  U = A / alpha;

  // opnorm_1(X0) / cond_1(X0) = 1 / ||X0^-1||_1
  const Mat Uinv = linalg::inverse(U, "qdwh");
  State state;
  state.L = std::min<real>(1.0, 1.0 / (linalg::norm1(Uinv) * std::sqrt(n)));
  return state;
}

QDWHUpdater::State QDWHUpdater::update(Mat &U, const State &state) const {
  const Eigen::Index m = U.rows();
  const Eigen::Index n = U.cols();
  const real L = state.L;
  const real L2 = L * L;
  const DWHParameters p = dwh_parameters(L);

  State next_state;
  next_state.a = p.a;
  next_state.b = p.b;
  next_state.c = p.c;
  next_state.L = std::min<real>(1.0, L * (p.a + p.b * L2) / (1.0 + p.c * L2));

  const real sqc = std::sqrt(p.c);
  Mat B(m + n, n);
  B.topRows(m) = sqc * U;
  B.bottomRows(n).setIdentity();

  const Mat Q = thin_q(B, piv);
  const Mat Q1 = Q.topRows(m);
  const Mat Q2 = Q.bottomRows(n);

  Mat next = (p.b / p.c) * U + ((p.a - p.b / p.c) / sqc) * (Q1 * Q2.transpose());
  U.swap(next);
  return next_state;
}

}
