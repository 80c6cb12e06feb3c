#include <algorithm>
#include <cmath>
#include <Eigen/Dense>
#include "polar/updaters.h"
#include "polar/linalg.h"

namespace polar {

NewtonUpdater::NewtonUpdater(real scaling_cutoff) : scaling_cutoff(scaling_cutoff) {}

NewtonUpdater::State NewtonUpdater::initialize(const Mat &A, Mat &U) const {
  linalg::require_square(A, "newton");
  U = A;
  return State();
}

real NewtonUpdater::scaling_factor(const Mat &U, const Mat &Uinv) {
  return std::sqrt(Uinv.stableNorm() / U.stableNorm());
}

NewtonUpdater::State NewtonUpdater::update(Mat &U, const State &state) const {
  Mat Uinv = linalg::inverse(U, "newton");
  real gamma = state.scaled ? scaling_factor(U, Uinv) : 1.0;
  Mat next = 0.5 * (gamma * U + Uinv.transpose() / gamma);

  State next_state = state;
  // Once a step moves U by less than the cutoff, gamma stays 1 for good.
  if (state.scaled && linalg::relative_change(next, U) < scaling_cutoff) {
    next_state.scaled = false;
  }
  U.swap(next);
  return next_state;
}


SchulzUpdater::State SchulzUpdater::initialize(const Mat &A, Mat &U) const {
  linalg::require_nonempty(A, "schulz");
  U = A;
  return State();
}

SchulzUpdater::State SchulzUpdater::update(Mat &U, const State &state) const {
  const Eigen::Index n = U.cols();
  Mat UtU = U.transpose() * U;
  Mat next = 0.5 * U * (3.0 * Mat::Identity(n, n) - UtU);
  U.swap(next);
  return state;
}


HybridUpdater::HybridUpdater(real tol)
  : theta(std::min(SchulzSwitchBound, std::sqrt(tol))) {}

HybridUpdater::State HybridUpdater::initialize(const Mat &A, Mat &U) const {
  State state;
  state.newton = newton.initialize(A, U);
  return state;
}

HybridUpdater::State HybridUpdater::update(Mat &U, const State &state) const {
  State next_state = state;
  if (state.mode == Mode::Newton) {
    next_state.newton = newton.update(U, state.newton);
    next_state.newton_steps++;
    if (linalg::gram_deviation(U) < theta) {
      next_state.mode = Mode::Schulz;
    }
  } else {
    schulz.update(U, SchulzUpdater::State());
    next_state.schulz_steps++;
  }
  return next_state;
}


HalleyUpdater::State HalleyUpdater::initialize(const Mat &A, Mat &U) const {
  linalg::require_nonempty(A, "halley");
  U = A;
  return State();
}

HalleyUpdater::State HalleyUpdater::update(Mat &U, const State &state) const {
  const Eigen::Index n = U.cols();
  const Mat I = Mat::Identity(n, n);
  Mat UtU = U.transpose() * U;
  // I + 3 U^T U is symmetric positive definite, so X (I + 3 U^T U)^-1 = (llt.solve(X^T))^T.
  Eigen::LLT<Mat> llt(I + 3.0 * UtU);
  Mat X = U * (3.0 * I + UtU);
  Mat next = llt.solve(X.transpose()).transpose();
  U.swap(next);
  return state;
}

}
