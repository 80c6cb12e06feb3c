#ifndef H_POLAR_UPDATERS
#define H_POLAR_UPDATERS
#include "types.h"

namespace polar {

// Update rules for the polar factor U.
//
// Every updater provides
//   State initialize(const Mat &A, Mat &U) const;  // U <- starting iterate, checks the shape
//   State update(Mat &U, const State &state) const; // one step in place, returns the next state
// and is driven by common_iteration() in driver.h. State is a plain value, so single steps
// can be replayed and inspected.

const real NewtonScalingCutoff = 1e-2;
// ||U^T U - I||_F below this keeps every squared singular value in (1/2, 3/2),
// inside the Newton-Schulz convergence region (0, 3).
const real SchulzSwitchBound = 0.5;

// Scaled Newton: U <- (gamma U + U^-T / gamma) / 2.
class NewtonUpdater {
public:
  struct State {
    bool scaled = true;
  };

  explicit NewtonUpdater(real scaling_cutoff = NewtonScalingCutoff);
  State initialize(const Mat &A, Mat &U) const;
  State update(Mat &U, const State &state) const;

  // gamma = sqrt(||U^-1||_F / ||U||_F)
  static real scaling_factor(const Mat &U, const Mat &Uinv);

private:
  real scaling_cutoff;
};

// Newton-Schulz: U <- U (3I - U^T U) / 2. Converges only if ||A||_2 < sqrt(3).
class SchulzUpdater {
public:
  struct State {};

  State initialize(const Mat &A, Mat &U) const;
  State update(Mat &U, const State &state) const;
};

// Newton steps until ||U^T U - I||_F < theta, then Newton-Schulz for good.
class HybridUpdater {
public:
  enum class Mode { Newton, Schulz };

  struct State {
    Mode mode = Mode::Newton;
    NewtonUpdater::State newton;
    u32 newton_steps = 0; // one inversion each
    u32 schulz_steps = 0;
  };

  // theta = min(SchulzSwitchBound, sqrt(tol))
  explicit HybridUpdater(real tol);
  State initialize(const Mat &A, Mat &U) const;
  State update(Mat &U, const State &state) const;
  real switch_threshold() const { return theta; }

private:
  NewtonUpdater newton;
  SchulzUpdater schulz;
  real theta;
};

// Halley: U <- U (3I + U^T U) (I + 3 U^T U)^-1.
class HalleyUpdater {
public:
  struct State {};

  State initialize(const Mat &A, Mat &U) const;
  State update(Mat &U, const State &state) const;
};

// Weights of the dynamically weighted Halley step for a lower bound L.
struct DWHParameters {
  real a;
  real b;
  real c;
};

DWHParameters dwh_parameters(real L);

// Real part of the principal cube root; negative arguments go through std::complex.
real principal_cbrt_real(real x);

// QR-based dynamically weighted Halley. Square input only.
//
// initialize() normalizes U0 = A / ||A||_2 and sets L0 = 1 / (sqrt(n) ||U0^-1||_1),
// a lower bound of the smallest singular value of U0. Each step
//   [sqrt(c) U; I] = [Q1; Q2] R
//   U <- (b/c) U + (a - b/c) / sqrt(c) * Q1 Q2^T
// and L <- L (a + b L^2) / (1 + c L^2), which increases towards 1.
class QDWHUpdater {
public:
  struct State {
    real L = 0;
    // weights used by the step that produced this state
    real a = 0;
    real b = 0;
    real c = 0;
  };

  explicit QDWHUpdater(bool piv = true);
  State initialize(const Mat &A, Mat &U) const;
  State update(Mat &U, const State &state) const;

private:
  bool piv;
};

}

#endif
