#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <tuple>
#include <vector>
#include "gtest/gtest.h"
#include "polar/types.h"
#include "polar/driver.h"
#include "polar/updaters.h"
#include "polar/linalg.h"
#include "polar/utils.h"

using namespace polar;

class RecordingReporter : public Reporter {
public:
  std::vector<std::tuple<u32, real, real>> rows;
  std::vector<std::string> warnings;

  void iteration(u32 k, real relerr, real objective) override {
    rows.push_back(std::make_tuple(k, relerr, objective));
  }
  void warning(const std::string &message) override {
    warnings.push_back(message);
  }
};

template <class Updater>
void test_identity(const Updater &updater) {
  const Mat I = Mat::Identity(5, 5);
  Result result = common_iteration(updater, I, 100, 1e-6);
  ASSERT_TRUE(*result.converged());
  ASSERT_LE(*result.niters(), 1u);
  ASSERT_LT((result.U() - I).norm(), 1e-12);
  ASSERT_LT((result.H() - I).norm(), 1e-12);
}

TEST(TestDriver, IdentityLaw) {
  test_identity(NewtonUpdater());
  test_identity(SchulzUpdater());
  test_identity(HybridUpdater(1e-6));
  test_identity(HalleyUpdater());
  test_identity(QDWHUpdater(true));
  test_identity(QDWHUpdater(false));
}

template <class Updater>
void test_orthogonal_closure(const Updater &updater, u32 seed) {
  const Mat Q = random_orthogonal(6, seed);
  Result result = common_iteration(updater, Q, 100, 1e-6);
  ASSERT_TRUE(*result.converged());
  ASSERT_EQ(*result.niters(), 1u);
  ASSERT_LT((result.U() - Q).norm(), 1e-12);
  ASSERT_LT((result.H() - Mat::Identity(6, 6)).norm(), 1e-12);
}

TEST(TestDriver, OrthogonalClosure) {
  for (u32 seed = 1; seed <= 3; seed++) {
    test_orthogonal_closure(NewtonUpdater(), seed);
    test_orthogonal_closure(HalleyUpdater(), seed);
  }
}

TEST(TestDriver, ReportsEveryIteration) {
  RecordingReporter reporter;
  const real tol = 1e-8;
  Result result = common_iteration(NewtonUpdater(), random_matrix(5, 5, 21), 100, tol, &reporter);
  ASSERT_TRUE(*result.converged());
  ASSERT_EQ(reporter.rows.size(), *result.niters());
  for (u32 i = 0; i < reporter.rows.size(); i++) {
    ASSERT_EQ(std::get<0>(reporter.rows[i]), i + 1);
  }
  // only the last row meets the tolerance
  for (u32 i = 0; i + 1 < reporter.rows.size(); i++) {
    ASSERT_GT(std::get<1>(reporter.rows[i]), tol);
  }
  ASSERT_LE(std::get<1>(reporter.rows.back()), tol);
  // objective = ||U^T U - I||_F^2 of the final iterate
  const real deviation = linalg::gram_deviation(result.U());
  ASSERT_NEAR(std::get<2>(reporter.rows.back()), deviation * deviation, 1e-20);
  ASSERT_TRUE(reporter.warnings.empty());
}

TEST(TestDriver, ExhaustsMaxiter) {
  RecordingReporter reporter;
  Result result = common_iteration(HalleyUpdater(), hilbert(6), 3, 1e-6, &reporter);
  ASSERT_FALSE(*result.converged());
  ASSERT_EQ(*result.niters(), 3u);
  ASSERT_EQ(reporter.rows.size(), 3u);
  // H still comes from the last iterate and is symmetric
  ASSERT_TRUE(result.H() == result.H().transpose());
}

TEST(TestDriver, SchulzPreconditionWarning) {
  RecordingReporter reporter;
  Result result = common_iteration(SchulzUpdater(), 3.0 * Mat::Identity(3, 3), 20, 1e-6, &reporter);
  ASSERT_FALSE(*result.converged());
  ASSERT_EQ(*result.niters(), 20u);
  ASSERT_EQ(reporter.warnings.size(), 1u);

  RecordingReporter quiet;
  Mat A = random_matrix(4, 4, 5);
  common_iteration(SchulzUpdater(), A / A.norm(), 100, 1e-6, &quiet);
  ASSERT_TRUE(quiet.warnings.empty());
}

TEST(TestDriver, FinalState) {
  QDWHUpdater::State state;
  Result result = common_iteration(QDWHUpdater(), random_matrix(6, 6, 17), 100, 1e-10, nullptr, &state);
  ASSERT_TRUE(*result.converged());
  ASSERT_GT(state.L, 0.99);
  ASSERT_LE(state.L, 1.0);

  HybridUpdater::State hybrid_state;
  result = common_iteration(HybridUpdater(1e-10), random_matrix(6, 6, 17), 100, 1e-10, nullptr, &hybrid_state);
  ASSERT_TRUE(*result.converged());
  ASSERT_EQ(hybrid_state.newton_steps + hybrid_state.schulz_steps, *result.niters());
}

TEST(TestDriver, HybridAgainstNewtonSweep) {
  for (real tol : {1e-3, 1e-6, 1e-10}) {
    for (u32 seed = 1; seed <= 60; seed++) {
      Mat A = random_matrix(8, 8, seed);
      Result newton = common_iteration(NewtonUpdater(), A, 100, tol);
      HybridUpdater::State state;
      Result hybrid = common_iteration(HybridUpdater(tol), A, 100, tol, nullptr, &state);
      ASSERT_TRUE(*newton.converged());
      ASSERT_TRUE(*hybrid.converged());
      // identical up to the switch, so never more inversions than Newton
      ASSERT_LE(state.newton_steps, *newton.niters());
      // the slower Newton-Schulz tail costs at most one step
      ASSERT_LE(*hybrid.niters(), *newton.niters() + 1);
      ASSERT_LE(linalg::gram_deviation(hybrid.U()), 10 * tol);
    }
  }
}

TEST(TestDriver, HIsFormedFromOriginalInput) {
  // qdwh iterates on A / ||A||_2; H must still reconstruct A itself
  Mat A = 50.0 * random_matrix(4, 4, 6);
  Result result = common_iteration(QDWHUpdater(), A, 100, 1e-8);
  ASSERT_TRUE(*result.converged());
  ASSERT_LT((result.U() * result.H() - A).norm() / A.norm(), 1e-10);
}
