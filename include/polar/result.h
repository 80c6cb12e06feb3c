#ifndef H_POLAR_RESULT
#define H_POLAR_RESULT
#include <utility>
#include <boost/optional.hpp>
#include "types.h"

namespace polar {

// Output of one decomposition A = U * H.
// niters and converged are empty for the SVD method, which does not iterate.
class Result {
public:
  Result(Mat U, Mat H,
         boost::optional<u32> niters = boost::none,
         boost::optional<bool> converged = boost::none)
    : U_(std::move(U)),
      H_(std::move(H)),
      niters_(niters),
      converged_(converged) {}

  const Mat &U() const { return U_; }
  const Mat &H() const { return H_; }
  const boost::optional<u32> &niters() const { return niters_; }
  const boost::optional<bool> &converged() const { return converged_; }

private:
  Mat U_;
  Mat H_;
  boost::optional<u32> niters_;
  boost::optional<bool> converged_;
};

}

#endif
