#ifndef H_POLAR_TYPES
#define H_POLAR_TYPES
#include <cstdint>
#include <Eigen/Dense>

namespace polar {

using real = double;
using u32 = uint32_t;
using i32 = int32_t;
using u64 = uint64_t;

using Mat = Eigen::Matrix<real, Eigen::Dynamic, Eigen::Dynamic>;
using Vec = Eigen::Matrix<real, Eigen::Dynamic, 1>;

}

#endif
