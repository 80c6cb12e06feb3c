#ifndef H_POLAR_ERRORS
#define H_POLAR_ERRORS
#include <stdexcept>
#include <string>

namespace polar {

class PolarError : public std::runtime_error {
public:
  explicit PolarError(const std::string &what) : std::runtime_error(what) {}
};

// maxiter, tol or algorithm name rejected before any matrix work.
class InvalidConfig : public PolarError {
public:
  explicit InvalidConfig(const std::string &what) : PolarError(what) {}
};

// Input shape not supported by the selected algorithm.
class ShapeMismatch : public PolarError {
public:
  explicit ShapeMismatch(const std::string &what) : PolarError(what) {}
};

class SingularMatrix : public PolarError {
public:
  explicit SingularMatrix(const std::string &what) : PolarError(what) {}
};

}

#endif
