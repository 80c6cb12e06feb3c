#ifndef H_POLAR_REPORTER
#define H_POLAR_REPORTER
#include <iostream>
#include <string>
#include "types.h"

namespace polar {

// Sink for per-iteration diagnostics of the convergence driver.
class Reporter {
public:
  virtual ~Reporter() {}
  virtual void iteration(u32 k, real relerr, real objective) = 0;
  virtual void warning(const std::string &message) = 0;
};

// Tabular output on a stream: one row per iteration.
class StreamReporter : public Reporter {
  private:
  std::ostream &out;
  bool header_written;

  public:
  explicit StreamReporter(std::ostream &out = std::cout);
  void iteration(u32 k, real relerr, real objective) override;
  void warning(const std::string &message) override;
};

}

#endif
