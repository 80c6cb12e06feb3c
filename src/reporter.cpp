#include <iomanip>
#include "polar/reporter.h"

namespace polar {

const int IterWidth = 6;
const int ValueWidth = 16;

StreamReporter::StreamReporter(std::ostream &out) : out(out), header_written(false) {}

void StreamReporter::iteration(u32 k, real relerr, real objective) {
  if (!header_written) {
    out << std::setw(IterWidth) << "iter"
        << std::setw(ValueWidth) << "relerr"
        << std::setw(ValueWidth) << "objective" << std::endl;
    header_written = true;
  }
  std::ios_base::fmtflags flags = out.flags();
  std::streamsize precision = out.precision();
  out << std::setw(IterWidth) << k
      << std::scientific << std::setprecision(6)
      << std::setw(ValueWidth) << relerr
      << std::setw(ValueWidth) << objective << std::endl;
  out.flags(flags);
  out.precision(precision);
}

void StreamReporter::warning(const std::string &message) {
  out << "Warning: " << message << std::endl;
}

}
