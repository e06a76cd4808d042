#pragma once

#include <ostream>

namespace largest {
namespace demo {
// Runs every finder flavor over the sample sequences and writes one
// "<flavor> is <value>" line per call to out.
void run(std::ostream &out);
}  // namespace demo
}  // namespace largest
