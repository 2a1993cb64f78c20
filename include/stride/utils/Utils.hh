#pragma once

#include <string>

namespace stride {

class Utils {
public:
  // Thread-safe. Generates prefix + `length` random hex digits.
  static std::string generateUniqueId(const std::string& prefix, int length = 8);
};

} // namespace stride
