#pragma once

#include <string>
#include <string_view>

namespace fleet {

class Utils {
public:
  // Thread-safe. Generates prefix + `length` random hex digits.
  static std::string generateUniqueId(const std::string& prefix, int length = 8);

  // Strips every leading and trailing occurrence of `ch`.
  static std::string_view trim(std::string_view value, char ch);
};

} // namespace fleet
