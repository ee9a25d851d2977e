#pragma once

#include <stdexcept>
#include <string>

namespace ulidtool::core {

// FatalInitializationError signals a broken host assumption (failed integrity
// check) or a clock value that no longer fits in 48 bits.
// Not recoverable: identifiers must not be constructed once it is raised.
class FatalInitializationError : public std::runtime_error {
 public:
  explicit FatalInitializationError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace ulidtool::core
