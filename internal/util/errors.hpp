#pragma once

#include <stdexcept>
#include <string>

namespace komorebi::util {

/*
  Central error types.

  Everything thrown by the core derives from std::runtime_error so callers
  applying mutations can catch at a single level.
*/

// A manifest blob did not decode into a KeySet.
class MalformedManifest : public std::runtime_error {
 public:
  explicit MalformedManifest(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The OS entropy source could not seed qualifier generation.
class EntropyUnavailable : public std::runtime_error {
 public:
  explicit EntropyUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace komorebi::util
