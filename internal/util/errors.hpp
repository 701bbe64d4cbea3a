#pragma once

#include <stdexcept>
#include <string>

namespace slideshow::util {

/*
  Central error types.

  The composition core never throws on pool contents; these cover config,
  input files and API misuse. The CLI maps them to exit codes.
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace slideshow::util
