#ifndef INCLUDE_SNIPBOX_ERRORS_H_
#define INCLUDE_SNIPBOX_ERRORS_H_

#include <stdexcept>

// Caller bugs: conflicting options, unpinned packages, malformed policy.
// Thrown before any process or container is started.
class ConfigError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// Failures of administrative container operations (list/stop/kill/cleanup).
class ContainerError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

#endif  // INCLUDE_SNIPBOX_ERRORS_H_
