#ifndef __NOMAD_SETUP_ERRORS__
#define __NOMAD_SETUP_ERRORS__

#include "Headers.hpp"

namespace nomad {
/**
 * @brief A caller-supplied value cannot be used (empty host or user, port
 * out of range, malformed payload).
 */
class InvalidArgument : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

/**
 * @brief The target account or its home directory could not be determined.
 */
class ResolutionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief A filesystem operation on the key-authorization file was refused.
 */
class PermissionError : public std::runtime_error {
 public:
  PermissionError(const string& what, const string& path, int err)
      : std::runtime_error(what + " " + path + ": " + strerror(err)),
        path_(path),
        errno_(err) {}

  const string& path() const { return path_; }
  int error() const { return errno_; }

 private:
  string path_;
  int errno_;
};
}  // namespace nomad

#endif  // __NOMAD_SETUP_ERRORS__
