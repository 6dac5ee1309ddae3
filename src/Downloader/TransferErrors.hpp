#ifndef DLQUEUE_TRANSFER_ERRORS_HPP_
#define DLQUEUE_TRANSFER_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace dlqueue {

// Raised inside a worker only. The pool catches these at the thread boundary
// and records them as a Failed task; they never reach submit() callers.

// Destination directory or file could not be created/opened. Nothing was
// written, so no cleanup is attempted.
class DestinationPrepareError : public std::runtime_error {
 public:
  explicit DestinationPrepareError(const std::string& what)
      : std::runtime_error(what) {}
};

// Connection or HTTP-level failure reported by the fetch collaborator.
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& what)
      : std::runtime_error(what) {}
};

// Any other fault during execution (e.g. a short write).
class UnexpectedError : public std::runtime_error {
 public:
  explicit UnexpectedError(const std::string& what)
      : std::runtime_error(what) {}
};

}  // namespace dlqueue

#endif  // DLQUEUE_TRANSFER_ERRORS_HPP_
