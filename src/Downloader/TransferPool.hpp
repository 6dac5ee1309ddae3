#ifndef DLQUEUE_TRANSFER_POOL_HPP_
#define DLQUEUE_TRANSFER_POOL_HPP_

#include <cstddef>
#include <optional>
#include <string>

#include "TaskTypes.hpp"

namespace dlqueue {

// What the queue manager needs from a pool of running transfers.
class TransferPool {
 public:
  virtual ~TransferPool() = default;

  // Starts a transfer right away. An empty result means the pool refused it;
  // the caller keeps the request and may retry later.
  virtual std::optional<TaskHandle> submit(const std::string& source,
                                           const std::string& destination) = 0;

  virtual std::optional<TaskSnapshot> status(const TaskHandle& handle) const = 0;

  // Returns false for unknown handles.
  virtual bool cancel(const TaskHandle& handle) = 0;

  // Evicts a task in a terminal state. Returns false if the handle is unknown
  // or the task is still live.
  virtual bool retire(const TaskHandle& handle) = 0;

  // Number of transfers the owner should keep in flight.
  virtual size_t capacity() const = 0;
};

}  // namespace dlqueue

#endif  // DLQUEUE_TRANSFER_POOL_HPP_
