#ifndef DLQUEUE_FETCHER_HPP_
#define DLQUEUE_FETCHER_HPP_

#include <cstdint>
#include <memory>
#include <string>

namespace dlqueue {

// Body of an in-flight response, read as a lazy sequence of chunks.
class FetchResponse {
 public:
  virtual ~FetchResponse() = default;

  // Declared size from the response headers, 0 when unknown.
  virtual uint64_t totalBytes() const = 0;

  // Replaces `chunk` with the next piece of the body. Returns false once the
  // stream has ended. May return true with an empty chunk when no data
  // arrived in time, so callers still reach a checkpoint on a slow link.
  // Throws TransportError on connection/HTTP failure.
  virtual bool nextChunk(std::string& chunk) = 0;
};

class Fetcher {
 public:
  virtual ~Fetcher() = default;

  // Starts a request and returns once response headers are available.
  // Throws TransportError if the request fails before that point.
  virtual std::unique_ptr<FetchResponse> open(const std::string& url) = 0;
};

}  // namespace dlqueue

#endif  // DLQUEUE_FETCHER_HPP_
