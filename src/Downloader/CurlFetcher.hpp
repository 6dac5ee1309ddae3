#ifndef DLQUEUE_CURL_FETCHER_HPP_
#define DLQUEUE_CURL_FETCHER_HPP_

#include <memory>
#include <string>

#include "Fetcher.hpp"

namespace dlqueue {

struct FetchOptions {
  long connectTimeoutSeconds = 30;
  // Upper bound on how long nextChunk() waits for data before returning an
  // empty chunk.
  int pollTimeoutMs = 200;
  std::string userAgent = "dlqueue/1.0";
};

// HTTP(S) fetcher on top of the libcurl multi interface. Each response owns
// its own easy+multi handle pair and is driven by the thread calling
// nextChunk(), which keeps all network waits outside any pool lock.
class CurlFetcher : public Fetcher {
 public:
  explicit CurlFetcher(FetchOptions options = FetchOptions());

  std::unique_ptr<FetchResponse> open(const std::string& url) override;

 private:
  FetchOptions options_;
};

}  // namespace dlqueue

#endif  // DLQUEUE_CURL_FETCHER_HPP_
