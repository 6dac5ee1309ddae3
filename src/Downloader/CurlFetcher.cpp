#include "CurlFetcher.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <memory>
#include <string>
#include <utility>

#include "TransferErrors.hpp"
#include "curl_global.hpp"
#include "logger.hpp"

namespace dlqueue {

namespace {

using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using MultiHandle = std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)>;

class CurlResponse : public FetchResponse {
 public:
  CurlResponse(const std::string& url, const FetchOptions& options)
      : easy_(curl_easy_init(), &curl_easy_cleanup),
        multi_(curl_multi_init(), &curl_multi_cleanup),
        pollTimeoutMs_(std::max(1, options.pollTimeoutMs)) {
    errbuf_[0] = '\0';
    if (!easy_ || !multi_) {
      throw TransportError("Failed to allocate curl handle");
    }

    CURL* curl = easy_.get();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options.connectTimeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf_);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &CurlResponse::writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);

    const CURLMcode mc = curl_multi_add_handle(multi_.get(), curl);
    if (mc != CURLM_OK) {
      throw TransportError(std::string{"curl multi error: "} +
                           curl_multi_strerror(mc));
    }
    attached_ = true;
  }

  ~CurlResponse() override {
    if (attached_) {
      curl_multi_remove_handle(multi_.get(), easy_.get());
    }
  }

  // Drives the transfer until the first body byte arrives or the transfer
  // ends, whichever is first; by then the final response headers are known.
  void waitForHeaders() {
    while (!bodyStarted_ && !finished_) {
      pump();
    }
    curl_off_t length = -1;
    if (curl_easy_getinfo(easy_.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T,
                          &length) == CURLE_OK &&
        length > 0) {
      total_ = static_cast<uint64_t>(length);
    }
  }

  uint64_t totalBytes() const override { return total_; }

  bool nextChunk(std::string& chunk) override {
    chunk.clear();
    if (buffer_.empty() && !finished_) {
      pump();
    }
    if (!buffer_.empty()) {
      chunk.swap(buffer_);
      return true;
    }
    return !finished_;
  }

 private:
  static size_t writeCallback(char* ptr, size_t size, size_t nmemb,
                              void* userdata) {
    auto* self = static_cast<CurlResponse*>(userdata);
    const size_t total = size * nmemb;
    if (!self) {
      return 0;
    }
    self->bodyStarted_ = true;
    self->buffer_.append(ptr, total);
    return total;
  }

  void pump() {
    int running = 0;
    CURLMcode mc = curl_multi_perform(multi_.get(), &running);
    if (mc != CURLM_OK) {
      throw TransportError(std::string{"curl multi error: "} +
                           curl_multi_strerror(mc));
    }
    collectResult();
    if (finished_ || !buffer_.empty()) {
      return;
    }
    mc = curl_multi_poll(multi_.get(), nullptr, 0, pollTimeoutMs_, nullptr);
    if (mc != CURLM_OK) {
      throw TransportError(std::string{"curl multi error: "} +
                           curl_multi_strerror(mc));
    }
  }

  void collectResult() {
    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &queued)) {
      if (msg->msg != CURLMSG_DONE) {
        continue;
      }
      finished_ = true;
      const CURLcode res = msg->data.result;
      if (res != CURLE_OK) {
        std::string message{"curl error: "};
        message += curl_easy_strerror(res);
        if (errbuf_[0] != '\0') {
          message += std::string{" ("} + errbuf_ + ")";
        }
        throw TransportError(message);
      }
    }
  }

  EasyHandle easy_;
  MultiHandle multi_;
  int pollTimeoutMs_;
  bool attached_{false};
  bool bodyStarted_{false};
  bool finished_{false};
  uint64_t total_{0};
  std::string buffer_;
  char errbuf_[CURL_ERROR_SIZE];
};

}  // namespace

CurlFetcher::CurlFetcher(FetchOptions options) : options_(std::move(options)) {}

std::unique_ptr<FetchResponse> CurlFetcher::open(const std::string& url) {
  try {
    utils::ensureCurlInitialized();
  } catch (const std::runtime_error& e) {
    throw TransportError(e.what());
  }
  auto response = std::make_unique<CurlResponse>(url, options_);
  response->waitForHeaders();
  LOG(DEBUG) << "Response headers received for " << url
             << ", declared size: " << response->totalBytes();
  return response;
}

}  // namespace dlqueue
