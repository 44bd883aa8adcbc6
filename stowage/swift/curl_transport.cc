// Copyright (C) 2023 THL A29 Limited, a Tencent company. All rights reserved.
//
// Licensed under the BSD 3-Clause License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of the
// License at
//
// https://opensource.org/licenses/BSD-3-Clause
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS, WITHOUT
// WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the
// License for the specific language governing permissions and limitations under
// the License.

#include "stowage/swift/curl_transport.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "curl/curl.h"
#include "gflags/gflags.h"

#include "stowage/base/logging.h"
#include "stowage/base/string.h"
#include "stowage/io/pipe.h"
#include "stowage/swift/status.h"

DEFINE_int32(stowage_swift_timeout_ms, 60000,
             "Default timeout of a single request (including transfer of "
             "request and response body) made by `CurlTransport`, in "
             "milliseconds. Zero disables timeout.");
DEFINE_string(stowage_swift_user_agent, "stowage/1.0",
              "Default `User-Agent` sent by `CurlTransport`.");

namespace stowage::swift {

namespace {

void InitializeCurlOnce() {
  [[maybe_unused]] static const bool initialized = [] {
    auto ret = curl_global_init(CURL_GLOBAL_DEFAULT);
    STOWAGE_CHECK(!ret, "Curl Init failed {}", ret);
    return true;
  }();
}

// State shared between the caller and the transfer thread.
struct Transfer {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle{
      curl_easy_init(), &curl_easy_cleanup};
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list{
      nullptr, &curl_slist_free_all};
  std::string url;
  std::string custom_method;
  std::unique_ptr<PipeWriter> writer;
  std::thread thread;

  // Set once the response body is no longer wanted.
  std::atomic<bool> aborted{false};

  std::mutex lock;
  std::condition_variable cv;
  // Set once status and headers of the final response are known, or the
  // transfer failed before that.
  bool response_ready = false;
  int status = 0;
  HttpHeaders headers;
  Status failure;

  // Request body. Detached once the response is handed to the caller, who
  // is free to destroy it afterwards.
  std::mutex body_lock;
  Reader* body = nullptr;
  bool body_detached = false;
  Status body_error;
};

int GetResponseCode(CURL* handle) {
  // `CURLINFO_RESPONSE_CODE` needs a `long`.
  long code = 0;  // NOLINT
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &code);
  return static_cast<int>(code);
}

void MarkResponseReady(Transfer* transfer) {
  std::scoped_lock _(transfer->lock);
  if (transfer->response_ready) {
    return;
  }
  transfer->status = GetResponseCode(transfer->handle.get());
  transfer->response_ready = true;
  transfer->cv.notify_all();
}

// Called once for each complete header line, including status lines of
// interim (`100 Continue`) responses.
std::size_t OnResponseHeader(char* ptr, std::size_t size, std::size_t nmemb,
                             void* userdata) {
  auto transfer = static_cast<Transfer*>(userdata);
  auto bytes = size * nmemb;
  std::string_view line(ptr, bytes);
  if (EndsWith(line, "\r\n")) {
    line.remove_suffix(2);
  }

  std::scoped_lock _(transfer->lock);
  if (transfer->response_ready) {  // Trailers, ignored.
    return bytes;
  }
  if (StartsWith(line, "HTTP/")) {  // Status-Line.
    transfer->headers.clear();
    return bytes;
  }
  auto colon = line.find(':');
  if (colon == std::string_view::npos) {
    return bytes;
  }
  transfer->headers.Append(std::string(Trim(line.substr(0, colon))),
                           std::string(Trim(line.substr(colon + 1))));
  return bytes;
}

std::size_t OnResponseBody(char* ptr, std::size_t size, std::size_t nmemb,
                           void* userdata) {
  auto transfer = static_cast<Transfer*>(userdata);
  auto bytes = size * nmemb;
  MarkResponseReady(transfer);
  if (!transfer->writer->Write(std::string_view(ptr, bytes)).ok()) {
    return 0;  // Nobody is reading. Abort the transfer.
  }
  return bytes;
}

std::size_t OnRequestBody(char* buffer, std::size_t size, std::size_t nitems,
                          void* userdata) {
  auto transfer = static_cast<Transfer*>(userdata);
  std::scoped_lock _(transfer->body_lock);
  if (!transfer->body) {
    return transfer->body_detached ? CURL_READFUNC_ABORT : 0;
  }
  auto bytes = transfer->body->Read(buffer, size * nitems);
  if (!bytes) {
    transfer->body_error = bytes.error();
    return CURL_READFUNC_ABORT;
  }
  return *bytes;
}

int OnProgress(void* clientp, curl_off_t, curl_off_t, curl_off_t,
               curl_off_t) {
  return static_cast<Transfer*>(clientp)->aborted.load() ? 1 : 0;
}

void RunTransfer(Transfer* transfer) {
  auto rc = curl_easy_perform(transfer->handle.get());
  Status failure;
  if (rc != CURLE_OK) {
    std::scoped_lock _(transfer->body_lock);
    if (!transfer->body_error.ok()) {
      failure = transfer->body_error;
    } else {
      failure = Status(SwiftStatus::TransportFailure,
                       Format("{} [{}]", curl_easy_strerror(rc),
                              transfer->url));
    }
  }

  {
    std::scoped_lock _(transfer->lock);
    if (!transfer->response_ready) {
      if (failure.ok()) {
        transfer->status = GetResponseCode(transfer->handle.get());
      } else {
        transfer->failure = failure;
      }
      transfer->response_ready = true;
      transfer->cv.notify_all();
    }
  }

  if (failure.ok()) {
    transfer->writer->Close();
  } else {
    if (!transfer->aborted.load()) {
      STOWAGE_VLOG(1, "Transfer failed: {}", failure.ToString());
    }
    transfer->writer->CloseWithError(failure);
  }
}

// Streams the response body from the transfer thread. Closing it aborts the
// transfer if it's still running.
class ResponseBody : public ReadCloser {
 public:
  ResponseBody(std::unique_ptr<PipeReader> reader,
               std::unique_ptr<Transfer> transfer)
      : reader_(std::move(reader)), transfer_(std::move(transfer)) {}

  ~ResponseBody() override { (void)Close(); }

  Expected<std::size_t, Status> Read(void* buffer, std::size_t size) override {
    return reader_->Read(buffer, size);
  }

  Status Close() override {
    if (!transfer_) {
      return {};
    }
    transfer_->aborted.store(true);
    (void)reader_->Close();
    transfer_->thread.join();
    transfer_ = nullptr;
    return {};
  }

 private:
  std::unique_ptr<PipeReader> reader_;
  std::unique_ptr<Transfer> transfer_;
};

void SetMethod(Transfer* transfer, const TransportRequest& request) {
  auto handle = transfer->handle.get();
  auto method = request.method;
  // Size of the request body, `-1` if unknown.
  curl_off_t body_size =
      request.content_length ? static_cast<curl_off_t>(*request.content_length)
                             : (request.body ? -1 : 0);

  if (method == HttpMethod::Head) {
    STOWAGE_CHECK_EQ(CURLE_OK, curl_easy_setopt(handle, CURLOPT_NOBODY, 1L));
  } else if (method == HttpMethod::Get) {
    STOWAGE_CHECK_EQ(CURLE_OK, curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L));
  } else if (method == HttpMethod::Post) {
    STOWAGE_CHECK_EQ(CURLE_OK, curl_easy_setopt(handle, CURLOPT_POST, 1L));
    STOWAGE_CHECK_EQ(CURLE_OK, curl_easy_setopt(handle,
                                                CURLOPT_POSTFIELDSIZE_LARGE,
                                                body_size));
  } else if (method == HttpMethod::Put) {
    STOWAGE_CHECK_EQ(CURLE_OK, curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L));
    STOWAGE_CHECK_EQ(CURLE_OK, curl_easy_setopt(handle,
                                                CURLOPT_INFILESIZE_LARGE,
                                                body_size));
  } else {
    STOWAGE_CHECK(method != HttpMethod::Unspecified,
                  "HTTP method is not specified.");
    transfer->custom_method = std::string(ToStringView(method));
    STOWAGE_CHECK_EQ(CURLE_OK,
                     curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST,
                                      transfer->custom_method.c_str()));
  }

  if (method == HttpMethod::Post || method == HttpMethod::Put) {
    transfer->body = request.body;
    STOWAGE_CHECK_EQ(CURLE_OK, curl_easy_setopt(handle, CURLOPT_READFUNCTION,
                                                OnRequestBody));
    STOWAGE_CHECK_EQ(CURLE_OK,
                     curl_easy_setopt(handle, CURLOPT_READDATA, transfer));
  } else {
    STOWAGE_CHECK(!request.body, "{} request should not carry a body.",
                  ToStringView(method));
  }
}

}  // namespace

CurlTransport::CurlTransport(Options options) : options_(std::move(options)) {
  STOWAGE_CHECK(!options_.endpoint_url.empty(), "No endpoint URL was given.");
  if (!EndsWith(options_.endpoint_url, "/")) {
    options_.endpoint_url += "/";
  }
  if (options_.timeout.count() < 0) {
    options_.timeout =
        std::chrono::milliseconds(FLAGS_stowage_swift_timeout_ms);
  }
  if (options_.user_agent.empty()) {
    options_.user_agent = FLAGS_stowage_swift_user_agent;
  }
  InitializeCurlOnce();
}

Expected<TransportResponse, Status> CurlTransport::Perform(
    const TransportRequest& request) {
  auto transfer = std::make_unique<Transfer>();
  STOWAGE_CHECK(transfer->handle, "Failed to create curl handle.");
  auto handle = transfer->handle.get();
  auto pipe = MakePipe(options_.body_buffer_size);
  transfer->writer = std::move(pipe.writer);
  transfer->url =
      request.url.empty() ? options_.endpoint_url + request.path : request.url;

  STOWAGE_CHECK_EQ(CURLE_OK, curl_easy_setopt(handle, CURLOPT_URL,
                                              transfer->url.c_str()));
  SetMethod(transfer.get(), request);

  for (auto&& [k, v] : request.headers) {
    // Set by libcurl.
    if (IEquals(k, "Content-Length") || IEquals(k, "User-Agent")) {
      continue;
    }
    transfer->header_list.reset(
        curl_slist_append(transfer->header_list.release(),
                          detail::FormatCurlHeader(k, v).c_str()));
  }
  if (!options_.auth_token.empty()) {
    transfer->header_list.reset(
        curl_slist_append(transfer->header_list.release(),
                          detail::FormatCurlHeader("X-Auth-Token",
                                                   options_.auth_token)
                              .c_str()));
  }
  STOWAGE_CHECK_EQ(CURLE_OK, curl_easy_setopt(handle, CURLOPT_HTTPHEADER,
                                              transfer->header_list.get()));
  STOWAGE_CHECK_EQ(CURLE_OK, curl_easy_setopt(handle, CURLOPT_USERAGENT,
                                              options_.user_agent.c_str()));
  STOWAGE_CHECK_EQ(CURLE_OK,
                   curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS,
                                    static_cast<long>(  // NOLINT
                                        options_.timeout.count())));
  STOWAGE_CHECK_EQ(CURLE_OK, curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L));
  STOWAGE_CHECK_EQ(CURLE_OK, curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION,
                                              OnResponseBody));
  STOWAGE_CHECK_EQ(CURLE_OK,
                   curl_easy_setopt(handle, CURLOPT_WRITEDATA, transfer.get()));
  STOWAGE_CHECK_EQ(CURLE_OK, curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION,
                                              OnResponseHeader));
  STOWAGE_CHECK_EQ(CURLE_OK, curl_easy_setopt(handle, CURLOPT_HEADERDATA,
                                              transfer.get()));
  STOWAGE_CHECK_EQ(CURLE_OK, curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION,
                                              OnProgress));
  STOWAGE_CHECK_EQ(CURLE_OK, curl_easy_setopt(handle, CURLOPT_XFERINFODATA,
                                              transfer.get()));
  STOWAGE_CHECK_EQ(CURLE_OK, curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L));

  transfer->thread = std::thread([t = transfer.get()] { RunTransfer(t); });
  {
    std::unique_lock lk(transfer->lock);
    transfer->cv.wait(lk, [&] { return transfer->response_ready; });
  }
  {
    std::scoped_lock _(transfer->body_lock);
    transfer->body = nullptr;
    transfer->body_detached = true;
  }

  if (!transfer->failure.ok()) {
    transfer->thread.join();
    return transfer->failure;
  }
  TransportResponse response;
  response.status = transfer->status;
  response.headers = std::move(transfer->headers);
  response.body = std::make_unique<ResponseBody>(std::move(pipe.reader),
                                                 std::move(transfer));
  return response;
}

std::unique_ptr<Transport> CurlTransport::Clone(
    const std::string& endpoint_url) const {
  auto options = options_;
  options.endpoint_url = endpoint_url;
  return std::make_unique<CurlTransport>(std::move(options));
}

namespace detail {

std::string FormatCurlHeader(std::string_view key, std::string_view value) {
  if (value.empty()) {
    return Format("{};", key);
  }
  return Format("{}: {}", key, value);
}

}  // namespace detail

}  // namespace stowage::swift
