// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace kvmrelay {
namespace network {
class HttpClient;
}

namespace relay {

/**
 * MediaPortReporter - sends port-learning requests off the caller's thread
 *
 * Report() only queues the port; a worker thread issues
 *   GET http://<relay_ip>:<relay_port>/_relay/set-media-port?port=N
 * for each queued port in order. A slow or unreachable relay never holds
 * up the negotiation messages being rewritten. Failures are logged and
 * counted, never retried.
 */
class MediaPortReporter {
public:
  MediaPortReporter(std::shared_ptr<network::HttpClient> http,
                    std::string relay_ip, uint16_t relay_port);

  // Pending reports are dropped; an in-flight request is waited for
  ~MediaPortReporter();

  MediaPortReporter(const MediaPortReporter &) = delete;
  MediaPortReporter &operator=(const MediaPortReporter &) = delete;

  void Report(uint16_t media_port);

  // Wait until every queued report has been attempted.
  // Returns false if that did not happen within `timeout`.
  bool Flush(std::chrono::milliseconds timeout);

  uint64_t sent() const { return sent_; }
  uint64_t failed() const { return failed_; }

private:
  void WorkerLoop();
  void Send(uint16_t media_port);

  std::shared_ptr<network::HttpClient> http_;
  std::string relay_ip_;
  uint16_t relay_port_;

  std::atomic<uint64_t> sent_{0};
  std::atomic<uint64_t> failed_{0};

  std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<uint16_t> queue_;
  bool busy_{false};
  bool stopping_{false};
  std::thread worker_;
};

} // namespace relay
} // namespace kvmrelay
