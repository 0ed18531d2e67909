// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "relay/media_port_reporter.hpp"
#include "network/http_client.hpp"
#include "relay/control_channel.hpp"
#include "util/logging.hpp"

namespace kvmrelay {
namespace relay {

MediaPortReporter::MediaPortReporter(
    std::shared_ptr<network::HttpClient> http, std::string relay_ip,
    uint16_t relay_port)
    : http_(std::move(http)), relay_ip_(std::move(relay_ip)),
      relay_port_(relay_port) {
  worker_ = std::thread(&MediaPortReporter::WorkerLoop, this);
}

MediaPortReporter::~MediaPortReporter() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    if (!queue_.empty()) {
      LOG_RELAY_DEBUG("dropping {} unsent port report(s)", queue_.size());
      queue_.clear();
    }
  }
  work_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void MediaPortReporter::Report(uint16_t media_port) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(media_port);
  }
  work_cv_.notify_one();
}

bool MediaPortReporter::Flush(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_cv_.wait_for(lock, timeout,
                           [this]() { return queue_.empty() && !busy_; });
}

void MediaPortReporter::WorkerLoop() {
  for (;;) {
    uint16_t media_port = 0;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (stopping_) {
        return;
      }
      media_port = queue_.front();
      queue_.pop_front();
      busy_ = true;
    }

    Send(media_port);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      busy_ = false;
    }
    idle_cv_.notify_all();
  }
}

void MediaPortReporter::Send(uint16_t media_port) {
  const std::string url =
      control::BuildSetMediaPortUrl(relay_ip_, relay_port_, media_port);
  network::HttpResponse res;
  try {
    res = http_->Get(url);
  } catch (const std::exception &e) {
    res.error = e.what();
  }

  if (!res.ok()) {
    // The relay keeps its previous port; media may fail to flow
    failed_++;
    LOG_RELAY_WARN("port report {} failed: {}", media_port,
                   res.error.empty() ? "HTTP " + std::to_string(res.status)
                                     : res.error);
    return;
  }
  sent_++;
  LOG_RELAY_INFO("reported media port {} to {}:{}", media_port, relay_ip_,
                 relay_port_);
}

} // namespace relay
} // namespace kvmrelay
