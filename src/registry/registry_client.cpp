// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "registry/registry_client.hpp"
#include "relay/port_allocator.hpp"
#include "util/logging.hpp"

namespace kvmrelay {
namespace registry {

using json = nlohmann::json;

RegistryClient::RegistryClient(Config config,
                               std::shared_ptr<network::HttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {}

RegistryClient::~RegistryClient() { StopHeartbeat(); }

std::string RegistryClient::DefaultDisplayName(const std::string &device_ip) {
  int last = relay::PortAllocator::LastOctet(device_ip);
  if (last < 0) {
    return "KVM-" + device_ip;
  }
  return "KVM-" + std::to_string(last);
}

json RegistryClient::BuildRegistration(
    const std::vector<relay::RelayInfo> &entries, const std::string &overlay_ip,
    const std::string &location) {
  json devices = json::array();
  for (const auto &e : entries) {
    json d;
    d["kvm_local_ip"] = e.device_ip;
    d["kvm_port"] = e.device_port;
    d["kvm_name"] = e.display_name.empty() ? DefaultDisplayName(e.device_ip)
                                           : e.display_name;
    d["relay_port"] = e.tcp_listen_port;
    d["udp_relay_port"] = e.udp_listen_port;
    devices.push_back(std::move(d));
  }

  json record;
  record["devices"] = std::move(devices);
  record["relay_zt_ip"] = overlay_ip;
  record["location"] = location;
  return record;
}

json RegistryClient::BuildHeartbeat(const std::string &overlay_ip) {
  return json{{"relay_zt_ip", overlay_ip}};
}

relay::RelayError
RegistryClient::Register(const std::vector<relay::RelayInfo> &entries,
                         const std::optional<std::string> &overlay_ip,
                         const std::string &location) {
  if (entries.empty()) {
    LOG_REG_DEBUG("no running relays, skipping registration");
    return relay::RelayError::NONE;
  }
  if (!overlay_ip) {
    LOG_REG_WARN("no overlay address, skipping registration of {} relay(s)",
                 entries.size());
    return relay::RelayError::OVERLAY_IDENTITY_UNAVAILABLE;
  }
  if (config_.api_url.empty() || !http_) {
    LOG_REG_DEBUG("no directory service configured");
    return relay::RelayError::NONE;
  }

  const std::string url = config_.api_url + config_.register_path;
  const std::string body =
      BuildRegistration(entries, *overlay_ip, location).dump();

  network::HttpResponse res;
  try {
    res = http_->PostJson(url, body);
  } catch (const std::exception &e) {
    LOG_REG_ERROR("registration request threw: {}", e.what());
    return relay::RelayError::REGISTRATION_FAILED;
  }

  if (!res.ok()) {
    if (!res.error.empty()) {
      LOG_REG_ERROR("registration failed: {}", res.error);
    } else {
      LOG_REG_ERROR("registration rejected: HTTP {} {}", res.status, res.body);
    }
    return relay::RelayError::REGISTRATION_FAILED;
  }

  registrations_sent_++;
  LOG_REG_INFO("registered {} relay(s) as {}", entries.size(), *overlay_ip);
  return relay::RelayError::NONE;
}

relay::RelayError RegistryClient::SendHeartbeat(const std::string &overlay_ip) {
  if (config_.api_url.empty() || !http_) {
    return relay::RelayError::NONE;
  }

  network::HttpResponse res;
  try {
    res = http_->PostJson(config_.api_url + config_.heartbeat_path,
                          BuildHeartbeat(overlay_ip).dump());
  } catch (const std::exception &e) {
    res.error = e.what();
  }

  if (!res.ok()) {
    heartbeat_failures_++;
    LOG_REG_WARN("heartbeat failed: {}",
                 res.error.empty() ? "HTTP " + std::to_string(res.status)
                                   : res.error);
    return relay::RelayError::HEARTBEAT_FAILED;
  }

  heartbeats_sent_++;
  LOG_REG_TRACE("heartbeat ok ({})", overlay_ip);
  return relay::RelayError::NONE;
}

bool RegistryClient::StartHeartbeat(std::chrono::milliseconds interval,
                                    RunningProbe any_running,
                                    IdentityProbe overlay_ip) {
  if (heartbeat_running_.exchange(true)) {
    LOG_REG_TRACE("heartbeat already running");
    return false;
  }

  LOG_REG_DEBUG("heartbeat every {} ms", interval.count());
  heartbeat_thread_ =
      std::thread(&RegistryClient::HeartbeatLoop, this, interval,
                  std::move(any_running), std::move(overlay_ip));
  return true;
}

void RegistryClient::StopHeartbeat() {
  {
    std::lock_guard<std::mutex> lock(heartbeat_mutex_);
    if (!heartbeat_running_.exchange(false)) {
      return;
    }
  }
  heartbeat_cv_.notify_all();
  if (heartbeat_thread_.joinable()) {
    heartbeat_thread_.join();
  }
  LOG_REG_DEBUG("heartbeat stopped");
}

void RegistryClient::HeartbeatLoop(std::chrono::milliseconds interval,
                                   RunningProbe any_running,
                                   IdentityProbe overlay_ip) {
  std::unique_lock<std::mutex> lock(heartbeat_mutex_);
  while (heartbeat_running_) {
    lock.unlock();
    try {
      if (any_running && any_running()) {
        auto ip = overlay_ip ? overlay_ip() : std::nullopt;
        if (ip) {
          SendHeartbeat(*ip);
        } else {
          LOG_REG_DEBUG("heartbeat skipped: no overlay address");
        }
      }
    } catch (const std::exception &e) {
      heartbeat_failures_++;
      LOG_REG_ERROR("heartbeat tick failed: {}", e.what());
    }
    lock.lock();

    if (heartbeat_cv_.wait_for(lock, interval,
                               [this]() { return !heartbeat_running_; })) {
      break; // stop requested
    }
  }
}

} // namespace registry
} // namespace kvmrelay
