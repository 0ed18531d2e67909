// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "rpc/rpc_server.hpp"
#include "network/overlay_identity.hpp"
#include "relay/relay_manager.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <cerrno>
#include <cstring>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace kvmrelay {
namespace rpc {

using json = nlohmann::json;

namespace {

constexpr size_t MAX_REQUEST_SIZE = 64 * 1024;
constexpr uint16_t DEFAULT_DEVICE_PORT = 80;

std::string Reply(const json &j) { return j.dump(2) + "\n"; }

std::string ErrorReply(const std::string &message) {
  return Reply(json{{"error", message}});
}

uint16_t ParsePortParam(const std::vector<std::string> &params, size_t index) {
  if (params.size() <= index) {
    return DEFAULT_DEVICE_PORT;
  }
  size_t consumed = 0;
  int port = std::stoi(params[index], &consumed);
  if (consumed != params[index].size() || port <= 0 || port > 65535) {
    throw std::invalid_argument("invalid port: " + params[index]);
  }
  return static_cast<uint16_t>(port);
}

void SendAll(int fd, const std::string &payload) {
  size_t sent = 0;
  while (sent < payload.size()) {
    ssize_t n = send(fd, payload.data() + sent, payload.size() - sent,
                     MSG_NOSIGNAL);
    if (n <= 0) {
      LOG_RPC_DEBUG("client went away before the reply was sent");
      return;
    }
    sent += static_cast<size_t>(n);
  }
}

} // namespace

RPCServer::RPCServer(const std::string &socket_path,
                     relay::RelayManager &relay_manager,
                     network::OverlayIdentity &identity,
                     RegisterCallback register_callback,
                     std::function<void()> shutdown_callback)
    : socket_path_(socket_path), relay_manager_(relay_manager),
      identity_(identity), register_callback_(std::move(register_callback)),
      shutdown_callback_(std::move(shutdown_callback)), server_fd_(-1),
      running_(false) {
  RegisterHandlers();
}

RPCServer::~RPCServer() { Stop(); }

void RPCServer::RegisterHandlers() {
  handlers_["startrelay"] = [this](const auto &p) {
    return HandleStartRelay(p);
  };
  handlers_["stoprelay"] = [this](const auto &p) {
    return HandleStopRelay(p);
  };
  handlers_["listrelays"] = [this](const auto &p) {
    return HandleListRelays(p);
  };
  handlers_["register"] = [this](const auto &p) { return HandleRegister(p); };
  handlers_["getinfo"] = [this](const auto &p) { return HandleGetInfo(p); };
  handlers_["stop"] = [this](const auto &p) { return HandleStop(p); };
}

bool RPCServer::Start() {
  if (running_) {
    return true;
  }

  // Remove a stale socket file left by an unclean exit
  unlink(socket_path_.c_str());

  server_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
  if (server_fd_ < 0) {
    LOG_RPC_ERROR("failed to create RPC socket: {}", std::strerror(errno));
    return false;
  }

  struct sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  if (socket_path_.size() >= sizeof(addr.sun_path)) {
    LOG_RPC_ERROR("RPC socket path too long: {}", socket_path_);
    close(server_fd_);
    server_fd_ = -1;
    return false;
  }
  std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

  if (bind(server_fd_, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
    LOG_RPC_ERROR("failed to bind RPC socket to {}: {}", socket_path_,
                  std::strerror(errno));
    close(server_fd_);
    server_fd_ = -1;
    return false;
  }

  if (listen(server_fd_, 5) < 0) {
    LOG_RPC_ERROR("failed to listen on RPC socket: {}", std::strerror(errno));
    close(server_fd_);
    server_fd_ = -1;
    return false;
  }

  running_ = true;
  server_thread_ = std::thread(&RPCServer::ServerThread, this);

  LOG_RPC_INFO("RPC server started on {}", socket_path_);
  return true;
}

void RPCServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  if (server_fd_ >= 0) {
    // shutdown() wakes the thread blocked in accept()
    shutdown(server_fd_, SHUT_RDWR);
    close(server_fd_);
    server_fd_ = -1;
  }

  if (server_thread_.joinable()) {
    server_thread_.join();
  }

  unlink(socket_path_.c_str());

  LOG_RPC_INFO("RPC server stopped");
}

void RPCServer::ServerThread() {
  const int listen_fd = server_fd_;
  while (running_) {
    struct sockaddr_un client_addr;
    socklen_t client_len = sizeof(client_addr);

    int client_fd =
        accept(listen_fd, (struct sockaddr *)&client_addr, &client_len);
    if (client_fd < 0) {
      if (running_) {
        LOG_RPC_WARN("failed to accept RPC connection: {}",
                     std::strerror(errno));
      }
      continue;
    }

    // Keep a stalled client from wedging the accept loop
    struct timeval tv;
    tv.tv_sec = 10;
    tv.tv_usec = 0;
    setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    HandleClient(client_fd);
    close(client_fd);
  }
}

void RPCServer::HandleClient(int client_fd) {
  std::string request;
  char buf[4096];
  while (request.find('\n') == std::string::npos) {
    ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
    if (n < 0) {
      return; // timed out or error
    }
    if (n == 0) {
      break; // EOF
    }
    request.append(buf, buf + n);
    if (request.size() > MAX_REQUEST_SIZE) {
      SendAll(client_fd, ErrorReply("Request too large"));
      return;
    }
  }

  while (!request.empty() &&
         (request.back() == '\n' || request.back() == '\r')) {
    request.pop_back();
  }
  if (request.empty()) {
    return;
  }

  json j = json::parse(request, nullptr, false);
  if (j.is_discarded() || !j.is_object() || !j.contains("method") ||
      !j["method"].is_string()) {
    SendAll(client_fd, ErrorReply("Missing or invalid method field"));
    return;
  }

  std::vector<std::string> params;
  if (j.contains("params")) {
    if (!j["params"].is_array()) {
      SendAll(client_fd, ErrorReply("params must be an array"));
      return;
    }
    for (const auto &p : j["params"]) {
      params.push_back(p.is_string() ? p.get<std::string>() : p.dump());
    }
  }

  const std::string method = j["method"].get<std::string>();
  LOG_RPC_DEBUG("rpc: {} ({} params)", method, params.size());

  SendAll(client_fd, ExecuteCommand(method, params));
}

std::string RPCServer::ExecuteCommand(const std::string &method,
                                      const std::vector<std::string> &params) {
  auto it = handlers_.find(method);
  if (it == handlers_.end()) {
    return ErrorReply("Unknown command: " + method);
  }

  try {
    return it->second(params);
  } catch (const std::exception &e) {
    return ErrorReply(e.what());
  }
}

std::string
RPCServer::HandleStartRelay(const std::vector<std::string> &params) {
  if (params.empty()) {
    return ErrorReply("Usage: startrelay <device_ip> [port] [name]");
  }

  const std::string &ip = params[0];
  uint16_t port = ParsePortParam(params, 1);
  std::string name = params.size() > 2 ? params[2] : "";

  auto result = relay_manager_.start_relay(ip, port, name);
  if (!result.ok()) {
    return ErrorReply(relay::RelayErrorString(result.error));
  }

  json reply;
  reply["device"] = ip + ":" + std::to_string(port);
  reply["relay_port"] = result.tcp_listen_port;
  reply["udp_relay_port"] = result.udp_listen_port;
  auto overlay_ip = identity_.get();
  reply["url"] = overlay_ip ? "http://" + *overlay_ip + ":" +
                                  std::to_string(result.tcp_listen_port)
                            : "";
  return Reply(reply);
}

std::string RPCServer::HandleStopRelay(const std::vector<std::string> &params) {
  if (params.empty()) {
    return ErrorReply("Usage: stoprelay <device_ip> [port]");
  }
  bool stopped = relay_manager_.stop_relay(params[0], ParsePortParam(params, 1));
  return Reply(json{{"stopped", stopped}});
}

std::string
RPCServer::HandleListRelays(const std::vector<std::string> &params) {
  json out = json::array();
  for (const auto &info : relay_manager_.list_relays()) {
    json r;
    r["device_ip"] = info.device_ip;
    r["device_port"] = info.device_port;
    r["name"] = info.display_name;
    r["relay_port"] = info.tcp_listen_port;
    r["udp_relay_port"] = info.udp_listen_port;
    r["media_port"] = info.udp_target_port ? json(*info.udp_target_port)
                                           : json(nullptr);
    r["running"] = info.running;
    r["url"] = info.access_url;
    out.push_back(std::move(r));
  }
  return Reply(out);
}

std::string RPCServer::HandleRegister(const std::vector<std::string> &params) {
  if (!register_callback_) {
    return ErrorReply("No directory service configured");
  }
  relay::RelayError err = register_callback_();
  return Reply(json{{"result", relay::RelayErrorString(err)},
                    {"ok", err == relay::RelayError::NONE}});
}

std::string RPCServer::HandleGetInfo(const std::vector<std::string> &params) {
  auto overlay_ip = identity_.get();

  json info;
  info["version"] = GetVersionString();
  info["overlay_ip"] = overlay_ip ? json(*overlay_ip) : json(nullptr);
  info["overlay_prefix"] = identity_.prefix();
  info["relays"] = relay_manager_.relay_count();
  info["running"] = relay_manager_.has_running_relays();
  return Reply(info);
}

std::string RPCServer::HandleStop(const std::vector<std::string> &params) {
  LOG_RPC_INFO("received stop command via RPC");

  if (shutdown_callback_) {
    shutdown_callback_();
  }

  return Reply(json("kvmrelay stopping"));
}

} // namespace rpc
} // namespace kvmrelay
