// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "rpc/rpc_client.hpp"
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace kvmrelay {
namespace rpc {

using json = nlohmann::json;

namespace {

// Closes the descriptor on every exit path
class ScopedFd {
public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() {
    if (fd_ >= 0) {
      close(fd_);
    }
  }
  ScopedFd(const ScopedFd &) = delete;
  ScopedFd &operator=(const ScopedFd &) = delete;

  int get() const { return fd_; }

private:
  int fd_;
};

std::string Errno() { return std::strerror(errno); }

} // namespace

RPCClient::RPCClient(std::string socket_path, std::chrono::seconds timeout)
    : socket_path_(std::move(socket_path)), timeout_(timeout) {}

json RPCClient::Call(const std::string &method,
                     const std::vector<std::string> &params) const {
  struct sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  if (socket_path_.size() >= sizeof(addr.sun_path)) {
    throw RPCError("socket path too long: " + socket_path_);
  }
  std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

  ScopedFd fd(socket(AF_UNIX, SOCK_STREAM, 0));
  if (fd.get() < 0) {
    throw RPCError("cannot create socket: " + Errno());
  }
  if (connect(fd.get(), reinterpret_cast<struct sockaddr *>(&addr),
              sizeof(addr)) < 0) {
    throw RPCError("cannot connect to kvmrelayd at " + socket_path_ + ": " +
                   Errno());
  }

  struct timeval tv;
  tv.tv_sec = static_cast<time_t>(timeout_.count());
  tv.tv_usec = 0;
  setsockopt(fd.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(fd.get(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

  std::string request = json{{"method", method}, {"params", params}}.dump();
  request.push_back('\n');

  size_t sent = 0;
  while (sent < request.size()) {
    ssize_t n = send(fd.get(), request.data() + sent, request.size() - sent,
                     MSG_NOSIGNAL);
    if (n <= 0) {
      throw RPCError("failed to send " + method + ": " + Errno());
    }
    sent += static_cast<size_t>(n);
  }

  // Reply ends when the daemon closes
  std::string response;
  char buffer[4096];
  for (;;) {
    ssize_t n = recv(fd.get(), buffer, sizeof(buffer), 0);
    if (n < 0) {
      throw RPCError("no reply to " + method + ": " + Errno());
    }
    if (n == 0) {
      break;
    }
    response.append(buffer, static_cast<size_t>(n));
  }

  json reply = json::parse(response, nullptr, false);
  if (reply.is_discarded()) {
    throw RPCError("malformed reply to " + method);
  }
  return reply;
}

json RPCClient::Checked(const std::string &method,
                        const std::vector<std::string> &params) const {
  json reply = Call(method, params);
  if (reply.is_object() && reply.contains("error")) {
    const json &error = reply["error"];
    throw RPCError(error.is_string() ? error.get<std::string>() : error.dump());
  }
  return reply;
}

json RPCClient::StartRelay(const std::string &device_ip, uint16_t device_port,
                           const std::string &name) const {
  std::vector<std::string> params{device_ip, std::to_string(device_port)};
  if (!name.empty()) {
    params.push_back(name);
  }
  return Checked("startrelay", params);
}

bool RPCClient::StopRelay(const std::string &device_ip,
                          uint16_t device_port) const {
  json reply = Checked("stoprelay", {device_ip, std::to_string(device_port)});
  return reply.value("stopped", false);
}

json RPCClient::ListRelays() const { return Checked("listrelays"); }

json RPCClient::Register() const { return Checked("register"); }

json RPCClient::GetInfo() const { return Checked("getinfo"); }

void RPCClient::Stop() const { Checked("stop"); }

} // namespace rpc
} // namespace kvmrelay
