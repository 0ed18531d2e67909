// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KVMRELAY_RPC_RPC_CLIENT_HPP
#define KVMRELAY_RPC_RPC_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace kvmrelay {
namespace rpc {

// Daemon unreachable, transport failure, or an {"error": ...} reply
class RPCError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Client side of kvmrelayd's control socket
 *
 * Every call opens its own connection: the daemon answers one request and
 * closes. The typed helpers throw RPCError when the daemon replies with an
 * error object; Call() hands back whatever JSON arrived.
 */
class RPCClient {
public:
    explicit RPCClient(std::string socket_path,
                       std::chrono::seconds timeout = std::chrono::seconds(30));

    nlohmann::json Call(const std::string& method,
                        const std::vector<std::string>& params = {}) const;

    // {"device", "relay_port", "udp_relay_port", "url"?}
    nlohmann::json StartRelay(const std::string& device_ip, uint16_t device_port = 80,
                              const std::string& name = "") const;

    // True if a relay was running for the device
    bool StopRelay(const std::string& device_ip, uint16_t device_port = 80) const;

    // Array of relay records
    nlohmann::json ListRelays() const;

    nlohmann::json Register() const;
    nlohmann::json GetInfo() const;

    // Ask the daemon to shut down
    void Stop() const;

    const std::string& socket_path() const { return socket_path_; }

private:
    nlohmann::json Checked(const std::string& method,
                           const std::vector<std::string>& params = {}) const;

    std::string socket_path_;
    std::chrono::seconds timeout_;
};

} // namespace rpc
} // namespace kvmrelay

#endif // KVMRELAY_RPC_RPC_CLIENT_HPP
