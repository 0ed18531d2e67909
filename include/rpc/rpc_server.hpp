// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KVMRELAY_RPC_RPC_SERVER_HPP
#define KVMRELAY_RPC_RPC_SERVER_HPP

#include "relay/relay_types.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace kvmrelay {

// Forward declarations
namespace network { class OverlayIdentity; }
namespace relay { class RelayManager; }

namespace rpc {

/**
 * Local control server using Unix domain sockets
 *
 * Handles one newline-terminated JSON request per connection:
 *   {"method":"startrelay","params":["192.168.1.20","80","desk"]}
 * and answers with a JSON document followed by a newline.
 */
class RPCServer {
public:
    using CommandHandler = std::function<std::string(const std::vector<std::string>&)>;
    using RegisterCallback = std::function<relay::RelayError()>;

    /**
     * Constructor
     * @param socket_path Path to Unix domain socket
     * @param relay_manager Relay table to operate on
     * @param identity Overlay identity of this host
     * @param register_callback Re-announces running relays (optional)
     * @param shutdown_callback Callback to trigger graceful shutdown
     */
    RPCServer(const std::string& socket_path,
              relay::RelayManager& relay_manager,
              network::OverlayIdentity& identity,
              RegisterCallback register_callback = nullptr,
              std::function<void()> shutdown_callback = nullptr);
    ~RPCServer();

    bool Start();
    void Stop();
    bool IsRunning() const { return running_; }

    /**
     * Execute one command (also used directly by tests)
     */
    std::string ExecuteCommand(const std::string& method,
                               const std::vector<std::string>& params);

private:
    void ServerThread();
    void HandleClient(int client_fd);
    void RegisterHandlers();

    std::string HandleStartRelay(const std::vector<std::string>& params);
    std::string HandleStopRelay(const std::vector<std::string>& params);
    std::string HandleListRelays(const std::vector<std::string>& params);
    std::string HandleRegister(const std::vector<std::string>& params);
    std::string HandleGetInfo(const std::vector<std::string>& params);
    std::string HandleStop(const std::vector<std::string>& params);

    std::string socket_path_;
    relay::RelayManager& relay_manager_;
    network::OverlayIdentity& identity_;
    RegisterCallback register_callback_;
    std::function<void()> shutdown_callback_;

    int server_fd_;
    std::atomic<bool> running_;
    std::thread server_thread_;

    std::map<std::string, CommandHandler> handlers_;
};

} // namespace rpc
} // namespace kvmrelay

#endif // KVMRELAY_RPC_RPC_SERVER_HPP
