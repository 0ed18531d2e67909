// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "registry/registry_client.hpp"
#include "test_helpers.hpp"
#include <catch2/catch_test_macros.hpp>
#include <mutex>

using namespace kvmrelay;
using namespace kvmrelay::registry;
using relay::RelayError;
using relay::RelayInfo;
using json = nlohmann::json;

namespace {

// Records every request and answers with a configurable status
class FakeHttpClient : public network::HttpClient {
public:
    struct Call {
        std::string method;
        std::string url;
        std::string body;
    };

    network::HttpResponse Get(const std::string& url) override {
        return Record("GET", url, "");
    }

    network::HttpResponse PostJson(const std::string& url, const std::string& body) override {
        return Record("POST", url, body);
    }

    void set_status(int status) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
    }
    void set_error(std::string error) {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = std::move(error);
    }
    void set_throw(bool t) {
        std::lock_guard<std::mutex> lock(mutex_);
        throw_ = t;
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }
    size_t call_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

private:
    network::HttpResponse Record(const std::string& method, const std::string& url,
                                 const std::string& body) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back({method, url, body});
        if (throw_) {
            throw std::runtime_error("boom");
        }
        network::HttpResponse res;
        res.status = error_.empty() ? status_ : 0;
        res.error = error_;
        return res;
    }

    mutable std::mutex mutex_;
    std::vector<Call> calls_;
    int status_{200};
    std::string error_;
    bool throw_{false};
};

RelayInfo MakeInfo(const std::string& ip, uint16_t port, const std::string& name,
                   uint16_t tcp, uint16_t udp) {
    RelayInfo info;
    info.device_ip = ip;
    info.device_port = port;
    info.display_name = name;
    info.tcp_listen_port = tcp;
    info.udp_listen_port = udp;
    info.running = true;
    return info;
}

RegistryClient::Config TestConfig() {
    RegistryClient::Config config;
    config.api_url = "http://directory.test:8080";
    return config;
}

} // namespace

TEST_CASE("RegistryClient skips registration without relays", "[unit][registry]") {
    auto http = std::make_shared<FakeHttpClient>();
    RegistryClient client(TestConfig(), http);

    CHECK(client.Register({}, std::string("10.147.20.5"), "lab") == RelayError::NONE);
    CHECK(http->call_count() == 0);
    CHECK(client.registrations_sent() == 0);
}

TEST_CASE("RegistryClient needs an overlay address", "[unit][registry]") {
    auto http = std::make_shared<FakeHttpClient>();
    RegistryClient client(TestConfig(), http);

    std::vector<RelayInfo> entries = {MakeInfo("192.168.68.100", 80, "Office", 18100, 28100)};
    CHECK(client.Register(entries, std::nullopt, "lab") ==
          RelayError::OVERLAY_IDENTITY_UNAVAILABLE);
    CHECK(http->call_count() == 0);
}

TEST_CASE("RegistryClient posts the registration record", "[unit][registry]") {
    auto http = std::make_shared<FakeHttpClient>();
    RegistryClient client(TestConfig(), http);

    std::vector<RelayInfo> entries = {
        MakeInfo("192.168.68.100", 80, "Office", 18100, 28100),
        MakeInfo("192.168.68.101", 8080, "", 19101, 29101),
    };
    REQUIRE(client.Register(entries, std::string("10.147.20.5"), "Building A") ==
            RelayError::NONE);
    CHECK(client.registrations_sent() == 1);

    auto calls = http->calls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].method == "POST");
    CHECK(calls[0].url == "http://directory.test:8080/api/kvm/register");

    json body = json::parse(calls[0].body);
    CHECK(body["relay_zt_ip"] == "10.147.20.5");
    CHECK(body["location"] == "Building A");
    REQUIRE(body["devices"].size() == 2);

    const json& first = body["devices"][0];
    CHECK(first["kvm_local_ip"] == "192.168.68.100");
    CHECK(first["kvm_port"] == 80);
    CHECK(first["kvm_name"] == "Office");
    CHECK(first["relay_port"] == 18100);
    CHECK(first["udp_relay_port"] == 28100);

    // Unnamed devices get a generated name
    CHECK(body["devices"][1]["kvm_name"] == "KVM-101");
}

TEST_CASE("RegistryClient reports directory failures", "[unit][registry]") {
    auto http = std::make_shared<FakeHttpClient>();
    RegistryClient client(TestConfig(), http);
    std::vector<RelayInfo> entries = {MakeInfo("192.168.68.100", 80, "", 18100, 28100)};

    SECTION("HTTP error status") {
        http->set_status(500);
        CHECK(client.Register(entries, std::string("10.147.20.5"), "") ==
              RelayError::REGISTRATION_FAILED);
    }
    SECTION("transport error") {
        http->set_error("connection refused");
        CHECK(client.Register(entries, std::string("10.147.20.5"), "") ==
              RelayError::REGISTRATION_FAILED);
    }
    SECTION("client throws") {
        http->set_throw(true);
        CHECK(client.Register(entries, std::string("10.147.20.5"), "") ==
              RelayError::REGISTRATION_FAILED);
    }
    CHECK(client.registrations_sent() == 0);
}

TEST_CASE("RegistryClient without a directory URL does nothing", "[unit][registry]") {
    auto http = std::make_shared<FakeHttpClient>();
    RegistryClient client(RegistryClient::Config{}, http);
    std::vector<RelayInfo> entries = {MakeInfo("192.168.68.100", 80, "", 18100, 28100)};

    CHECK(client.Register(entries, std::string("10.147.20.5"), "") == RelayError::NONE);
    CHECK(client.SendHeartbeat("10.147.20.5") == RelayError::NONE);
    CHECK(http->call_count() == 0);
}

TEST_CASE("RegistryClient::DefaultDisplayName", "[unit][registry]") {
    CHECK(RegistryClient::DefaultDisplayName("192.168.68.100") == "KVM-100");
    CHECK(RegistryClient::DefaultDisplayName("10.0.0.1") == "KVM-1");
    CHECK(RegistryClient::DefaultDisplayName("kvm.local") == "KVM-kvm.local");
}

TEST_CASE("RegistryClient heartbeat record", "[unit][registry]") {
    auto http = std::make_shared<FakeHttpClient>();
    RegistryClient client(TestConfig(), http);

    CHECK(client.SendHeartbeat("10.147.20.5") == RelayError::NONE);
    auto calls = http->calls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].url == "http://directory.test:8080/api/kvm/heartbeat");
    CHECK(json::parse(calls[0].body) == json{{"relay_zt_ip", "10.147.20.5"}});

    http->set_status(503);
    CHECK(client.SendHeartbeat("10.147.20.5") == RelayError::HEARTBEAT_FAILED);
    CHECK(client.heartbeats_sent() == 1);
    CHECK(client.heartbeat_failures() == 1);
}

TEST_CASE("RegistryClient heartbeat loop beats on its interval", "[unit][registry]") {
    auto http = std::make_shared<FakeHttpClient>();
    RegistryClient client(TestConfig(), http);

    REQUIRE(client.StartHeartbeat(
        std::chrono::milliseconds(20), []() { return true; },
        []() { return std::optional<std::string>("10.147.20.5"); }));
    CHECK(client.IsHeartbeatRunning());

    // Second start is refused while the loop runs
    CHECK_FALSE(client.StartHeartbeat(
        std::chrono::milliseconds(20), []() { return true; },
        []() { return std::optional<std::string>("10.147.20.5"); }));

    CHECK(test::wait_for([&]() { return client.heartbeats_sent() >= 3; }));

    client.StopHeartbeat();
    CHECK_FALSE(client.IsHeartbeatRunning());
    size_t after_stop = http->call_count();
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    CHECK(http->call_count() == after_stop);
}

TEST_CASE("RegistryClient heartbeat is skipped while idle", "[unit][registry]") {
    auto http = std::make_shared<FakeHttpClient>();
    RegistryClient client(TestConfig(), http);

    std::atomic<bool> running{false};
    std::atomic<bool> has_identity{false};
    std::atomic<int> polls{0};

    client.StartHeartbeat(
        std::chrono::milliseconds(10),
        [&]() {
            polls++;
            return running.load();
        },
        [&]() -> std::optional<std::string> {
            if (!has_identity) return std::nullopt;
            return std::string("10.147.20.5");
        });

    // No relays running: nothing is sent
    CHECK(test::wait_for([&]() { return polls >= 3; }));
    CHECK(http->call_count() == 0);

    // Relays but no overlay address: still nothing
    running = true;
    int seen = polls;
    CHECK(test::wait_for([&]() { return polls >= seen + 3; }));
    CHECK(http->call_count() == 0);

    has_identity = true;
    CHECK(test::wait_for([&]() { return http->call_count() >= 1; }));
    client.StopHeartbeat();
}

TEST_CASE("RegistryClient heartbeat survives directory failures", "[unit][registry]") {
    auto http = std::make_shared<FakeHttpClient>();
    RegistryClient client(TestConfig(), http);
    http->set_throw(true);

    client.StartHeartbeat(
        std::chrono::milliseconds(10), []() { return true; },
        []() { return std::optional<std::string>("10.147.20.5"); });

    CHECK(test::wait_for([&]() { return client.heartbeat_failures() >= 2; }));

    http->set_throw(false);
    CHECK(test::wait_for([&]() { return client.heartbeats_sent() >= 1; }));
    client.StopHeartbeat();
}

TEST_CASE("RegistryClient stops a long-interval heartbeat promptly", "[unit][registry]") {
    auto http = std::make_shared<FakeHttpClient>();
    RegistryClient client(TestConfig(), http);

    client.StartHeartbeat(
        std::chrono::hours(1), []() { return true; },
        []() { return std::optional<std::string>("10.147.20.5"); });
    CHECK(test::wait_for([&]() { return http->call_count() == 1; }));

    auto started = std::chrono::steady_clock::now();
    client.StopHeartbeat();
    CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(1));
}
