// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "network/overlay_identity.hpp"
#include "relay/relay_manager.hpp"
#include "test_helpers.hpp"
#include <boost/asio/write.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace kvmrelay;
using namespace kvmrelay::test;
using network::OverlayIdentity;
using relay::RelayError;
using relay::RelayManager;

namespace {

const auto LOOPBACK = asio::ip::make_address("127.0.0.1");

// High bands so the tests do not collide with a real relay on this host.
// Each test uses its own device octet.
RelayManager::Config TestConfig() {
    RelayManager::Config config;
    config.bands.tcp_base = 43000;
    config.bands.alt_tcp_base = 44000;
    config.bands.udp_base = 53000;
    config.bind_address = "127.0.0.1";
    config.io_threads = 2;
    return config;
}

OverlayIdentity FixedIdentity(std::vector<std::string> addrs) {
    return OverlayIdentity("10.147.", [addrs]() { return addrs; });
}

bool TcpPortFree(uint16_t port) {
    asio::io_context io;
    tcp::acceptor a(io);
    boost::system::error_code ec;
    a.open(tcp::v4(), ec);
    if (!ec) a.bind(tcp::endpoint(LOOPBACK, port), ec);
    return !ec;
}

} // namespace

TEST_CASE("RelayManager starts a relay on the first candidate", "[network][relay][manager]") {
    auto identity = FixedIdentity({"192.168.1.2", "10.147.20.5"});
    RelayManager manager(identity, TestConfig());

    auto result = manager.start_relay("192.168.68.101", 80, "Office");
    REQUIRE(result.ok());
    CHECK(result.tcp_listen_port == 43101);
    CHECK(result.udp_listen_port == 53101);
    CHECK(manager.relay_count() == 1);
    CHECK(manager.has_running_relays());

    auto relays = manager.list_relays();
    REQUIRE(relays.size() == 1);
    CHECK(relays[0].device_ip == "192.168.68.101");
    CHECK(relays[0].device_port == 80);
    CHECK(relays[0].display_name == "Office");
    CHECK(relays[0].running);
    CHECK_FALSE(relays[0].udp_target_port.has_value());
    CHECK(relays[0].access_url == "http://10.147.20.5:43101");

    // Second device port of the same host goes to the alternate band
    auto alt = manager.start_relay("192.168.68.101", 8443, "");
    REQUIRE(alt.ok());
    CHECK(alt.tcp_listen_port == 44101);
    CHECK(alt.udp_listen_port == 54101);
    CHECK(manager.relay_count() == 2);
}

TEST_CASE("RelayManager start is idempotent", "[network][relay][manager]") {
    auto identity = FixedIdentity({});
    RelayManager manager(identity, TestConfig());

    auto first = manager.start_relay("192.168.68.102", 80, "a");
    REQUIRE(first.ok());
    auto second = manager.start_relay("192.168.68.102", 80, "b");
    REQUIRE(second.ok());

    CHECK(second.tcp_listen_port == first.tcp_listen_port);
    CHECK(second.udp_listen_port == first.udp_listen_port);
    CHECK(manager.relay_count() == 1);
    // The original name sticks
    CHECK(manager.list_relays()[0].display_name == "a");
    // No overlay address, no access URL
    CHECK(manager.list_relays()[0].access_url.empty());
}

TEST_CASE("RelayManager moves past a taken TCP port", "[network][relay][manager]") {
    auto identity = FixedIdentity({});
    RelayManager manager(identity, TestConfig());

    asio::io_context io;
    tcp::acceptor blocker(io, tcp::endpoint(LOOPBACK, 43103));

    auto result = manager.start_relay("192.168.68.103", 80, "");
    REQUIRE(result.ok());
    CHECK(result.tcp_listen_port == 44103);
    CHECK(result.udp_listen_port == 54103);
}

TEST_CASE("RelayManager keeps both legs on one offset", "[network][relay][manager]") {
    auto identity = FixedIdentity({});
    RelayManager manager(identity, TestConfig());

    asio::io_context io;
    udp::socket blocker(io, udp::endpoint(LOOPBACK, 53104));

    auto result = manager.start_relay("192.168.68.104", 80, "");
    REQUIRE(result.ok());
    CHECK(result.tcp_listen_port == 44104);
    CHECK(result.udp_listen_port == 54104);

    // The TCP leg bound at offset 0 was released again
    CHECK(TcpPortFree(43104));
}

TEST_CASE("RelayManager reports exhaustion", "[network][relay][manager]") {
    auto identity = FixedIdentity({});
    RelayManager manager(identity, TestConfig());

    asio::io_context io;
    tcp::acceptor b0(io, tcp::endpoint(LOOPBACK, 43105));
    tcp::acceptor b1(io, tcp::endpoint(LOOPBACK, 44105));
    tcp::acceptor b2(io, tcp::endpoint(LOOPBACK, 45105));

    auto result = manager.start_relay("192.168.68.105", 80, "");
    CHECK(result.error == RelayError::ALLOCATION_FAILED);
    CHECK_FALSE(result.ok());
    CHECK(manager.relay_count() == 0);
    CHECK_FALSE(manager.has_running_relays());
}

TEST_CASE("RelayManager validates its arguments", "[network][relay][manager]") {
    auto identity = FixedIdentity({});
    RelayManager manager(identity, TestConfig());

    CHECK(manager.start_relay("", 80, "").error == RelayError::INVALID_ARGUMENT);
    CHECK(manager.start_relay("192.168.68.106", 0, "").error == RelayError::INVALID_ARGUMENT);
    CHECK(manager.start_relay("kvm.local", 80, "").error == RelayError::INVALID_ARGUMENT);
    CHECK(manager.relay_count() == 0);
}

TEST_CASE("RelayManager stop and restart", "[network][relay][manager]") {
    auto identity = FixedIdentity({});
    RelayManager manager(identity, TestConfig());

    // Unknown keys are a no-op
    CHECK_FALSE(manager.stop_relay("192.168.68.107", 80));

    auto first = manager.start_relay("192.168.68.107", 80, "");
    REQUIRE(first.ok());
    auto entry = manager.find_entry("192.168.68.107", 80);
    REQUIRE(entry);
    CHECK(entry->running());

    CHECK(manager.stop_relay("192.168.68.107", 80));
    CHECK_FALSE(entry->running());
    CHECK(manager.relay_count() == 0);
    CHECK(manager.find_entry("192.168.68.107", 80) == nullptr);
    CHECK_FALSE(manager.stop_relay("192.168.68.107", 80));

    auto again = manager.start_relay("192.168.68.107", 80, "");
    REQUIRE(again.ok());
    CHECK(again.tcp_listen_port == first.tcp_listen_port);
    CHECK(again.udp_listen_port == first.udp_listen_port);
}

TEST_CASE("RelayManager stop_all releases every port", "[network][relay][manager]") {
    auto identity = FixedIdentity({});
    RelayManager manager(identity, TestConfig());

    REQUIRE(manager.start_relay("192.168.68.108", 80, "").ok());
    REQUIRE(manager.start_relay("192.168.68.109", 80, "").ok());
    CHECK(manager.relay_count() == 2);

    manager.stop_all();
    CHECK(manager.relay_count() == 0);
    CHECK_FALSE(manager.has_running_relays());
    CHECK(TcpPortFree(43108));
    CHECK(TcpPortFree(43109));
}

TEST_CASE("RelayManager relays learn ports through the TCP listener", "[network][relay][manager]") {
    auto identity = FixedIdentity({"10.147.20.5"});
    RelayManager manager(identity, TestConfig());

    // Device on loopback, alternate band because the port is not 80
    auto result = manager.start_relay("127.0.0.1", 8081, "");
    REQUIRE(result.ok());
    CHECK(result.tcp_listen_port == 44001);

    asio::io_context io;
    tcp::socket s(io);
    s.connect(tcp::endpoint(LOOPBACK, result.tcp_listen_port));
    asio::write(s, asio::buffer(std::string("GET /_relay/set-media-port?port=55123 HTTP/1.1\r\n\r\n")));
    CHECK(read_to_eof(s).rfind("HTTP/1.1 200", 0) == 0);

    auto relays = manager.list_relays();
    REQUIRE(relays.size() == 1);
    CHECK(relays[0].udp_target_port == uint16_t{55123});
}
