// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "relay/media_relay.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <thread>

using namespace kvmrelay;
using namespace kvmrelay::test;
using relay::MediaRelay;
using relay::RelayEntry;
using relay::RelayError;

namespace {

using std::chrono::milliseconds;

const auto LOOPBACK = asio::ip::make_address("127.0.0.1");

// Sync UDP socket bound to an ephemeral loopback port
struct Endpoint {
    asio::io_context io;
    udp::socket socket{io, udp::endpoint(LOOPBACK, 0)};

    uint16_t port() const { return socket.local_endpoint().port(); }

    void send(const std::string& data, uint16_t to) {
        socket.send_to(asio::buffer(data), udp::endpoint(LOOPBACK, to));
    }
};

struct Fixture {
    IoThread io;
    Endpoint device;
    std::shared_ptr<RelayEntry> entry;
    std::shared_ptr<MediaRelay> relay;

    Fixture() {
        entry = std::make_shared<RelayEntry>("127.0.0.1", 80, "kvm", 0, free_udp_port());
        MediaRelay::Config config;
        config.bind_address = "127.0.0.1";
        relay = MediaRelay::create(io.io(), entry, config);
        REQUIRE(relay->start() == RelayError::NONE);
    }

    ~Fixture() { relay->stop(); }

    uint16_t relay_port() const { return entry->udp_listen_port(); }
};

} // namespace

TEST_CASE("MediaRelay drops datagrams while the media port is unknown", "[network][relay][media]") {
    Fixture f;
    Endpoint peer;

    peer.send("rtp-1", f.relay_port());
    CHECK(wait_for([&]() { return f.relay->stats().dropped == 1; }));
    CHECK_FALSE(receive_within(f.device.socket, milliseconds(100)).has_value());
    CHECK(f.relay->stats().forwarded_to_device == 0);

    // Nothing was queued: learning the port later does not flush old data
    f.entry->set_udp_target_port(f.device.port());
    CHECK_FALSE(receive_within(f.device.socket, milliseconds(100)).has_value());
}

TEST_CASE("MediaRelay forwards between peer and device", "[network][relay][media]") {
    Fixture f;
    Endpoint peer;
    f.entry->set_udp_target_port(f.device.port());

    peer.send("rtp-1", f.relay_port());
    udp::endpoint from;
    auto got = receive_within(f.device.socket, milliseconds(2000), &from);
    REQUIRE(got);
    CHECK(*got == "rtp-1");
    // Device sees the relay as its peer
    CHECK(from.port() == f.relay_port());

    REQUIRE(f.relay->last_external_sender());
    CHECK(f.relay->last_external_sender()->port() == peer.port());

    f.device.send("rtp-back", f.relay_port());
    got = receive_within(peer.socket, milliseconds(2000), &from);
    REQUIRE(got);
    CHECK(*got == "rtp-back");
    CHECK(from.port() == f.relay_port());

    CHECK(f.relay->stats().forwarded_to_device == 1);
    CHECK(f.relay->stats().forwarded_to_peer == 1);
}

TEST_CASE("MediaRelay follows a new media port", "[network][relay][media]") {
    Fixture f;
    Endpoint peer;
    Endpoint device2;

    f.entry->set_udp_target_port(f.device.port());
    peer.send("first", f.relay_port());
    REQUIRE(receive_within(f.device.socket, milliseconds(2000)) == std::string("first"));

    f.entry->set_udp_target_port(device2.port());
    peer.send("second", f.relay_port());
    CHECK(receive_within(device2.socket, milliseconds(2000)) == std::string("second"));
    CHECK_FALSE(receive_within(f.device.socket, milliseconds(100)).has_value());

    // The old device port is now just another sender
    device2.send("from-new", f.relay_port());
    CHECK(receive_within(peer.socket, milliseconds(2000)) == std::string("from-new"));
}

TEST_CASE("MediaRelay answers only the most recent peer", "[network][relay][media]") {
    Fixture f;
    Endpoint peer_a;
    Endpoint peer_b;
    f.entry->set_udp_target_port(f.device.port());

    peer_a.send("a", f.relay_port());
    REQUIRE(receive_within(f.device.socket, milliseconds(2000)) == std::string("a"));
    peer_b.send("b", f.relay_port());
    REQUIRE(receive_within(f.device.socket, milliseconds(2000)) == std::string("b"));

    f.device.send("reply", f.relay_port());
    CHECK(receive_within(peer_b.socket, milliseconds(2000)) == std::string("reply"));
    CHECK_FALSE(receive_within(peer_a.socket, milliseconds(100)).has_value());
}

TEST_CASE("MediaRelay drops device traffic before any peer", "[network][relay][media]") {
    Fixture f;
    f.entry->set_udp_target_port(f.device.port());

    f.device.send("early", f.relay_port());
    CHECK(wait_for([&]() { return f.relay->stats().dropped == 1; }));
    CHECK_FALSE(f.relay->last_external_sender().has_value());
}

TEST_CASE("MediaRelay refuses a port that is already bound", "[network][relay][media]") {
    Fixture f;

    MediaRelay::Config config;
    config.bind_address = "127.0.0.1";
    auto twin = MediaRelay::create(f.io.io(), f.entry, config);
    CHECK(twin->start() == RelayError::PORT_CONFLICT);
    CHECK_FALSE(twin->is_running());

    f.relay->stop();
    CHECK_FALSE(f.relay->is_running());
    CHECK(twin->start() == RelayError::NONE);
    twin->stop();
}

TEST_CASE("MediaRelay stops cleanly under a datagram flood", "[network][relay][media]") {
    IoThread io;
    Endpoint device;
    const uint16_t relay_port = free_udp_port();
    auto entry = std::make_shared<RelayEntry>("127.0.0.1", 80, "kvm", 0, relay_port);
    entry->set_udp_target_port(device.port());

    // Peer traffic toward the device and device traffic back toward the peer
    std::atomic<bool> done{false};
    std::thread flood([&]() {
        Endpoint peer;
        boost::system::error_code ec;
        const udp::endpoint target(LOOPBACK, relay_port);
        while (!done) {
            peer.socket.send_to(asio::buffer(std::string("rtp")), target, 0, ec);
            device.socket.send_to(asio::buffer(std::string("rtcp")), target, 0, ec);
        }
    });

    MediaRelay::Config config;
    config.bind_address = "127.0.0.1";
    for (int i = 0; i < 50; ++i) {
        auto relay = MediaRelay::create(io.io(), entry, config);
        REQUIRE(relay->start() == RelayError::NONE);
        CHECK(wait_for([&]() {
            return relay->stats().forwarded_to_device > 0 && relay->stats().forwarded_to_peer > 0;
        }));
        relay->stop();
        CHECK_FALSE(relay->is_running());
    }

    done = true;
    flood.join();
}
