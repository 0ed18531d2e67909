// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "network/http_client.hpp"
#include "relay/address_rewriter.hpp"
#include "relay/media_port_reporter.hpp"
#include "test_helpers.hpp"
#include <catch2/catch_test_macros.hpp>
#include <condition_variable>
#include <mutex>
#include <vector>

using namespace kvmrelay;
using relay::MediaPortReporter;
using std::chrono::milliseconds;

namespace {

// Holds every GET until open() is called, like a relay that is slow to answer
class GatedHttpClient : public network::HttpClient {
public:
    network::HttpResponse Get(const std::string& url) override {
        std::unique_lock<std::mutex> lock(mutex_);
        urls_.push_back(url);
        cv_.wait(lock, [this]() { return open_; });
        network::HttpResponse res;
        res.status = status_;
        return res;
    }

    network::HttpResponse PostJson(const std::string&, const std::string&) override {
        return {};
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    void set_status(int status) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
    }

    std::vector<std::string> urls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return urls_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> urls_;
    bool open_{false};
    int status_{200};
};

} // namespace

TEST_CASE("MediaPortReporter never blocks the caller", "[unit][reporter]") {
    auto http = std::make_shared<GatedHttpClient>();
    MediaPortReporter reporter(http, "10.147.20.5", 18100);

    auto begin = std::chrono::steady_clock::now();
    reporter.Report(55123);
    reporter.Report(55200);
    CHECK(std::chrono::steady_clock::now() - begin < milliseconds(200));

    // First request is in flight and stuck on the relay
    CHECK(test::wait_for([&]() { return http->urls().size() == 1; }));
    CHECK_FALSE(reporter.Flush(milliseconds(50)));
    CHECK(reporter.sent() == 0);

    http->open();
    CHECK(reporter.Flush(milliseconds(2000)));
    CHECK(reporter.sent() == 2);
    CHECK(reporter.failed() == 0);
    CHECK(http->urls() == std::vector<std::string>{
                              "http://10.147.20.5:18100/_relay/set-media-port?port=55123",
                              "http://10.147.20.5:18100/_relay/set-media-port?port=55200"});
}

TEST_CASE("MediaPortReporter counts failed reports", "[unit][reporter]") {
    auto http = std::make_shared<GatedHttpClient>();
    http->set_status(400);
    http->open();

    MediaPortReporter reporter(http, "10.147.20.5", 18100);
    reporter.Report(1);
    CHECK(reporter.Flush(milliseconds(2000)));
    CHECK(reporter.failed() == 1);
    CHECK(reporter.sent() == 0);

    // Idle reporter flushes at once
    CHECK(reporter.Flush(milliseconds(0)));
}

TEST_CASE("MediaPortReporter shuts down with a request in flight", "[unit][reporter]") {
    auto http = std::make_shared<GatedHttpClient>();
    std::thread opener;
    {
        MediaPortReporter reporter(http, "10.147.20.5", 18100);
        reporter.Report(40000);
        reporter.Report(40001);
        REQUIRE(test::wait_for([&]() { return http->urls().size() == 1; }));

        // Let the stuck request finish while the destructor waits on it
        opener = std::thread([&]() {
            std::this_thread::sleep_for(milliseconds(50));
            http->open();
        });
    }
    opener.join();

    // The queued second report was dropped
    CHECK(http->urls().size() == 1);
}

TEST_CASE("Rewriting is not held up by a slow port report", "[unit][reporter][rewrite]") {
    auto http = std::make_shared<GatedHttpClient>();
    MediaPortReporter reporter(http, "10.147.20.5", 18100);

    relay::RewriteTarget target;
    target.relay_ip = "10.147.20.5";
    target.device_ip = "192.168.68.100";
    target.udp_listen_port = 28100;
    relay::AddressRewriter rewriter(target,
                                    [&reporter](uint16_t port) { reporter.Report(port); });

    auto begin = std::chrono::steady_clock::now();
    std::string out = rewriter.RewriteCandidate(
        "candidate:1 1 udp 2122260223 192.168.68.100 55123 typ host");
    CHECK(std::chrono::steady_clock::now() - begin < milliseconds(200));
    CHECK(out == "candidate:1 1 udp 2122260223 10.147.20.5 28100 typ host");

    CHECK(test::wait_for([&]() { return http->urls().size() == 1; }));
    http->open();
    CHECK(reporter.Flush(milliseconds(2000)));
    CHECK(reporter.sent() == 1);
}
