// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "application.hpp"
#include "util/fs_lock.hpp"
#include <catch2/catch_test_macros.hpp>
#include <random>

using namespace kvmrelay;
namespace fs = std::filesystem;

namespace {

app::AppConfig ScratchConfig() {
    std::random_device rd;
    app::AppConfig config;
    config.datadir = fs::temp_directory_path() / ("kvmrelay_app_" + std::to_string(rd()));
    config.overlay_ip = "10.147.0.9";
    config.relay_config.bind_address = "127.0.0.1";
    config.relay_config.io_threads = 1;
    return config;
}

bool DatadirLocked(const fs::path& datadir) {
    util::DirectoryLock other(datadir);
    return other.Acquire() == util::LockResult::ErrorLock;
}

} // namespace

TEST_CASE("Application holds the data directory until stopped", "[unit][app]") {
    app::AppConfig config = ScratchConfig();

    {
        app::Application app(config);
        REQUIRE(app.initialize());
        CHECK(DatadirLocked(config.datadir));

        // A second daemon on the same directory is refused
        app::Application twin(config);
        CHECK_FALSE(twin.initialize());

        REQUIRE(app.start());
        CHECK(fs::exists(config.datadir / "relay.sock"));
        CHECK(app.relay_manager().relay_count() == 0);

        app.stop();
        CHECK_FALSE(DatadirLocked(config.datadir));
        CHECK_FALSE(fs::exists(config.datadir / "relay.sock"));
    }

    std::error_code ec;
    fs::remove_all(config.datadir, ec);
}

TEST_CASE("Application releases the data directory after a failed start", "[unit][app]") {
    app::AppConfig config = ScratchConfig();

    // A directory where the control socket belongs makes the bind fail
    fs::create_directories(config.datadir / "relay.sock" / "occupied");

    {
        app::Application app(config);
        REQUIRE(app.initialize());
        CHECK(DatadirLocked(config.datadir));

        CHECK_FALSE(app.start());
        app.stop();
        CHECK_FALSE(DatadirLocked(config.datadir));

        // The directory is usable again by the next daemon
        app::Application next(config);
        CHECK(next.initialize());
    }

    std::error_code ec;
    fs::remove_all(config.datadir, ec);
}
