// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include <catch2/catch_test_macros.hpp>
#include <random>

using namespace kvmrelay::util;

namespace {

fs::path ScratchDir() {
    std::random_device device;
    fs::path dir = fs::temp_directory_path() / ("kvmrelay_lock_" + std::to_string(device()));
    fs::create_directories(dir);
    return dir;
}

} // namespace

TEST_CASE("DirectoryLock is exclusive per directory", "[unit][lock]") {
    fs::path dir = ScratchDir();

    {
        DirectoryLock first(dir);
        CHECK_FALSE(first.IsHeld());
        REQUIRE(first.Acquire() == LockResult::Success);
        CHECK(first.IsHeld());
        CHECK(fs::exists(dir / ".lock"));

        // Re-acquiring a held lock is a no-op
        CHECK(first.Acquire() == LockResult::Success);

        DirectoryLock second(dir);
        CHECK(second.Acquire() == LockResult::ErrorLock);
        CHECK_FALSE(second.IsHeld());

        // A different lock file in the same directory is independent
        DirectoryLock other(dir, "other.lock");
        CHECK(other.Acquire() == LockResult::Success);

        first.Release();
        CHECK_FALSE(first.IsHeld());
        CHECK(second.Acquire() == LockResult::Success);
    }

    // Destruction released everything
    DirectoryLock again(dir);
    CHECK(again.Acquire() == LockResult::Success);
    again.Release();

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("DirectoryLock reports a directory it cannot write", "[unit][lock]") {
    fs::path dir = ScratchDir();
    DirectoryLock lock(dir / "missing" / "deeper");
    CHECK(lock.Acquire() == LockResult::ErrorWrite);
    CHECK_FALSE(lock.IsHeld());

    std::error_code ec;
    fs::remove_all(dir, ec);
}
