#include <doctest/doctest.h>

#include <chrono>
#include <fstream>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "host/signal_watcher.h"

using namespace maxpy_debugger::host;
namespace asio = boost::asio;

static fs::path test_signal_path(const char* name)
{
    fs::path path = fs::temp_directory_path() / name;
    fs::remove(path);
    return path;
}

static void touch(const fs::path& path)
{
    std::ofstream(path).close();
}

TEST_CASE("signal watcher fires once the file appears")
{
    asio::io_context ios;
    fs::path path = test_signal_path("maxpy_debugger_signal_test.txt");
    int finished = 0;

    signal_watcher watcher(ios, path, std::chrono::milliseconds(10));
    watcher.start([&] {
        ++finished;
        ios.stop();
    });
    CHECK(watcher.running());

    // Let a few polls go by before the program "finishes".
    asio::steady_timer later(ios, std::chrono::milliseconds(50));
    later.async_wait([&](const boost::system::error_code&) {
        CHECK(finished == 0);
        touch(path);
    });

    ios.run_for(std::chrono::seconds(5));

    CHECK(finished == 1);
    CHECK_FALSE(watcher.running());
    CHECK_FALSE(fs::exists(path));
}

TEST_CASE("signal watcher ignores a file left over from an earlier session")
{
    asio::io_context ios;
    fs::path path = test_signal_path("maxpy_debugger_stale_signal_test.txt");
    touch(path);
    int finished = 0;

    signal_watcher watcher(ios, path, std::chrono::milliseconds(10));
    watcher.start([&] { ++finished; });
    CHECK_FALSE(fs::exists(path));

    ios.run_for(std::chrono::milliseconds(100));

    CHECK(finished == 0);
    CHECK(watcher.running());
    watcher.cancel();
}

TEST_CASE("a cancelled signal watcher stays quiet")
{
    asio::io_context ios;
    fs::path path = test_signal_path("maxpy_debugger_cancel_signal_test.txt");
    int finished = 0;

    signal_watcher watcher(ios, path, std::chrono::milliseconds(10));
    watcher.start([&] { ++finished; });
    watcher.cancel();
    touch(path);

    ios.run_for(std::chrono::milliseconds(100));

    CHECK(finished == 0);
    CHECK_FALSE(watcher.running());
    fs::remove(path);
}
