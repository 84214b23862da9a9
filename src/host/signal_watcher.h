#pragma once

#include <chrono>
#include <filesystem>
#include <functional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace maxpy_debugger::host
{
    namespace fs = std::filesystem;

    // Watches for the file the run script creates once the program has finished inside the host.
    // Polling happens on the IO thread; the callback fires at most once.
    class signal_watcher
    {
    public:
        using finished_handler = std::function<void()>;

        signal_watcher(boost::asio::io_context& ios, fs::path signal_path, std::chrono::milliseconds interval);

        // Begin polling. Any signal file left over from an earlier session is removed first.
        void start(finished_handler on_finished);
        void cancel();

        bool running() const { return running_; }
        const fs::path& path() const { return path_; }

    private:
        void schedule();
        void poll();

        boost::asio::steady_timer timer_;
        fs::path path_;
        std::chrono::milliseconds interval_;
        finished_handler on_finished_;
        bool running_ = false;
    };
}
