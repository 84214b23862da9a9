#include <system_error>

#include "common/log.h"
#include "signal_watcher.h"

namespace maxpy_debugger::host
{

signal_watcher::signal_watcher(boost::asio::io_context& ios, fs::path signal_path, std::chrono::milliseconds interval) :
    timer_(ios),
    path_(std::move(signal_path)),
    interval_(interval)
{}

void signal_watcher::start(finished_handler on_finished)
{
    std::error_code ec;
    if (fs::remove(path_, ec))
    {
        log("Removed stale signal file %s\n", path_.string().c_str());
    }

    on_finished_ = std::move(on_finished);
    running_ = true;
    schedule();
}

void signal_watcher::cancel()
{
    running_ = false;
    timer_.cancel();
}

void signal_watcher::schedule()
{
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_)
            return;
        poll();
    });
}

void signal_watcher::poll()
{
    std::error_code ec;
    if (!fs::exists(path_, ec))
    {
        schedule();
        return;
    }

    log("--- FINISHED DEBUGGING ---\n");

    fs::remove(path_, ec);
    if (ec)
    {
        log("Failed to remove signal file %s: %s\n", path_.string().c_str(), ec.message().c_str());
    }

    running_ = false;
    if (on_finished_)
    {
        finished_handler handler = std::move(on_finished_);
        on_finished_ = nullptr;
        handler();
    }
}

}
