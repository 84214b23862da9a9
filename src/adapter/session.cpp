#include <boost/asio/post.hpp>

#include "common/log.h"
#include "session.h"

namespace asio = boost::asio;

namespace maxpy_debugger::adapter
{

session::session(asio::io_context& ios, const options& opts, std::unique_ptr<host::injector> injector) :
    ios_(ios),
    work_(asio::make_work_guard(ios)),
    opts_(opts),
    injector_(std::move(injector)),
    watcher_(ios, scripts_.signal_path(), std::chrono::milliseconds(opts.signal_poll_ms)),
    backend_(ios,
        [this](const std::string& content) { proxy_.on_backend_message(content); },
        [this](const std::string& reason) { on_backend_closed(reason); }),
    proxy_(*this),
    link_(
        [this](const std::string& content) {
            asio::post(ios_, [this, content] {
                if (state_ != state::stopped)
                    proxy_.on_frontend_message(content);
            });
        },
        [this](const std::string& reason) {
            asio::post(ios_, [this, reason] { on_frontend_closed(reason); });
        })
{}

session::~session()
{
    stop();
}

void session::send_to_frontend(const std::string& content)
{
    if (!link_.send(content))
    {
        log("Could not deliver message to the debugger\n");
    }
}

void session::send_to_backend(const std::string& content)
{
    backend_.send(content);
}

// Inject ptvsd into the host, then connect to it and start waiting for the program to finish.
void session::attach_host(const attach_config& config)
{
    state_ = state::attaching;

    fs::path script = scripts_.write("attach.py", host::attach_script(opts_.ptvsd_path, config.host, config.port));

    log("Sending attach code to the host\n");
    injector_->execute(script);
    log("Successfully attached to the host\n");

    backend_.connect(config.host, config.port, opts_.connect_retries, std::chrono::milliseconds(opts_.connect_retry_ms));
    watcher_.start([this] { on_program_finished(); });
}

void session::run_program(const attach_config& config)
{
    fs::path script = scripts_.write("run.py", host::run_script(config.program, watcher_.path()));

    log("Starting %s in the host\n", config.program.c_str());
    injector_->execute(script);
    state_ = state::running;
}

void session::shutdown()
{
    stop();
}

void session::on_frontend_closed(const std::string& reason)
{
    log("%s\n", reason.c_str());
    stop();
}

// ptvsd went away mid-session, most likely because 3ds Max was closed or crashed.
void session::on_backend_closed(const std::string& reason)
{
    if (state_ == state::stopped)
        return;

    proxy_.end_session("Lost connection to ptvsd: " + reason);
    stop();
}

void session::on_program_finished()
{
    if (state_ == state::stopped)
        return;

    proxy_.end_session({});
    stop();
}

void session::stop()
{
    if (state_ == state::stopped)
        return;

    state_ = state::stopped;
    log("Stopping session\n");

    watcher_.cancel();
    backend_.close();
    link_.close();

    // Let run() return in the main thread.
    work_.reset();
    ios_.stop();
}

}
