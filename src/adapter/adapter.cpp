#include <algorithm>
#include <cstdio>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#endif

#include "adapter.h"
#include "common/log.h"
#include "common/message.h"

namespace maxpy_debugger::adapter
{

namespace serialization = maxpy_debugger::serialization;

std::unique_ptr<dap::net::Server> server;

frontend_link::frontend_link(message_handler on_message, closed_handler on_closed) :
    state_(std::make_shared<reader_state>())
{
    state_->on_message = std::move(on_message);
    state_->on_closed = std::move(on_closed);
}

frontend_link::~frontend_link()
{
    close();

    if (reader_thread_.joinable())
    {
        // A read on stdin cannot be interrupted. The thread only holds on to its shared state and will
        // never call back into us after close(), so it is left to unwind with the process.
        if (interruptible_ && std::this_thread::get_id() != reader_thread_.get_id())
            reader_thread_.join();
        else
            reader_thread_.detach();
    }
}

void frontend_link::bind(const std::shared_ptr<dap::Reader>& reader, const std::shared_ptr<dap::Writer>& writer, bool interruptible)
{
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        writer_ = writer;
    }
    state_->reader = reader;
    interruptible_ = interruptible;
    bound_ = true;
    reader_thread_ = std::thread(&frontend_link::reader_loop, state_);
}

void frontend_link::reader_loop(std::shared_ptr<reader_state> state)
{
    serialization::frame_reader framer;
    char buf[4096];
    std::string reason = "Debugger closed the connection";

    while (true)
    {
        // Only ask for what the current message still needs: the front-end sends nothing more
        // until it has been answered, and a larger read would block until it does.
        size_t len = state->reader->read(buf, std::min(framer.wanted(), sizeof(buf)));
        if (len == 0)
            break;

        framer.feed(buf, len);

        std::string content;
        try
        {
            while (framer.next(content))
            {
                std::lock_guard<std::mutex> lock(state->callback_mutex);
                if (state->closing)
                    return;
                state->on_message(content);
            }
        }
        catch (const serialization::protocol_error& e)
        {
            reason = std::string("Bad message from debugger: ") + e.what();
            break;
        }
    }

    std::lock_guard<std::mutex> lock(state->callback_mutex);
    if (!state->closing && state->on_closed)
    {
        state->on_closed(reason);
    }
}

bool frontend_link::send(const std::string& content)
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!writer_ || closed_)
        return false;

    std::string data = serialization::frame(content);
    if (!writer_->write(data.data(), data.size()))
    {
        log("Failed to write to debugger\n");
        return false;
    }

    log_json("Sent to debugger:", content);
    return true;
}

void frontend_link::close()
{
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (closed_)
            return;
        closed_ = true;
        if (writer_)
            writer_->close();
    }

    // Wait out any callback in progress, and make sure no further callbacks are made. Closing from
    // inside a callback is allowed: that thread already holds the callback lock.
    if (std::this_thread::get_id() != reader_thread_.get_id())
    {
        std::lock_guard<std::mutex> lock(state_->callback_mutex);
        state_->closing = true;
    }
    else
    {
        state_->closing = true;
    }

    if (state_->reader)
        state_->reader->close();

    bound_ = false;
}

bool start_adapter(frontend_link& link, int debug_port)
{
    if (debug_port > 0)
    {
        server = dap::net::Server::create();
        bool started = server->start(debug_port,
            [&link](const std::shared_ptr<dap::ReaderWriter>& streams) {
                if (link.bound())
                {
                    log("Rejecting additional debugger connection\n");
                    streams->close();
                    return;
                }
                log("Debugger connected\n");
                link.bind(streams, streams);
            },
            [](const char* msg) {
                log("Server error: %s\n", msg);
            });

        if (!started)
        {
            log("Could not listen on port %d\n", debug_port);
            return false;
        }

        log("Listening for the debugger on port %d\n", debug_port);
        return true;
    }

#ifdef _WIN32
    // Change stdin and stdout to binary mode to avoid any translations
    _setmode(_fileno(stdin), _O_BINARY);
    _setmode(_fileno(stdout), _O_BINARY);
#endif

    std::shared_ptr<dap::Reader> in = dap::file(stdin, false);
    std::shared_ptr<dap::Writer> out = dap::file(stdout, false);
    link.bind(in, out, false);
    log("Bound to in/out\n");
    return true;
}

void stop_adapter()
{
    if (server)
    {
        server->stop();
    }
    server.reset();
}

}
