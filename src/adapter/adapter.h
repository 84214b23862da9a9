#pragma once
// The connection to the debug client UI (the DAP front-end).

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "dap/io.h"
#include "dap/network.h"

namespace maxpy_debugger::adapter
{
    // Reads framed DAP messages from the front-end on a dedicated thread and writes messages back
    // to it. The message and closed callbacks run on the reader thread and are never invoked once
    // close() has returned; send() may be called from any thread.
    class frontend_link
    {
    public:
        using message_handler = std::function<void(const std::string& content)>;
        using closed_handler = std::function<void(const std::string& reason)>;

        frontend_link(message_handler on_message, closed_handler on_closed);
        ~frontend_link();

        frontend_link(const frontend_link&) = delete;
        frontend_link& operator=(const frontend_link&) = delete;

        // Attach to a reader/writer pair and start the reader thread. 'interruptible' says whether
        // closing the reader unblocks a pending read (true for pipes and sockets, false for stdin).
        void bind(const std::shared_ptr<dap::Reader>& reader, const std::shared_ptr<dap::Writer>& writer, bool interruptible = true);

        // Write one message to the front-end. Returns false if the stream is gone.
        bool send(const std::string& content);

        void close();

        bool bound() const { return bound_; }

    private:
        // State shared with the reader thread, which may outlive the link when it is blocked on stdin.
        struct reader_state
        {
            std::shared_ptr<dap::Reader> reader;
            message_handler on_message;
            closed_handler on_closed;

            // Held while a callback runs, so close() can wait for it to finish.
            std::mutex callback_mutex;
            bool closing = false;
        };

        static void reader_loop(std::shared_ptr<reader_state> state);

        std::shared_ptr<reader_state> state_;
        std::shared_ptr<dap::Writer> writer_;
        std::mutex write_mutex_;
        std::thread reader_thread_;
        bool interruptible_ = true;
        std::atomic<bool> bound_{ false };
        bool closed_ = false;
    };

    // Bind the link to the process's stdin/stdout, or, when debug_port is positive, listen on that
    // TCP port and bind to the first client that connects. Returns false if the server could not start.
    bool start_adapter(frontend_link& link, int debug_port);
    void stop_adapter();
}
