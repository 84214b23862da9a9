#pragma once

#include <memory>
#include <string>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "adapter.h"
#include "client.h"
#include "host/injector.h"
#include "host/scripts.h"
#include "host/signal_watcher.h"
#include "options.h"
#include "proxy.h"

namespace maxpy_debugger::adapter
{
    // One debugging session: the front-end connection, the proxy, and everything on the host side.
    //
    // Messages from the front-end arrive on the link's reader thread and are posted to the IO thread,
    // which owns all other session state.
    class session : public proxy_sink
    {
    public:
        enum class state
        {
            starting,
            attaching,
            running,
            stopped
        };

        session(boost::asio::io_context& ios, const options& opts, std::unique_ptr<host::injector> injector);
        ~session() override;

        frontend_link& link() { return link_; }
        state get_state() const { return state_; }

        // Stop the session: cancel all host-side work, close both connections and let the IO
        // context run out. Safe to call more than once.
        void stop();

        // proxy_sink
        void send_to_frontend(const std::string& content) override;
        void send_to_backend(const std::string& content) override;
        void attach_host(const attach_config& config) override;
        void run_program(const attach_config& config) override;
        void shutdown() override;

    private:
        void on_frontend_closed(const std::string& reason);
        void on_backend_closed(const std::string& reason);
        void on_program_finished();

        boost::asio::io_context& ios_;
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
        const options& opts_;
        std::unique_ptr<host::injector> injector_;

        host::script_store scripts_;
        host::signal_watcher watcher_;
        client::backend_client backend_;
        proxy proxy_;
        frontend_link link_;

        state state_ = state::starting;
    };
}
