#pragma once

#include <array>
#include <chrono>
#include <functional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include "common/message.h"

namespace maxpy_debugger::client
{
    namespace serialization = maxpy_debugger::serialization;

    // The connection to ptvsd running inside the host. All callbacks are invoked on the IO thread.
    class backend_client
    {
    public:
        using message_handler = std::function<void(const std::string& content)>;
        using closed_handler = std::function<void(const std::string& reason)>;

        backend_client(boost::asio::io_context& ios, message_handler on_message, closed_handler on_closed);

        // Begin connecting. ptvsd's enable_attach may not be listening yet when this is called, so
        // failed attempts are repeated 'retries' times, 'delay' apart.
        void connect(const std::string& host, int port, int retries, std::chrono::milliseconds delay);

        // Enqueue a message. Messages sent before the connection is up are held until it is.
        void send(std::string content);

        void close();

        bool connected() const { return connected_; }
        bool closed() const { return closed_; }
        std::size_t pending() { return send_queue_.size(); }

    private:
        using tcp = boost::asio::ip::tcp;

        void try_connect();
        void receive_next_message();
        void send_next_message();
        void fail(const std::string& reason);

        tcp::socket socket_;
        tcp::resolver resolver_;
        boost::asio::steady_timer retry_timer_;

        message_handler on_message_;
        closed_handler on_closed_;

        std::string host_;
        int port_ = 0;
        int attempts_left_ = 0;
        std::chrono::milliseconds retry_delay_{ 0 };

        serialization::locked_message_queue send_queue_;
        serialization::frame_reader reader_;
        std::array<char, 4096> read_buf_;

        bool connected_ = false;
        bool closed_ = false;
    };
}
