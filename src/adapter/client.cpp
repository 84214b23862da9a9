#include <boost/asio.hpp>

#include "client.h"
#include "common/log.h"

namespace asio = boost::asio;

namespace maxpy_debugger::client
{

backend_client::backend_client(asio::io_context& ios, message_handler on_message, closed_handler on_closed) :
    socket_(ios),
    resolver_(ios),
    retry_timer_(ios),
    on_message_(std::move(on_message)),
    on_closed_(std::move(on_closed))
{}

void backend_client::connect(const std::string& host, int port, int retries, std::chrono::milliseconds delay)
{
    host_ = host;
    port_ = port;
    attempts_left_ = retries < 1 ? 1 : retries;
    retry_delay_ = delay;

    log("Connecting to %s:%d\n", host_.c_str(), port_);
    try_connect();
}

void backend_client::try_connect()
{
    if (closed_)
        return;

    --attempts_left_;

    resolver_.async_resolve(host_, std::to_string(port_), [this](const boost::system::error_code& ec, tcp::resolver::results_type endpoints) {
        if (closed_)
            return;

        if (ec)
        {
            fail("Could not resolve " + host_ + ": " + ec.message());
            return;
        }

        asio::async_connect(socket_, endpoints, [this](const boost::system::error_code& ec, const tcp::endpoint&) {
            if (closed_)
                return;

            if (ec)
            {
                if (attempts_left_ <= 0)
                {
                    fail("Connection to ptvsd at " + host_ + ":" + std::to_string(port_) + " failed: " + ec.message());
                    return;
                }

                log("Connection to ptvsd failed (%s), retrying\n", ec.message().c_str());
                boost::system::error_code ignored;
                socket_.close(ignored);

                retry_timer_.expires_after(retry_delay_);
                retry_timer_.async_wait([this](const boost::system::error_code& ec) {
                    if (!ec)
                        try_connect();
                });
                return;
            }

            connected_ = true;
            log("Successfully connected to the host for debugging. Starting...\n");

            // Flush anything the front-end sent while we were still attaching.
            if (!send_queue_.empty())
            {
                send_next_message();
            }

            receive_next_message();
        });
    });
}

// Schedule an async receive of the next chunk from ptvsd. Complete messages are dispatched as soon
// as they have been framed; a partial message stays buffered in the reader until the rest arrives.
void backend_client::receive_next_message()
{
    socket_.async_read_some(asio::buffer(read_buf_), [this](const boost::system::error_code& ec, std::size_t len) {
        if (closed_)
            return;

        if (ec)
        {
            if (ec == asio::error::eof)
                fail("ptvsd closed the connection");
            else
                fail("Failure reading ptvsd output: " + ec.message());
            return;
        }

        reader_.feed(read_buf_.data(), len);

        std::string content;
        try
        {
            while (reader_.next(content))
            {
                on_message_(content);
                if (closed_)
                    return;
            }
        }
        catch (const serialization::protocol_error& e)
        {
            fail(std::string("Bad message from ptvsd: ") + e.what());
            return;
        }

        receive_next_message();
    });
}

void backend_client::send_next_message()
{
    auto&& next_msg = send_queue_.top();

    // Begin the async send of the front-most message's header
    asio::async_write(socket_, asio::buffer(next_msg.header_), [this](const boost::system::error_code& ec, std::size_t n) {
        if (closed_)
            return;

        if (ec)
        {
            fail("Sending message header to ptvsd failed: " + ec.message());
            return;
        }

        // Now send the message body
        auto&& next_msg = send_queue_.top();
        asio::async_write(socket_, asio::buffer(next_msg.content_), [this](const boost::system::error_code& ec, std::size_t n) {
            if (closed_)
                return;

            if (ec)
            {
                fail("Sending message to ptvsd failed: " + ec.message());
                return;
            }

            log_json("Sent to ptvsd:", send_queue_.top().content_);

            // If the queue was not empty after removing this just-sent message, schedule the async send of the next message in the queue.
            // If the queue was empty the send will be scheduled by the next message that gets enqueued via send.
            if (!send_queue_.pop())
            {
                send_next_message();
            }
        });
    });
}

// Enqueue the given message to send to ptvsd.
void backend_client::send(std::string content)
{
    if (closed_)
    {
        log("Dropping message for closed ptvsd connection\n");
        return;
    }

    // If the queue was empty before we added this message and we are connected, begin the async send.
    // Before the connection is established the queue is flushed by the connect handler instead.
    if (send_queue_.push(serialization::make_message(std::move(content))) && connected_)
    {
        send_next_message();
    }
}

void backend_client::close()
{
    if (closed_)
        return;

    closed_ = true;
    connected_ = false;

    boost::system::error_code ec;
    retry_timer_.cancel();
    resolver_.cancel();
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

// Report a failure once and close the connection.
void backend_client::fail(const std::string& reason)
{
    if (closed_)
        return;

    log("%s\n", reason.c_str());
    close();

    if (on_closed_)
    {
        on_closed_(reason);
    }
}

}
