#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>

namespace maxpy_debugger::serialization
{
    // Raised when the byte stream on either side does not follow the DAP base protocol.
    class protocol_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // The DAP base protocol header. Every message is a header block terminated by an empty
    // line, followed by exactly Content-Length bytes of JSON.
    constexpr const char* content_header = "Content-Length: ";

    // Largest message body accepted from either side.
    constexpr long long max_content_length = 64LL * 1024 * 1024;

    // A single outgoing message. The header and content are kept apart so the sender can write
    // them as two separate operations, and so the content can still be logged as plain JSON.
    struct message
    {
        std::string header_;
        std::string content_;
    };

    // Build the wire form of a message.
    message make_message(std::string content);

    // The complete wire bytes for the given content (header followed by content).
    std::string frame(const std::string& content);

    // A very simple thread-safe wrapper around a deque of messages that exposes
    // a limited interface that the front-end and back-end links need.
    //
    // Outgoing messages may be produced at any time but must be written to the socket one at a time
    // by a single IO thread. The deque itself is not thread-safe, so all accesses are guarded by a
    // mutex, but the lock is never held other than over the primitive operations exposed here.
    //
    // 'push' and 'pop' enqueue and dequeue elements, respectively, but also return a bool
    // indicating whether the queue was empty before the push or after the pop. These return
    // values control registration of send handlers: when a push reports that the queue was empty
    // beforehand, the producer must start a send for this message. When a pop reports that the
    // queue is not yet empty the consumer must start a send for the next message. Since the tests for
    // emptiness are performed while the lock is held there is always exactly one send registered for
    // the front-most element, and never more than that.
    class locked_message_queue
    {
    public:

        // Peek the top-most message.
        const message& top()
        {
            std::lock_guard<std::mutex> lock(mu_);
            return queue_.front();
        }

        // Pop the front-most message from the queue, and return
        // true if the queue is now empty.
        bool pop()
        {
            std::lock_guard<std::mutex> lock(mu_);
            queue_.pop_front();
            return queue_.empty();
        }

        // Push a new message onto the back of the queue, and return
        // true if the queue was empty before this element was added.
        bool push(message&& msg)
        {
            std::lock_guard<std::mutex> lock(mu_);
            bool empty = queue_.empty();
            queue_.push_back(std::move(msg));
            return empty;
        }

        bool empty()
        {
            std::lock_guard<std::mutex> lock(mu_);
            return queue_.empty();
        }

        std::size_t size()
        {
            std::lock_guard<std::mutex> lock(mu_);
            return queue_.size();
        }

        void clear()
        {
            std::lock_guard<std::mutex> lock(mu_);
            queue_.clear();
        }

    private:
        std::deque<message> queue_;
        std::mutex mu_;
    };

    // Incremental parser for an incoming DAP byte stream. Bytes are fed in as they arrive from
    // the socket or pipe, in chunks of any size, and complete message bodies are pulled out with next().
    class frame_reader
    {
    public:
        void feed(const char* data, std::size_t len);
        void feed(const std::string& data) { feed(data.data(), data.size()); }

        // Extract the next complete message body. Returns false if more input is needed.
        // Throws protocol_error on a malformed header block.
        bool next(std::string& content);

        // How many bytes to read next without reading past the end of the current message: one at a
        // time while in a header, then the rest of the body. Blocking readers must never be asked
        // for more, as the peer waits for a reply before sending anything else.
        std::size_t wanted() const;

        // Bytes received but not yet returned as part of a message.
        std::size_t buffered() const { return buffer_.size(); }

    private:
        bool parse_header();

        std::string buffer_;

        // Length of the body we are waiting for, or -1 while still reading a header.
        long long pending_length_ = -1;
    };
}
