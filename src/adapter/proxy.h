#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include "common/protocol.h"
#include "configuration.h"

namespace maxpy_debugger::adapter
{
    // Everything the proxy needs from the outside world. Implemented by the session over real
    // connections, and by a recorder in the tests.
    class proxy_sink
    {
    public:
        virtual ~proxy_sink() = default;

        virtual void send_to_frontend(const std::string& content) = 0;
        virtual void send_to_backend(const std::string& content) = 0;

        // Inject ptvsd into the host and start connecting to it. Throws host::injection_error.
        virtual void attach_host(const attach_config& config) = 0;

        // Inject the code that runs the program being debugged. Throws host::injection_error.
        virtual void run_program(const attach_config& config) = 0;

        // End the session. The front-end has already been told.
        virtual void shutdown() = 0;
    };

    // The message-forwarding state machine between the front-end and ptvsd.
    //
    // Most traffic passes through untouched, byte for byte. The exceptions:
    //
    //  - 'initialize' is answered by the adapter straight away, since ptvsd is not even running in
    //    the host yet. The request is still handed on to ptvsd, and its response is dropped.
    //  - 'attach' kicks off the injection into the host, and its arguments are rewritten into the
    //    form ptvsd expects.
    //  - Once ptvsd has acknowledged 'configurationDone' the program itself is started in the host.
    //  - Module-level housekeeping variables are removed from 'variables' responses, as the front-end
    //    chokes on __builtins__.
    //  - ptvsd in the host regularly stalls after a step, reporting a 'stopped' event with reason
    //    'step' that it never follows through on. The proxy swallows that event, pauses the thread
    //    itself, and passes the resulting 'pause' stop on as the step the front-end was expecting.
    //  - After a 'continue', ptvsd may report hitting the next breakpoint before it reports having
    //    continued, which leaves the front-end believing the program is running. A breakpoint stop
    //    seen while a continue is pending is held back until the 'continued' event has been forwarded.
    //
    // All calls must be made from the same thread.
    class proxy
    {
    public:
        // Sequence numbers of the pause requests the proxy sends on its own. They count down from the
        // top of the 64-bit range so they never collide with the front-end's own numbering.
        static constexpr std::int64_t first_artificial_seq = 9223372036854775806LL;

        // First sequence number of the messages the adapter sends to the front-end itself.
        static constexpr std::int64_t first_own_seq = 1000000000LL;

        explicit proxy(proxy_sink& sink);

        void on_frontend_message(const std::string& content);
        void on_backend_message(const std::string& content);

        // Tell the front-end the session is over: an output event with the reason (if any) followed by
        // a terminated event. Only the first call has any effect.
        void end_session(const std::string& reason);

        bool waiting_for_pause() const { return waiting_for_pause_event_; }
        bool continue_pending() const { return continue_pending_; }
        bool has_stashed_event() const { return stashed_event_.has_value(); }
        bool session_ended() const { return ended_; }
        const std::optional<attach_config>& config() const { return config_; }

    private:
        using json = protocol::json;

        bool handle_attach(json& msg, std::string& content);
        void handle_stall(const json& msg);
        void filter_variables(json& msg, std::string& content);
        void forward_to_frontend(const json& msg, const std::string& content);
        void send_frontend(const json& msg);

        std::int64_t next_seq() { return next_seq_++; }

        proxy_sink& sink_;

        // Sequence numbers for messages the adapter itself sends to the front-end, kept clear of
        // ptvsd's own numbering which starts at 1.
        std::int64_t next_seq_ = first_own_seq;

        std::int64_t next_artificial_seq_ = first_artificial_seq;
        std::set<std::int64_t> artificial_seqs_;

        // Requests already answered by the adapter. ptvsd's responses to these are dropped.
        std::set<std::int64_t> answered_seqs_;

        bool waiting_for_pause_event_ = false;
        bool continue_pending_ = false;
        std::optional<std::string> stashed_event_;

        std::optional<attach_config> config_;
        bool program_started_ = false;
        bool ended_ = false;
    };
}
