#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace maxpy_debugger::protocol
{
    using json = nlohmann::json;

    // Parse a DAP message body. Throws serialization::protocol_error if the content is not a
    // JSON object.
    json parse(const std::string& content);

    // Field accessors. These never throw: a missing or mistyped field yields the empty value.
    std::string type_of(const json& msg);
    std::string command_of(const json& msg);
    std::string event_of(const json& msg);

    // The 'reason' in the body of a 'stopped' (or similar) event.
    std::string reason_of(const json& msg);

    // The request_seq of a response, or -1 if the message is not a response.
    std::int64_t request_seq_of(const json& msg);
    std::int64_t seq_of(const json& msg);

    bool is_request(const json& msg, const char* command);
    bool is_response(const json& msg, const char* command);
    bool is_event(const json& msg, const char* event);

    // The response the adapter sends for 'initialize' on ptvsd's behalf, advertising ptvsd's
    // capabilities before the backend is even running.
    json make_initialize_response(std::int64_t request_seq, std::int64_t seq);

    // A 'pause' request sent to the backend.
    json make_pause_request(std::int64_t seq, std::int64_t thread_id);

    // A failed response to the given request.
    json make_error_response(const json& request, std::int64_t seq, const std::string& message);

    json make_event(const std::string& name, json body, std::int64_t seq);
    json make_output_event(const std::string& output, std::int64_t seq);
    json make_terminated_event(std::int64_t seq);
}
