#include "message.h"
#include "protocol.h"

namespace maxpy_debugger::protocol
{

json parse(const std::string& content)
{
    json msg = json::parse(content, nullptr, false);
    if (msg.is_discarded())
    {
        throw serialization::protocol_error("Malformed JSON message: " + content);
    }

    if (!msg.is_object())
    {
        throw serialization::protocol_error("DAP message is not an object: " + content);
    }

    return msg;
}

static std::string string_field(const json& obj, const char* name)
{
    auto it = obj.find(name);
    if (it == obj.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

static std::int64_t integer_field(const json& obj, const char* name)
{
    auto it = obj.find(name);
    if (it == obj.end() || !it->is_number_integer())
        return -1;
    return it->get<std::int64_t>();
}

std::string type_of(const json& msg)
{
    return string_field(msg, "type");
}

std::string command_of(const json& msg)
{
    return string_field(msg, "command");
}

std::string event_of(const json& msg)
{
    return string_field(msg, "event");
}

std::string reason_of(const json& msg)
{
    auto body = msg.find("body");
    if (body == msg.end() || !body->is_object())
        return {};
    return string_field(*body, "reason");
}

std::int64_t request_seq_of(const json& msg)
{
    return integer_field(msg, "request_seq");
}

std::int64_t seq_of(const json& msg)
{
    return integer_field(msg, "seq");
}

bool is_request(const json& msg, const char* command)
{
    return type_of(msg) == "request" && command_of(msg) == command;
}

bool is_response(const json& msg, const char* command)
{
    return type_of(msg) == "response" && command_of(msg) == command;
}

bool is_event(const json& msg, const char* event)
{
    return type_of(msg) == "event" && event_of(msg) == event;
}

json make_initialize_response(std::int64_t request_seq, std::int64_t seq)
{
    json body = {
        {"supportsModulesRequest", true},
        {"supportsConfigurationDoneRequest", true},
        {"supportsDelayedStackTraceLoading", true},
        {"supportsDebuggerProperties", true},
        {"supportsEvaluateForHovers", true},
        {"supportsSetExpression", true},
        {"supportsGotoTargetsRequest", true},
        {"supportsExceptionOptions", true},
        {"exceptionBreakpointFilters", json::array({
            {{"filter", "raised"}, {"default", false}, {"label", "Raised Exceptions"}},
            {{"filter", "uncaught"}, {"default", true}, {"label", "Uncaught Exceptions"}}
        })},
        {"supportsCompletionsRequest", true},
        {"supportsExceptionInfoRequest", true},
        {"supportsLogPoints", true},
        {"supportsValueFormattingOptions", true},
        {"supportsHitConditionalBreakpoints", true},
        {"supportsSetVariable", true},
        {"supportTerminateDebuggee", true},
        {"supportsConditionalBreakpoints", true}
    };

    return {
        {"request_seq", request_seq},
        {"body", std::move(body)},
        {"seq", seq},
        {"success", true},
        {"command", "initialize"},
        {"message", ""},
        {"type", "response"}
    };
}

json make_pause_request(std::int64_t seq, std::int64_t thread_id)
{
    return {
        {"command", "pause"},
        {"arguments", {{"threadId", thread_id}}},
        {"seq", seq},
        {"type", "request"}
    };
}

json make_error_response(const json& request, std::int64_t seq, const std::string& message)
{
    return {
        {"request_seq", seq_of(request)},
        {"body", {{"error", {{"id", 1}, {"format", message}, {"showUser", true}}}}},
        {"seq", seq},
        {"success", false},
        {"command", command_of(request)},
        {"message", message},
        {"type", "response"}
    };
}

json make_event(const std::string& name, json body, std::int64_t seq)
{
    return {
        {"type", "event"},
        {"event", name},
        {"body", std::move(body)},
        {"seq", seq}
    };
}

json make_output_event(const std::string& output, std::int64_t seq)
{
    return make_event("output", {{"category", "console"}, {"output", output}}, seq);
}

json make_terminated_event(std::int64_t seq)
{
    return make_event("terminated", json::object(), seq);
}

}
