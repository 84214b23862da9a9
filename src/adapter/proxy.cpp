#include <algorithm>
#include <stdexcept>

#include "common/log.h"
#include "common/message.h"
#include "proxy.h"

namespace maxpy_debugger::adapter
{

namespace serialization = maxpy_debugger::serialization;

// Module-level names ptvsd reports for every module scope. The front-end's variable view fails on
// __builtins__ in particular, and none of them are of any use while debugging.
static const char* const hidden_variables[] = {
    "__builtins__",
    "__doc__",
    "__file__",
    "__name__",
    "__package__"
};

static bool is_hidden_variable(const std::string& name)
{
    return std::find(std::begin(hidden_variables), std::end(hidden_variables), name) != std::end(hidden_variables);
}

static bool is_stopped(const protocol::json& msg, const char* reason)
{
    return protocol::is_event(msg, "stopped") && protocol::reason_of(msg) == reason;
}

proxy::proxy(proxy_sink& sink) : sink_(sink)
{}

void proxy::send_frontend(const json& msg)
{
    sink_.send_to_frontend(msg.dump());
}

void proxy::on_frontend_message(const std::string& message)
{
    json msg;
    try
    {
        msg = protocol::parse(message);
    }
    catch (const serialization::protocol_error& e)
    {
        log("Ignoring message from debugger: %s\n", e.what());
        return;
    }

    log_json("Received from debugger:", message);

    std::string content = message;

    if (protocol::type_of(msg) == "request")
    {
        std::string command = protocol::command_of(msg);

        if (command == "initialize")
        {
            // Answer on ptvsd's behalf. The request still goes to ptvsd once it is up, and its
            // response is then dropped as a duplicate.
            send_frontend(protocol::make_initialize_response(protocol::seq_of(msg), next_seq()));
            answered_seqs_.insert(protocol::seq_of(msg));
        }
        else if (command == "attach")
        {
            if (!handle_attach(msg, content))
                return;
        }
        else if (command == "continue")
        {
            continue_pending_ = true;
        }
    }

    sink_.send_to_backend(content);
}

// Inject ptvsd into the host and rewrite the request for it. On failure the request is answered
// here and false is returned: nothing goes to the backend.
bool proxy::handle_attach(json& msg, std::string& content)
{
    if (config_)
    {
        send_frontend(protocol::make_error_response(msg, next_seq(), "Already attached to the host"));
        return false;
    }

    attach_config config;
    try
    {
        auto args = msg.find("arguments");
        config = parse_attach_config(args != msg.end() ? *args : json());
    }
    catch (const config_error& e)
    {
        log("Bad attach configuration: %s\n", e.what());
        send_frontend(protocol::make_error_response(msg, next_seq(), e.what()));
        return false;
    }

    try
    {
        sink_.attach_host(config);
    }
    catch (const std::runtime_error& e)
    {
        std::string error = std::string("Could not send vital code to the host due to error:\n\n") + e.what();
        log("%s\n", error.c_str());
        send_frontend(protocol::make_error_response(msg, next_seq(), error));
        end_session({});
        sink_.shutdown();
        return false;
    }

    config_ = config;

    msg["arguments"] = make_attach_arguments(config);
    content = msg.dump();
    log_json("New attach arguments loaded:", msg["arguments"].dump());
    return true;
}

void proxy::on_backend_message(const std::string& message)
{
    json msg;
    try
    {
        msg = protocol::parse(message);
    }
    catch (const serialization::protocol_error& e)
    {
        log("Ignoring message from ptvsd: %s\n", e.what());
        return;
    }

    std::string content = message;
    std::int64_t request_seq = protocol::request_seq_of(msg);

    if (protocol::is_response(msg, "configurationDone"))
    {
        // The front-end and ptvsd have finished setting up: start the program in the host.
        if (config_ && !program_started_)
        {
            program_started_ = true;
            try
            {
                sink_.run_program(*config_);
            }
            catch (const std::runtime_error& e)
            {
                std::string error = std::string("Could not start the program in the host: ") + e.what();
                log("%s\n", error.c_str());
                forward_to_frontend(msg, content);
                end_session(error);
                sink_.shutdown();
                return;
            }
        }
    }
    else if (protocol::is_response(msg, "variables"))
    {
        filter_variables(msg, content);
    }
    else if (is_stopped(msg, "step"))
    {
        // The front-end must not find out ptvsd stalled.
        handle_stall(msg);
        return;
    }
    else if (artificial_seqs_.count(request_seq) != 0)
    {
        // The response to our own pause request. Wait for the stop it causes.
        artificial_seqs_.erase(request_seq);
        auto success = msg.find("success");
        if (success != msg.end() && success->is_boolean() && success->get<bool>())
        {
            waiting_for_pause_event_ = true;
        }
        else
        {
            log("Stall could not be recovered.\n");
        }
        return;
    }
    else if (waiting_for_pause_event_ && is_stopped(msg, "pause"))
    {
        // This stop completes the step the front-end asked for. Debugging carries on normally.
        waiting_for_pause_event_ = false;
        msg["body"]["reason"] = "step";
        content = msg.dump();
    }
    else if (continue_pending_ && is_stopped(msg, "breakpoint"))
    {
        log_json("Temporarily stashed:", content);
        stashed_event_ = content;
        return;
    }
    else if (continue_pending_ && protocol::is_event(msg, "continued"))
    {
        continue_pending_ = false;

        if (stashed_event_)
        {
            log_json("Received from ptvsd:", content);
            sink_.send_to_frontend(content);

            log_json("Sending stashed message:", *stashed_event_);
            sink_.send_to_frontend(*stashed_event_);

            stashed_event_.reset();
            return;
        }
    }

    forward_to_frontend(msg, content);
}

void proxy::handle_stall(const json& msg)
{
    log("Stall detected. Sending unblocking command to ptvsd.\n");

    std::int64_t thread_id = 1;
    auto body = msg.find("body");
    if (body != msg.end() && body->is_object())
    {
        auto id = body->find("threadId");
        if (id != body->end() && id->is_number_integer())
            thread_id = id->get<std::int64_t>();
    }

    std::int64_t seq = next_artificial_seq_--;
    artificial_seqs_.insert(seq);
    sink_.send_to_backend(protocol::make_pause_request(seq, thread_id).dump());
}

void proxy::filter_variables(json& msg, std::string& content)
{
    auto body = msg.find("body");
    if (body == msg.end() || !body->is_object())
        return;

    auto vars = body->find("variables");
    if (vars == body->end() || !vars->is_array())
        return;

    std::size_t before = vars->size();
    vars->erase(std::remove_if(vars->begin(), vars->end(), [](const json& var) {
        if (!var.is_object())
            return false;
        auto name = var.find("name");
        return name != var.end() && name->is_string() && is_hidden_variable(name->get<std::string>());
    }), vars->end());

    if (vars->size() != before)
    {
        content = msg.dump();
    }
}

void proxy::forward_to_frontend(const json& msg, const std::string& content)
{
    std::int64_t request_seq = protocol::request_seq_of(msg);
    if (protocol::type_of(msg) == "response" && answered_seqs_.count(request_seq) != 0)
    {
        answered_seqs_.erase(request_seq);
        log_json("Already processed, ptvsd response is:", content);
        return;
    }

    log_json("Received from ptvsd:", content);
    sink_.send_to_frontend(content);
}

void proxy::end_session(const std::string& reason)
{
    if (ended_)
        return;
    ended_ = true;

    if (!reason.empty())
    {
        send_frontend(protocol::make_output_event(reason + "\n", next_seq()));
    }
    send_frontend(protocol::make_terminated_event(next_seq()));
}

}
