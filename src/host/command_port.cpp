#include <boost/algorithm/string.hpp>
#include <boost/asio.hpp>

#include "common/log.h"
#include "injector.h"
#include "scripts.h"

namespace asio = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace maxpy_debugger::host
{

command_port_injector::command_port_injector(std::string address, int port, bool legacy) :
    address_(std::move(address)),
    port_(port),
    legacy_(legacy)
{}

// The command port is a plain line-based text socket: the host evaluates each line it receives as
// MAXScript. The exchange is short and happens before any DAP traffic depends on it, so it is done
// synchronously on a private io_context.
void command_port_injector::execute(const fs::path& script)
{
    std::string cmd = execute_file_command(script, legacy_);
    log("Sending %s to the host command port %s:%d\n", cmd.c_str(), address_.c_str(), port_);

    asio::io_context ios;
    tcp::socket sock(ios);
    boost::system::error_code ec;

    tcp::resolver resolver(ios);
    auto endpoints = resolver.resolve(address_, std::to_string(port_), ec);
    if (ec)
    {
        throw injection_error("Could not resolve host command port " + address_ + ": " + ec.message());
    }

    asio::connect(sock, endpoints, ec);
    if (ec)
    {
        throw injection_error("Could not connect to the host command port " + address_ + ":" + std::to_string(port_)
            + ": " + ec.message() + "\nPlease make sure 3ds Max is running with its command port open, then try again.");
    }

    cmd += "\n";
    asio::write(sock, asio::buffer(cmd), ec);
    if (ec)
    {
        throw injection_error("Could not send code to the host: " + ec.message());
    }

    sock.shutdown(tcp::socket::shutdown_send, ec);
    if (ec)
    {
        log("command port shutdown: %s\n", ec.message().c_str());
    }
    sock.close(ec);
}

injector_kind default_injector_kind()
{
#ifdef _WIN32
    return injector_kind::window;
#else
    return injector_kind::command_port;
#endif
}

injector_kind parse_injector_kind(const std::string& name)
{
    if (boost::algorithm::iequals(name, "window"))
        return injector_kind::window;
    if (boost::algorithm::iequals(name, "command-port"))
        return injector_kind::command_port;

    throw std::invalid_argument("Unknown injector '" + name + "' (expected 'window' or 'command-port')");
}

std::unique_ptr<injector> make_injector(const injector_options& options)
{
    switch (options.kind)
    {
    case injector_kind::command_port:
        return std::make_unique<command_port_injector>(options.command_address, options.command_port, options.legacy);
    case injector_kind::window:
#ifdef _WIN32
        return std::make_unique<window_injector>(options.legacy);
#else
        throw injection_error("The window injector is only available on Windows; use --injector command-port");
#endif
    }

    throw injection_error("Unknown injector kind");
}

}
