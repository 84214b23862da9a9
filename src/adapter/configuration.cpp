#include <algorithm>
#include <cctype>
#include <filesystem>

#include <boost/algorithm/string.hpp>

#include "configuration.h"
#include "host/scripts.h"

namespace fs = std::filesystem;

namespace maxpy_debugger::adapter
{

using json = nlohmann::json;

// Ports show up either as numbers or, when the configuration was written by hand, as strings.
static int parse_port(const json& value)
{
    long long port = 0;

    if (value.is_number_integer())
    {
        port = value.get<long long>();
    }
    else if (value.is_string())
    {
        std::string str = boost::algorithm::trim_copy(value.get<std::string>());
        std::size_t used = 0;
        try
        {
            port = std::stoll(str, &used);
        }
        catch (const std::exception&)
        {
            throw config_error("Invalid port: '" + str + "'");
        }
        if (used != str.size())
        {
            throw config_error("Invalid port: '" + str + "'");
        }
    }
    else
    {
        throw config_error("Invalid port: " + value.dump());
    }

    if (port <= 0 || port > 65535)
    {
        throw config_error("Port out of range: " + std::to_string(port));
    }

    return static_cast<int>(port);
}

// Host names and addresses end up inside a Python string literal.
static bool is_valid_host(const std::string& host)
{
    return std::all_of(host.begin(), host.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '.' || c == '-' || c == '_' || c == ':';
    });
}

// Python 2 identifiers are plain ASCII.
static bool is_python_identifier(const std::string& name)
{
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0])) != 0)
        return false;

    return std::all_of(name.begin(), name.end(), [](char c) {
        return (static_cast<unsigned char>(c) < 0x80 && std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_';
    });
}

// The program is imported by module name from its directory, which is written into a raw string.
static void check_program(const std::string& program)
{
    if (program.find_first_of("\"\r\n") != std::string::npos)
    {
        throw config_error("Invalid program path: '" + program + "'");
    }

    std::string dir = host::module_directory(program);
    if (!dir.empty() && dir.back() == '\\')
    {
        throw config_error("Invalid program path: '" + program + "'");
    }

    std::string name = host::module_name(program);
    if (!is_python_identifier(name))
    {
        throw config_error("'" + name + "' is not a valid Python module name");
    }
}

attach_config parse_attach_config(const json& arguments)
{
    if (!arguments.is_object())
    {
        throw config_error("Attach request has no arguments");
    }

    attach_config config;

    auto program = arguments.find("program");
    if (program == arguments.end() || !program->is_string() || program->get<std::string>().empty())
    {
        throw config_error("Attach configuration is missing 'program'");
    }
    config.program = program->get<std::string>();
    check_program(config.program);

    // Older configurations nest the endpoint in a 'ptvsd' object, newer ones keep it at the top level.
    const json* endpoint = &arguments;
    if (auto ptvsd = arguments.find("ptvsd"); ptvsd != arguments.end() && ptvsd->is_object())
    {
        endpoint = &*ptvsd;
    }

    std::string host = default_backend_host;
    if (auto it = endpoint->find("host"); it != endpoint->end())
    {
        if (!it->is_string() || it->get<std::string>().empty())
        {
            throw config_error("Invalid host: " + it->dump());
        }
        host = it->get<std::string>();
        if (!is_valid_host(host))
        {
            throw config_error("Invalid host: '" + host + "'");
        }
    }

    if (boost::algorithm::iequals(host, "localhost"))
    {
        host = "127.0.0.1";
    }
    config.host = host;

    if (auto it = endpoint->find("port"); it != endpoint->end())
    {
        config.port = parse_port(*it);
    }

    if (auto it = arguments.find("pathMappings"); it != arguments.end() && it->is_array())
    {
        config.path_mappings = *it;
    }

    return config;
}

json make_attach_arguments(const attach_config& config)
{
    json mappings = config.path_mappings;
    if (!mappings.is_array())
    {
        std::string dir = fs::path(config.program).parent_path().string();
        mappings = json::array({ {{"localRoot", dir}, {"remoteRoot", dir}} });
    }

    return {
        {"name", "3ds Max Python Debugger : Remote Attach"},
        {"type", "python"},
        {"request", "attach"},
        {"port", config.port},
        {"host", config.host},
        {"pathMappings", std::move(mappings)},
        {"MaxDebugFile", config.program}
    };
}

json configuration_snippet()
{
    return {
        {"label", "3DS Max: Python 2 Debugging"},
        {"description", "Run and Debug Python 2 code in 3DS Max"},
        {"body", {
            {"name", "3DS Max: Python 2 Debugging"},
            {"type", adapter_type},
            {"program", "${file}"},
            {"request", "attach"},
            {"host", default_backend_host},
            {"port", default_backend_port}
        }}
    };
}

}
