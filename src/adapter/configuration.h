#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace maxpy_debugger::adapter
{
    // Raised when the launch configuration in an 'attach' request cannot be used.
    class config_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // The adapter type name editors use to select this adapter.
    constexpr const char* adapter_type = "3dsMax";
    constexpr const char* adapter_version = "0.0.1";

    constexpr const char* default_backend_host = "localhost";
    constexpr int default_backend_port = 7003;

    // Settings from the front-end's 'attach' request.
    struct attach_config
    {
        // The Python file to run inside the host.
        std::string program;

        // Where the injected ptvsd listens for the adapter.
        std::string host = "127.0.0.1";
        int port = default_backend_port;

        // Source mappings handed on to ptvsd. Null if the front-end gave none.
        nlohmann::json path_mappings;
    };

    // Extract the attach configuration from the 'arguments' of an attach request.
    // Throws config_error.
    attach_config parse_attach_config(const nlohmann::json& arguments);

    // Build the 'arguments' for the attach request as ptvsd expects it.
    nlohmann::json make_attach_arguments(const attach_config& config);

    // The configuration snippet editors offer when adding a debug configuration for this adapter.
    nlohmann::json configuration_snippet();
}
