#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>

#include "host/injector.h"

namespace maxpy_debugger::adapter
{
    namespace fs = std::filesystem;

    struct options
    {
        // Serve DAP on this TCP port instead of stdio. Used when debugging the adapter itself.
        int debug_port = 0;

        std::string log_path;

        // Directory holding the ptvsd package that gets injected into the host.
        fs::path ptvsd_path;

        host::injector_options injector;

        int connect_retries = 20;
        int connect_retry_ms = 250;
        int signal_poll_ms = 250;
    };

    enum class parse_result
    {
        run,
        exit_success,
        exit_failure
    };

    // Parse the command line into 'opts'. Help, version and configuration output goes to 'out' and
    // errors to 'err'; anything other than parse_result::run means the process should exit.
    parse_result parse_options(int argc, const char* const argv[], options& opts, std::ostream& out, std::ostream& err);
}
