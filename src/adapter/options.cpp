#include <ostream>

#include <boost/program_options.hpp>

#include "configuration.h"
#include "options.h"

namespace po = boost::program_options;

namespace maxpy_debugger::adapter
{

// By default the ptvsd package is shipped in a 'python' directory next to the adapter executable.
static fs::path default_ptvsd_path(const char* argv0)
{
    std::error_code ec;
    fs::path exe = fs::absolute(fs::path(argv0 ? argv0 : ""), ec);
    if (ec)
        return fs::path("python");
    return exe.parent_path() / "python";
}

parse_result parse_options(int argc, const char* const argv[], options& opts, std::ostream& out, std::ostream& err)
{
    std::string injector = opts.injector.kind == host::injector_kind::window ? "window" : "command-port";
    std::string ptvsd_path;

    po::options_description desc("Usage: maxpy-debug-adapter [options]\n\nOptions");
    desc.add_options()
        ("help,h", "show this help")
        ("version", "print the adapter version")
        ("print-config", "print the debug configuration snippet for this adapter")
        ("debug", po::value<int>(&opts.debug_port), "serve DAP on this TCP port instead of stdin/stdout, logging to stdout")
        ("log", po::value<std::string>(&opts.log_path), "write the adapter log to this file")
        ("ptvsd-path", po::value<std::string>(&ptvsd_path), "directory containing the ptvsd package")
        ("injector", po::value<std::string>(&injector)->default_value(injector), "how code is sent to 3ds Max: window or command-port")
        ("command-host", po::value<std::string>(&opts.injector.command_address)->default_value(opts.injector.command_address), "host of the 3ds Max command port")
        ("command-port", po::value<int>(&opts.injector.command_port)->default_value(opts.injector.command_port), "3ds Max command port")
        ("legacy-listener", po::bool_switch(&opts.injector.legacy), "format commands for old (pre-Scintilla) MAXScript listeners")
        ("connect-retries", po::value<int>(&opts.connect_retries)->default_value(opts.connect_retries), "attempts to connect to ptvsd")
        ("connect-retry-ms", po::value<int>(&opts.connect_retry_ms)->default_value(opts.connect_retry_ms), "delay between connection attempts")
        ("signal-poll-ms", po::value<int>(&opts.signal_poll_ms)->default_value(opts.signal_poll_ms), "interval between checks for the end of the program");

    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        opts.injector.kind = host::parse_injector_kind(injector);
    }
    catch (const std::exception& e)
    {
        err << "Error: " << e.what() << "\n\n" << desc << "\n";
        return parse_result::exit_failure;
    }

    if (vm.count("help"))
    {
        out << desc << "\n";
        return parse_result::exit_success;
    }

    if (vm.count("version"))
    {
        out << adapter_version << "\n";
        return parse_result::exit_success;
    }

    if (vm.count("print-config"))
    {
        out << configuration_snippet().dump(4) << "\n";
        return parse_result::exit_success;
    }

    if (opts.debug_port < 0 || opts.debug_port > 65535)
    {
        err << "Error: invalid debug port " << opts.debug_port << "\n";
        return parse_result::exit_failure;
    }

    if (opts.injector.command_port <= 0 || opts.injector.command_port > 65535)
    {
        err << "Error: invalid command port " << opts.injector.command_port << "\n";
        return parse_result::exit_failure;
    }

    if (opts.connect_retries < 1 || opts.connect_retry_ms < 0 || opts.signal_poll_ms <= 0)
    {
        err << "Error: retry counts and intervals must be positive\n";
        return parse_result::exit_failure;
    }

    opts.ptvsd_path = ptvsd_path.empty() ? default_ptvsd_path(argc > 0 ? argv[0] : nullptr) : fs::path(ptvsd_path);
    return parse_result::run;
}

}
