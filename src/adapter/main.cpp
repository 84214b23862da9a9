// maxpy-debug-adapter: a DAP adapter that debugs Python code running inside Autodesk 3ds Max by
// injecting ptvsd into the running application and relaying between it and the debug client.

#include <iostream>

#include <boost/asio/io_context.hpp>

#include "adapter.h"
#include "common/log.h"
#include "options.h"
#include "session.h"

int main(int argc, char* argv[])
{
    using namespace maxpy_debugger;

    adapter::options opts;
    switch (adapter::parse_options(argc, argv, opts, std::cout, std::cerr))
    {
    case adapter::parse_result::exit_success:
        return 0;
    case adapter::parse_result::exit_failure:
        return 1;
    case adapter::parse_result::run:
        break;
    }

    if (!opts.log_path.empty())
    {
        if (!open_log(opts.log_path))
        {
            std::cerr << "Cannot open log file " << opts.log_path << "\n";
            return 1;
        }
    }
    else if (opts.debug_port > 0)
    {
        // In debug mode we are communicating over a tcp port rather than over stdin/stdout.
        // Log directly to stdout.
        set_log_stream(stdout);
    }

    log("Started!\n");

    boost::asio::io_context ios;

    try
    {
        adapter::session session(ios, opts, host::make_injector(opts.injector));

        if (!adapter::start_adapter(session.link(), opts.debug_port))
        {
            std::cerr << "Could not listen on port " << opts.debug_port << "\n";
            return 1;
        }

        // All session work happens here until the session stops.
        ios.run();

        adapter::stop_adapter();
    }
    catch (const std::exception& e)
    {
        log("Fatal error: %s\n", e.what());
        std::cerr << "Fatal error: " << e.what() << "\n";
        close_log();
        return 1;
    }

    log("Exiting\n");
    close_log();
    return 0;
}
