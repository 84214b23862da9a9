#include <doctest/doctest.h>

#include <sstream>
#include <vector>

#include <nlohmann/json.hpp>

#include "adapter/configuration.h"
#include "adapter/options.h"

using namespace maxpy_debugger::adapter;
namespace host = maxpy_debugger::host;

static parse_result parse(std::vector<const char*> args, options& opts, std::ostream& out, std::ostream& err)
{
    args.insert(args.begin(), "/opt/maxpy/bin/maxpy-debug-adapter");
    return parse_options(static_cast<int>(args.size()), args.data(), opts, out, err);
}

TEST_CASE("no arguments runs over stdio with the defaults")
{
    options opts;
    std::ostringstream out, err;

    REQUIRE(parse({}, opts, out, err) == parse_result::run);
    CHECK(opts.debug_port == 0);
    CHECK(opts.log_path.empty());
    CHECK(opts.injector.command_port == 7002);
    CHECK(opts.injector.legacy == false);
    CHECK(opts.ptvsd_path == fs::path("/opt/maxpy/bin/python"));
    CHECK(out.str().empty());
    CHECK(err.str().empty());
}

TEST_CASE("options are applied")
{
    options opts;
    std::ostringstream out, err;

    REQUIRE(parse({ "--debug", "4711", "--log", "adapter.log", "--ptvsd-path", "/usr/share/ptvsd",
                    "--injector", "command-port", "--command-host", "maxbox", "--command-port", "7010",
                    "--legacy-listener", "--connect-retries", "3", "--connect-retry-ms", "10", "--signal-poll-ms", "50" },
              opts, out, err) == parse_result::run);

    CHECK(opts.debug_port == 4711);
    CHECK(opts.log_path == "adapter.log");
    CHECK(opts.ptvsd_path == fs::path("/usr/share/ptvsd"));
    CHECK(opts.injector.kind == host::injector_kind::command_port);
    CHECK(opts.injector.command_address == "maxbox");
    CHECK(opts.injector.command_port == 7010);
    CHECK(opts.injector.legacy);
    CHECK(opts.connect_retries == 3);
    CHECK(opts.connect_retry_ms == 10);
    CHECK(opts.signal_poll_ms == 50);
}

TEST_CASE("informational options exit successfully")
{
    options opts;
    std::ostringstream out, err;

    SUBCASE("help")
    {
        CHECK(parse({ "--help" }, opts, out, err) == parse_result::exit_success);
        CHECK(out.str().find("--ptvsd-path") != std::string::npos);
    }

    SUBCASE("version")
    {
        CHECK(parse({ "--version" }, opts, out, err) == parse_result::exit_success);
        CHECK(out.str() == std::string(adapter_version) + "\n");
    }

    SUBCASE("configuration snippet")
    {
        CHECK(parse({ "--print-config" }, opts, out, err) == parse_result::exit_success);
        nlohmann::json snippet = nlohmann::json::parse(out.str());
        CHECK(snippet["body"]["type"] == adapter_type);
    }
}

TEST_CASE("invalid options are reported")
{
    options opts;
    std::ostringstream out, err;

    SUBCASE("unknown option")
    {
        CHECK(parse({ "--frobnicate" }, opts, out, err) == parse_result::exit_failure);
    }

    SUBCASE("unknown injector")
    {
        CHECK(parse({ "--injector", "telepathy" }, opts, out, err) == parse_result::exit_failure);
    }

    SUBCASE("port out of range")
    {
        CHECK(parse({ "--command-port", "0" }, opts, out, err) == parse_result::exit_failure);
    }

    SUBCASE("debug port out of range")
    {
        CHECK(parse({ "--debug", "70000" }, opts, out, err) == parse_result::exit_failure);
    }

    SUBCASE("non-numeric value")
    {
        CHECK(parse({ "--connect-retries", "many" }, opts, out, err) == parse_result::exit_failure);
    }

    CHECK(err.str().find("Error:") == 0);
}
