#include <doctest/doctest.h>

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include "adapter/session.h"
#include "common/message.h"

using namespace maxpy_debugger::adapter;
namespace host = maxpy_debugger::host;
namespace serialization = maxpy_debugger::serialization;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

namespace
{
    // Records the scripts the session asks the host to run.
    class fake_injector : public host::injector
    {
    public:
        fake_injector(std::vector<fs::path>& scripts, bool fail) : scripts_(scripts), fail_(fail)
        {}

        void execute(const fs::path& script) override
        {
            if (fail_)
                throw host::injection_error("3ds Max is not running");
            scripts_.push_back(script);
        }

    private:
        std::vector<fs::path>& scripts_;
        bool fail_;
    };

    // Collects everything the session writes to the front-end.
    class recording_writer : public dap::Writer
    {
    public:
        bool isOpen() override
        {
            std::lock_guard<std::mutex> lock(mu_);
            return open_;
        }

        void close() override
        {
            std::lock_guard<std::mutex> lock(mu_);
            open_ = false;
        }

        bool write(const void* buffer, size_t bytes) override
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (!open_)
                return false;
            data_.append(static_cast<const char*>(buffer), bytes);
            return true;
        }

        std::vector<json> messages()
        {
            std::lock_guard<std::mutex> lock(mu_);
            serialization::frame_reader reader;
            reader.feed(data_);

            std::vector<json> result;
            std::string content;
            while (reader.next(content))
            {
                result.push_back(json::parse(content));
            }
            return result;
        }

    private:
        std::mutex mu_;
        std::string data_;
        bool open_ = true;
    };

    // One session wired to an in-memory front-end and a loopback stand-in for ptvsd.
    struct session_fixture
    {
        explicit session_fixture(bool fail_injection = false) :
            acceptor(ios, tcp::endpoint(asio::ip::address_v4::loopback(), 0)),
            ptvsd(ios),
            in(dap::pipe()),
            out(std::make_shared<recording_writer>())
        {
            opts.ptvsd_path = "/opt/maxpy/python";
            opts.connect_retries = 1;
            opts.connect_retry_ms = 10;
            opts.signal_poll_ms = 10;

            session_ = std::make_unique<session>(ios, opts, std::make_unique<fake_injector>(scripts, fail_injection));
            session_->link().bind(in, out);
        }

        void send(const json& msg)
        {
            std::string data = serialization::frame(msg.dump());
            REQUIRE(in->write(data.data(), data.size()));
        }

        void initialize_and_attach()
        {
            send({{"seq", 1}, {"type", "request"}, {"command", "initialize"}, {"arguments", {{"adapterID", "3dsMax"}}}});
            send({{"seq", 2}, {"type", "request"}, {"command", "attach"},
                  {"arguments", {{"program", "/work/tool.py"}, {"host", "127.0.0.1"}, {"port", acceptor.local_endpoint().port()}}}});
        }

        session& get() { return *session_; }

        asio::io_context ios;
        tcp::acceptor acceptor;
        tcp::socket ptvsd;
        options opts;
        std::vector<fs::path> scripts;
        std::shared_ptr<dap::ReaderWriter> in;
        std::shared_ptr<recording_writer> out;
        std::unique_ptr<session> session_;
    };
}

TEST_CASE("losing ptvsd ends the session")
{
    session_fixture f;

    f.acceptor.async_accept(f.ptvsd, [&](const boost::system::error_code& ec) {
        REQUIRE_FALSE(ec);
        f.ptvsd.close();
    });

    f.initialize_and_attach();
    f.ios.run_for(std::chrono::seconds(5));

    CHECK(f.get().get_state() == session::state::stopped);

    REQUIRE(f.scripts.size() == 1);
    CHECK(f.scripts[0].filename() == "attach.py");

    std::vector<json> sent = f.out->messages();
    REQUIRE(sent.size() == 3);
    CHECK(sent[0]["command"] == "initialize");
    CHECK(sent[1]["event"] == "output");
    CHECK(sent[1]["body"]["output"].get<std::string>().find("Lost connection to ptvsd: ") == 0);
    CHECK(sent[2]["event"] == "terminated");
}

TEST_CASE("the finished signal ends the session and the scripts are removed")
{
    fs::path script_dir;

    {
        session_fixture f;

        // Once ptvsd is connected, the program "finishes" in the host.
        f.acceptor.async_accept(f.ptvsd, [&](const boost::system::error_code& ec) {
            REQUIRE_FALSE(ec);
            REQUIRE(f.scripts.size() == 1);
            std::ofstream(f.scripts[0].parent_path() / "finished.txt").close();
        });

        f.initialize_and_attach();
        f.ios.run_for(std::chrono::seconds(5));

        CHECK(f.get().get_state() == session::state::stopped);

        std::vector<json> sent = f.out->messages();
        REQUIRE(sent.size() == 2);
        CHECK(sent[0]["command"] == "initialize");
        CHECK(sent[1]["event"] == "terminated");

        REQUIRE(f.scripts.size() == 1);
        script_dir = f.scripts[0].parent_path();
        CHECK(fs::exists(script_dir));
    }

    CHECK_FALSE(fs::exists(script_dir));
}

TEST_CASE("the debugger closing its end stops the session")
{
    session_fixture f;

    f.in->close();
    f.ios.run_for(std::chrono::seconds(5));

    CHECK(f.get().get_state() == session::state::stopped);
    CHECK(f.out->messages().empty());
    CHECK(f.scripts.empty());

    // Stopping again changes nothing.
    f.get().stop();
    CHECK(f.get().get_state() == session::state::stopped);
    CHECK(f.out->messages().empty());
}

TEST_CASE("a host that cannot be reached ends the session")
{
    session_fixture f(true);

    f.initialize_and_attach();
    f.ios.run_for(std::chrono::seconds(5));

    CHECK(f.get().get_state() == session::state::stopped);

    std::vector<json> sent = f.out->messages();
    REQUIRE(sent.size() == 3);
    CHECK(sent[0]["command"] == "initialize");
    CHECK(sent[1]["command"] == "attach");
    CHECK(sent[1]["success"] == false);
    CHECK(sent[1]["message"].get<std::string>().find("3ds Max is not running") != std::string::npos);
    CHECK(sent[2]["event"] == "terminated");
}
