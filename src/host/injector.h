#pragma once

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

namespace maxpy_debugger::host
{
    namespace fs = std::filesystem;

    // Raised when code cannot be handed to the host application.
    class injection_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Runs a Python file inside the host application.
    class injector
    {
    public:
        virtual ~injector() = default;

        // Ask the host to execute the given script. Throws injection_error.
        virtual void execute(const fs::path& script) = 0;
    };

    // Sends the MAXScript listener command to a TCP command port opened inside the host, one
    // command per connection.
    class command_port_injector : public injector
    {
    public:
        command_port_injector(std::string address, int port, bool legacy);

        void execute(const fs::path& script) override;

    private:
        std::string address_;
        int port_;
        bool legacy_;
    };

#ifdef _WIN32
    // Types the MAXScript listener command into the mini listener of a running 3ds Max window and
    // presses return.
    class window_injector : public injector
    {
    public:
        explicit window_injector(bool legacy);

        void execute(const fs::path& script) override;

    private:
        void find_host_window();

        void* window_ = nullptr;
        bool legacy_;
    };
#endif

    enum class injector_kind
    {
        window,
        command_port
    };

    // The injection method used when none is configured.
    injector_kind default_injector_kind();

    // Parse "window" or "command-port". Throws std::invalid_argument.
    injector_kind parse_injector_kind(const std::string& name);

    struct injector_options
    {
        injector_kind kind = default_injector_kind();
        std::string command_address = "127.0.0.1";
        int command_port = 7002;
        bool legacy = false;
    };

    // Throws injection_error if the requested kind is not available on this platform.
    std::unique_ptr<injector> make_injector(const injector_options& options);
}
