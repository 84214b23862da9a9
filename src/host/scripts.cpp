#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif

#include <boost/algorithm/string.hpp>

#include "common/log.h"
#include "scripts.h"

namespace maxpy_debugger::host
{

// Python string literals embed paths inside r"..." raw strings, with the exception of the signal
// path which is written into a normal string and so needs its backslashes escaped.
static std::string escape_backslashes(const std::string& str)
{
    return boost::algorithm::replace_all_copy(str, "\\", "\\\\");
}

std::string attach_script(const fs::path& ptvsd_path, const std::string& host, int port)
{
    std::stringstream code;
    code << "\n"
         << "import sys\n"
         << "import os\n"
         << "ptvsd_module = r\"" << ptvsd_path.string() << "\"\n"
         << "if ptvsd_module not in sys.path:\n"
         << "    sys.path.insert(0, ptvsd_module)\n"
         << "\n"
         << "import ptvsd\n"
         << "\n"
         << "ptvsd.enable_attach((\"" << host << "\"," << port << "))\n"
         << "\n"
         << "print('\\n --- Successfully attached to the debugger --- \\n')\n";
    return code.str();
}

// A trailing separator, or a path naming an existing directory, means a package.
static bool names_package(const std::string& program)
{
    if (!program.empty() && (program.back() == '/' || program.back() == '\\'))
        return true;

    std::error_code ec;
    return fs::is_directory(fs::path(program), ec);
}

static std::string strip_separators(std::string path)
{
    while (!path.empty() && (path.back() == '/' || path.back() == '\\'))
    {
        path.pop_back();
    }
    return path;
}

std::string module_name(const std::string& program)
{
    bool is_package = names_package(program);
    std::string path = strip_separators(program);

    auto idx = path.find_last_of("/\\");
    std::string name = idx == std::string::npos ? path : path.substr(idx + 1);

    if (!is_package && boost::algorithm::iends_with(name, ".py"))
    {
        name.resize(name.size() - 3);
    }

    return name;
}

std::string module_directory(const std::string& program)
{
    std::string path = strip_separators(program);

    auto idx = path.find_last_of("/\\");
    return idx == std::string::npos ? std::string() : path.substr(0, idx);
}

std::string run_script(const std::string& program, const fs::path& signal_path)
{
    std::string dir = module_directory(program);
    std::string name = module_name(program);
    std::string signal = escape_backslashes(signal_path.string());

    std::stringstream code;
    code << "\n"
         << "try:\n"
         << "    current_directory = r\"" << dir << "\"\n"
         << "    if current_directory not in sys.path:\n"
         << "        sys.path.insert(0, current_directory)\n"
         << "\n"
         << "    print(' --- Debugging " << name << "... --- \\n')\n"
         << "    if '" << name << "' not in globals().keys():\n"
         << "        import " << name << "\n"
         << "    else:\n"
         << "        reload(" << name << ")\n"
         << "\n"
         << "    print(' --- Finished debugging " << name << " --- \\n')\n"
         << "\n"
         << "    open(\"" << signal << "\", \"w\").close()\n"
         << "\n"
         << "except Exception as e:\n"
         << "    print('Error while debugging: ' + str(e))\n"
         << "    raise e\n";
    return code.str();
}

std::string execute_file_command(const fs::path& script_path, bool legacy)
{
    std::string cmd = "python.ExecuteFile @\"" + script_path.string() + "\";";

    if (legacy)
    {
        boost::algorithm::erase_all(cmd, "@");
        boost::algorithm::replace_all(cmd, "\\", "\\\\");
    }

    return cmd;
}

static fs::path default_store_directory()
{
#ifdef _WIN32
    int pid = _getpid();
#else
    int pid = getpid();
#endif
    return fs::temp_directory_path() / ("maxpy_debugger_" + std::to_string(pid));
}

script_store::script_store() : script_store(default_store_directory())
{}

script_store::script_store(fs::path directory) : directory_(std::move(directory))
{
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec)
    {
        throw std::runtime_error("Cannot create script directory " + directory_.string() + ": " + ec.message());
    }
}

script_store::~script_store()
{
    std::error_code ec;
    fs::remove_all(directory_, ec);
    if (ec)
    {
        log("Failed to remove script directory %s: %s\n", directory_.string().c_str(), ec.message().c_str());
    }
}

fs::path script_store::write(const std::string& name, const std::string& code)
{
    fs::path path = directory_ / name;
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out)
    {
        throw std::runtime_error("Cannot write script " + path.string());
    }

    out << code;
    out.close();
    if (!out)
    {
        throw std::runtime_error("Failed writing script " + path.string());
    }

    return path;
}

}
