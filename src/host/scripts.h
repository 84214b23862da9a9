#pragma once

#include <filesystem>
#include <string>

// Python snippets executed inside the host application, and the MAXScript command that makes the
// host run them.

namespace maxpy_debugger::host
{
    namespace fs = std::filesystem;

    // Code that makes ptvsd importable inside the host and starts it listening for the adapter.
    std::string attach_script(const fs::path& ptvsd_path, const std::string& host, int port);

    // Code that imports (or reloads) the program being debugged and, once it has finished, creates
    // the signal file the adapter is watching for.
    std::string run_script(const std::string& program, const fs::path& signal_path);

    // The Python module name for a program path: the file name minus its '.py' extension, or the
    // directory name for a package (a path with a trailing separator, or an existing directory).
    std::string module_name(const std::string& program);

    // The directory that has to be on sys.path to import the program: the parent of the file, or of
    // the package directory. Empty for a bare file name.
    std::string module_directory(const std::string& program);

    // The listener command that executes the given Python file. Old listeners (pre-Scintilla) do not
    // understand verbatim strings, so in legacy mode the '@' is dropped and backslashes are escaped.
    std::string execute_file_command(const fs::path& script_path, bool legacy);

    // Owns a private temporary directory for the generated scripts. The directory and its contents
    // are removed when the store is destroyed.
    class script_store
    {
    public:
        script_store();
        explicit script_store(fs::path directory);
        ~script_store();

        script_store(const script_store&) = delete;
        script_store& operator=(const script_store&) = delete;

        // Write a script to the store and return its path. Throws std::runtime_error on IO failure.
        fs::path write(const std::string& name, const std::string& code);

        const fs::path& directory() const { return directory_; }

        // Default location of the signal file written by the run script.
        fs::path signal_path() const { return directory_ / "finished.txt"; }

    private:
        fs::path directory_;
    };
}
