#pragma once

#include <cstdio>
#include <string>

// Adapter logging. Disabled unless a log file or the TCP debug mode is requested: in the
// normal stdio mode stdout carries the DAP stream and must never receive log output.

namespace maxpy_debugger
{
    extern bool log_enabled;
    extern FILE* log_file;

    // Open (and truncate) the given file for logging. Returns false if the file could not be opened.
    bool open_log(const std::string& path);

    // Route the log to an already open stream, e.g. stdout in debug mode.
    void set_log_stream(FILE* stream);

    void close_log();

    // printf-style log entry, prefixed with a timestamp.
    void log(const char* msg, ...);

    // Log a DAP message body. Valid JSON is pretty-printed below the prefix line, anything else
    // is logged as-is.
    void log_json(const char* prefix, const std::string& content);
}
