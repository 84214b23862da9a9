#include <cstdarg>
#include <ctime>
#include <mutex>

#include <nlohmann/json.hpp>

#include "log.h"

namespace maxpy_debugger
{

bool log_enabled = false;
FILE* log_file = nullptr;

// Log calls come from the IO thread and the front-end reader thread.
static std::mutex log_mutex;
static bool owns_log_file = false;

bool open_log(const std::string& path)
{
    std::lock_guard<std::mutex> lock(log_mutex);
    FILE* f = fopen(path.c_str(), "w");
    if (f == nullptr)
        return false;

    if (owns_log_file && log_file != nullptr)
        fclose(log_file);

    log_file = f;
    owns_log_file = true;
    log_enabled = true;
    return true;
}

void set_log_stream(FILE* stream)
{
    std::lock_guard<std::mutex> lock(log_mutex);
    if (owns_log_file && log_file != nullptr)
        fclose(log_file);

    log_file = stream;
    owns_log_file = false;
    log_enabled = stream != nullptr;
}

void close_log()
{
    std::lock_guard<std::mutex> lock(log_mutex);
    if (owns_log_file && log_file != nullptr)
        fclose(log_file);

    log_file = nullptr;
    owns_log_file = false;
    log_enabled = false;
}

static void write_timestamp()
{
    char stamp[32];
    std::time_t now = std::time(nullptr);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);
    fprintf(log_file, "%s - ", stamp);
}

void log(const char* msg, ...)
{
    if (!log_enabled)
        return;

    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file == nullptr)
        return;

    write_timestamp();

    va_list args;
    va_start(args, msg);
    vfprintf(log_file, msg, args);
    va_end(args);
    fflush(log_file);
}

void log_json(const char* prefix, const std::string& content)
{
    if (!log_enabled)
        return;

    nlohmann::json parsed = nlohmann::json::parse(content, nullptr, false);
    if (parsed.is_discarded())
    {
        log("%s %s\n", prefix, content.c_str());
        return;
    }

    log("%s\n%s\n", prefix, parsed.dump(4).c_str());
}

}
