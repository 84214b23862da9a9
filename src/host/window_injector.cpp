// Win32 injection into a running 3ds Max: the command is typed into the MAXScript mini listener in
// the status bar, exactly as a user would.

#include <windows.h>

#include <string>

#include "common/log.h"
#include "injector.h"
#include "scripts.h"

namespace maxpy_debugger::host
{

static const char* title_identifier = "Autodesk 3ds Max";
static const char* recorder_not_found = "Could not find MAXScript Macro Recorder";

namespace
{
    struct window_search
    {
        const char* text;
        const char* cls;
        HWND found = nullptr;
    };

    BOOL CALLBACK match_top_level(HWND hwnd, LPARAM param)
    {
        auto* search = reinterpret_cast<window_search*>(param);
        char title[512];
        int len = GetWindowTextA(hwnd, title, sizeof(title));
        if (len > 0 && std::string(title, len).find(search->text) != std::string::npos)
        {
            search->found = hwnd;
            return FALSE;
        }
        return TRUE;
    }

    BOOL CALLBACK match_child_class(HWND hwnd, LPARAM param)
    {
        auto* search = reinterpret_cast<window_search*>(param);
        char cls[256];
        int len = GetClassNameA(hwnd, cls, sizeof(cls));
        if (len > 0 && _stricmp(cls, search->cls) == 0)
        {
            search->found = hwnd;
            return FALSE;
        }
        return TRUE;
    }

    HWND find_child(HWND parent, const char* cls)
    {
        window_search search{ nullptr, cls };
        EnumChildWindows(parent, match_child_class, reinterpret_cast<LPARAM>(&search));
        return search.found;
    }
}

window_injector::window_injector(bool legacy) : legacy_(legacy)
{}

// Find the open 3ds Max window and keep a handle to it. A handle that has gone stale (3ds Max was
// restarted) is dropped and the window searched for again.
void window_injector::find_host_window()
{
    if (window_ != nullptr && !IsWindow(static_cast<HWND>(window_)))
    {
        log("3ds Max window handle is no longer valid, searching again\n");
        window_ = nullptr;
    }

    if (window_ == nullptr)
    {
        window_search search{ title_identifier, nullptr };
        EnumWindows(match_top_level, reinterpret_cast<LPARAM>(&search));
        window_ = search.found;
    }

    if (window_ == nullptr)
    {
        throw injection_error("An Autodesk 3ds Max instance could not be found.\n"
            "Please make sure it is open and running, then try again.");
    }
}

void window_injector::execute(const fs::path& script)
{
    find_host_window();
    HWND window = static_cast<HWND>(window_);

    bool legacy = legacy_;
    HWND listener = find_child(window, "MXS_Scintilla");

    // Ancient hosts (e.g. Max 9) have no Scintilla based listener but a rich edit box inside the
    // status panel instead. Those do not understand verbatim strings either.
    if (listener == nullptr)
    {
        HWND status_panel = find_child(window, "StatusPanel");
        if (status_panel == nullptr)
        {
            throw injection_error(recorder_not_found);
        }

        listener = find_child(status_panel, "RICHEDIT");
        legacy = true;
    }

    if (listener == nullptr)
    {
        throw injection_error(recorder_not_found);
    }

    std::string cmd = execute_file_command(script, legacy);
    log("Sending %s to 3ds Max\n", cmd.c_str());

    SendMessageA(listener, WM_SETTEXT, 0, reinterpret_cast<LPARAM>(cmd.c_str()));
    SendMessageA(listener, WM_CHAR, VK_RETURN, 0);
}

}
