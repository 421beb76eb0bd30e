#include "assert.hh"

#include <outcome-core/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#ifdef OC_HAS_STACKTRACE
#include <stacktrace>
#endif

#ifdef OC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef OC_COMPILER_POSIX
#include <unistd.h>

#include <cstring>
#endif

#ifdef OC_OS_APPLE
extern "C" int sysctl(int*, unsigned int, void*, unsigned long*, void*, unsigned long) noexcept;
#endif

namespace
{
// Global stack of violation handlers
// NOTE: This is not thread-safe and must be externally synchronized
std::vector<oc::violation_handler> g_violation_handlers;

void default_violation_handler(oc::invariant_violation const& info)
{
    std::cerr << oc::describe_violation(info);
    std::cerr.flush();
}
} // namespace

std::string oc::describe_violation(invariant_violation const& info)
{
    std::string s = "Contract violated: ";
    s += info.expression;
    s += "\n  Message: ";
    s += info.message;
    s += "\n  Location: ";
    s += info.location.file_name();
    s += ':';
    s += std::to_string(info.location.line());
    s += ':';
    s += std::to_string(info.location.column());
    s += " (";
    s += info.location.function_name();
    s += ")\n";

#if defined(OC_HAS_STACKTRACE) && defined(__cpp_lib_stacktrace)
    s += "\nStacktrace:\n";
    s += std::to_string(std::stacktrace::current());
    s += '\n';
#endif

    return s;
}

void oc::push_violation_handler(violation_handler handler)
{
    g_violation_handlers.push_back(std::move(handler));
}

void oc::pop_violation_handler()
{
    if (!g_violation_handlers.empty())
        g_violation_handlers.pop_back();
}

oc::scoped_violation_handler::scoped_violation_handler(violation_handler handler)
{
    push_violation_handler(std::move(handler));
}

oc::scoped_violation_handler::~scoped_violation_handler()
{
    pop_violation_handler();
}

OC_COLD_FUNC void oc::impl::handle_assert_failure(char const* expression,
                                                  std::string_view message,
                                                  std::source_location location)
{
    invariant_violation const info{
        .expression = std::string(expression),
        .message = std::string(message),
        .location = location,
    };

    // topmost handler wins, the default one only prints
    if (!g_violation_handlers.empty())
        g_violation_handlers.back()(info);
    else
        default_violation_handler(info);

    // no abort here, it's outside
}

bool oc::impl::is_debugger_connected() noexcept
{
#ifdef OC_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(OC_OS_LINUX)
    // Check /proc/self/status for TracerPid
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                bool const parsed = std::sscanf(buf + 10, "%d", &pid) == 1;
                std::fclose(f);
                return parsed && pid != 0;
            }
        }
        std::fclose(f);
    }
    return false;
#elif defined(OC_OS_APPLE)
    // Use sysctl to check P_TRACED flag
    int mib[4] = {1 /* CTL_KERN */, 14 /* KERN_PROC */, 1 /* KERN_PROC_PID */, 0};
    mib[3] = getpid();

    struct kinfo_proc
    {
        char pad[32];
        int p_flag;
    } info{};

    unsigned long size = sizeof(info);
    if (sysctl(mib, 4, &info, &size, nullptr, 0) == 0)
        return (info.p_flag & 0x00000800 /* P_TRACED */) != 0;

    return false;
#else
    return false;
#endif
}

[[noreturn]] void oc::impl::perform_abort() noexcept
{
    std::abort();
}
