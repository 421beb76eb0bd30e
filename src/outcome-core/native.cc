#include "native.hh"

#include <outcome-core/assert.hh>

#include <mutex>


// Platform-specific includes for symbol demangling
#ifdef OC_COMPILER_MSVC
#include <DbgHelp.h>
#include <Windows.h>

#pragma comment(lib, "dbghelp.lib")
#endif

#ifdef OC_COMPILER_POSIX
#include <cxxabi.h>

#include <cstdlib>
#endif

std::string oc::demangle_symbol(std::string_view symbol)
{
    // UnDecorateSymbolName (Windows) is documented as single-threaded
    // __cxa_demangle (POSIX) thread-safety is not guaranteed
    static std::mutex demangle_mutex;
    std::lock_guard<std::mutex> lock(demangle_mutex);

    // both APIs expect a null-terminated string
    auto const symbol_nt = std::string(symbol);

#ifdef OC_COMPILER_MSVC
    constexpr DWORD buffer_size = 4096;
    char buffer[buffer_size];

    DWORD const result = UnDecorateSymbolName(symbol_nt.c_str(), buffer, buffer_size, UNDNAME_COMPLETE);
    if (result > 0)
        return std::string(buffer, result);

    return symbol_nt;

#elif defined(OC_COMPILER_POSIX)
    int status = 0;
    char* demangled = abi::__cxa_demangle(symbol_nt.c_str(), nullptr, nullptr, &status);

    if (status == 0 && demangled != nullptr)
    {
        auto result = std::string(demangled);
        std::free(demangled);
        return result;
    }

    // -2 (not a mangled name) falls back to the input, -3 means we passed bad arguments
    OC_ASSERT(status != -3, "__cxa_demangle rejected its arguments");

    if (demangled != nullptr)
        std::free(demangled);
    return symbol_nt;

#else
    return symbol_nt;
#endif
}
