#pragma once

#include <outcome-core/fwd.hh>
#include <outcome-core/macros.hh>

#include <string>
#include <string_view>

#ifdef OC_HAS_RTTI
#include <typeinfo>
#endif

// =========================================================================================================
// Platform-specific native utilities
// =========================================================================================================
//
// Symbol demangling:
//   demangle_symbol(symbol)     - demangle C++ symbol names to human-readable format
//   type_name<T>()              - readable name of T, used in contract violation messages
//

namespace oc
{
/// Demangle a C++ mangled symbol name into a human-readable format.
/// Platform-specific implementation:
///   - MSVC: Uses UnDecorateSymbolName from dbghelp.dll
///   - GCC/Clang: Uses __cxa_demangle from libstdc++/libc++
///   - Other: Returns the input symbol unchanged
///
/// If demangling fails or is unavailable on the platform, returns the original symbol.
///
/// Usage:
///   auto demangled = oc::demangle_symbol("_Z3fooi");  // "foo(int)"
[[nodiscard]] std::string demangle_symbol(std::string_view symbol);

/// Human-readable name of T (e.g. "auth::unauthorized")
/// Without RTTI this degrades to "<unknown type>"
template <class T>
[[nodiscard]] std::string type_name()
{
#ifdef OC_HAS_RTTI
#ifdef OC_COMPILER_MSVC
    // MSVC typeid names are already readable ("struct auth::unauthorized")
    return std::string(typeid(T).name());
#else
    return oc::demangle_symbol(typeid(T).name());
#endif
#else
    return "<unknown type>";
#endif
}
} // namespace oc
