#pragma once

// Lean header with minimal dependencies, included by everything in outcome-core.
#include <outcome-core/macros.hh>

#include <source_location>
#include <string_view>

// =========================================================================================================
// OC_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
//
// Features:
//   - Automatic source location capture (file, line, function)
//   - Debugger integration: breaks into debugger when attached, otherwise aborts
//   - Expression stringification for clear error reporting
//   - Active in debug and release-with-debug-info builds by default
//
// When assertions are active:
//   Assertions are enabled in OC_DEBUG and OC_RELWITHDEBINFO builds.
//   In OC_RELEASE builds, assertions are disabled unless OC_ENABLE_ASSERT_IN_RELEASE is defined.
//
// What assertions are for:
//   Assertions protect INVARIANTS, PRECONDITIONS, and POSTCONDITIONS.
//   In outcome-core they are the "contract violation" tier:
//     - reading value() of a failed result
//     - building a failed result from an empty error list
//     - an error that is not part of the declared error_set (at construction or when forwarding)
//     - calling forward() without the callback the current state needs
//
// What assertions are NOT for:
//   - NOT for expected failures of an operation: those are errors inside oc::result
//   - NOT for user input validation
//
// Error handling strategy:
//   - Assertions                  -> programmer errors, mismatched error declarations
//   - result<T, error_set<...>>   -> expected errors, declared in the return type
//
// Usage:
//   OC_ASSERT(count > 0, "count must be positive");
//
#define OC_ASSERT(cond, msg) OC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// OC_ASSERT_ALWAYS - Always-active assertion
//
// Like OC_ASSERT but remains active in all build configurations, including release builds.
// All result contract checks use the _ALWAYS flavor: a leaked undeclared error must never pass silently.
//
#define OC_ASSERT_ALWAYS(cond, msg) OC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// OC_ASSERTS - Runtime assertion with string_view message
//
// Middle-weight assertion: the message is a runtime string (anything convertible to std::string_view).
// The message expression is only evaluated when the condition fails, so it can be expensive to compute.
//
// Usage:
//   OC_ASSERTS(is_successful(), "unhandled expected errors: " + oc::to_debug_string(errors()));
//
#define OC_ASSERTS(cond, msg) OC_IMPL_ASSERTS(cond, msg)

// =========================================================================================================
// OC_ASSERTS_ALWAYS - Always-active assertion with string_view message
//
#define OC_ASSERTS_ALWAYS(cond, msg) OC_IMPL_ASSERTS_ALWAYS(cond, msg)

// =========================================================================================================
// OC_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
// Executes inline so the debugger stops at the assertion site, not inside a helper.
//
#define OC_DEBUG_BREAK() OC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// OC_BREAK_AND_ABORT - Debug break followed by program termination
//
#define OC_BREAK_AND_ABORT() (OC_DEBUG_BREAK(), ::oc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace oc::impl
{
// Called when an assertion fails
// Forwards to the topmost violation handler (or prints to stderr if none is installed)
// Note: does not abort, caller must follow with OC_BREAK_AND_ABORT()
OC_COLD_FUNC void handle_assert_failure(char const* expression, std::string_view message, std::source_location location);

// Checks if a debugger is currently attached to the process
// Platform-specific implementation (Windows: IsDebuggerPresent, Linux: /proc, macOS: sysctl)
bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace oc::impl

// Platform-specific debugger break implementation

#ifdef OC_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define OC_IMPL_DEBUG_BREAK() (::oc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(OC_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// NOTE: declared here to avoid pulling <csignal> into every translation unit
extern "C" int raise(int) noexcept;
#define OC_IMPL_DEBUG_BREAK() (::oc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define OC_IMPL_DEBUG_BREAK() void(0)

#endif

#define OC_IMPL_ASSERT_ALWAYS(cond, msg)                                                      \
    do                                                                                        \
    {                                                                                         \
        if (!(cond)) [[unlikely]]                                                             \
        {                                                                                     \
            ::oc::impl::handle_assert_failure(#cond, msg, ::std::source_location::current()); \
            OC_BREAK_AND_ABORT();                                                             \
        }                                                                                     \
    } while (false)

// same expansion, kept separate so the literal/runtime split stays visible at call sites
#define OC_IMPL_ASSERTS_ALWAYS(cond, msg) OC_IMPL_ASSERT_ALWAYS(cond, ::std::string_view(msg))

#if OC_ASSERT_ENABLED

#define OC_IMPL_ASSERT(cond, msg) OC_IMPL_ASSERT_ALWAYS(cond, msg)
#define OC_IMPL_ASSERTS(cond, msg) OC_IMPL_ASSERTS_ALWAYS(cond, msg)

#else

// assertions are stripped, but both operands must still compile
#define OC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        OC_UNUSED(cond);          \
        OC_UNUSED(msg);           \
    } while (false)

#define OC_IMPL_ASSERTS(cond, msg) OC_IMPL_ASSERT(cond, msg)

#endif
