#pragma once

#include <outcome-core/fwd.hh>
#include <outcome-core/macros.hh>

#include <functional>
#include <source_location>
#include <string>

// Customizable handling of contract violations
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = oc::scoped_violation_handler([](oc::invariant_violation const& info) {
//           report_to_crash_server(info);
//           throw request_aborted{info.message};
//       });
//
//       // Any violated contract in this scope goes through the custom handler
//       handle_request();
//   } // handler is automatically popped here

/// Payload describing a failed assertion
/// For result contract checks, message names the offending errors and the declared error set
struct oc::invariant_violation
{
    std::string expression;
    std::string message;
    std::source_location location;
};

namespace oc
{
using violation_handler = std::move_only_function<void(invariant_violation const&)>;

// Push a custom handler onto the handler stack
// The handler is called for all assertion failures until it is popped
// Handlers are allowed to throw exceptions as a way to unwind to some recovery point
// If a handler returns normally, the program still breaks and aborts
void push_violation_handler(violation_handler handler);

// Report printed by the default handler: expression, message, location and,
// where the toolchain supports <stacktrace>, the current stack trace
// Custom handlers can reuse it, e.g. to forward the same text to a crash reporter
[[nodiscard]] std::string describe_violation(invariant_violation const& info);

// Pop the topmost handler from the stack
// NOTE: prefer scoped_violation_handler, it also pops when a throwing handler unwinds the scope
void pop_violation_handler();
} // namespace oc

// RAII wrapper for pushing/popping violation handlers
struct oc::scoped_violation_handler
{
    explicit scoped_violation_handler(violation_handler handler);
    ~scoped_violation_handler();

    scoped_violation_handler(scoped_violation_handler const&) = delete;
    scoped_violation_handler& operator=(scoped_violation_handler const&) = delete;
    scoped_violation_handler(scoped_violation_handler&&) = delete;
    scoped_violation_handler& operator=(scoped_violation_handler&&) = delete;
};
