#pragma once

// =========================================================================================================
// Utility functions for working with results
// =========================================================================================================
//
// Callable utilities:
//   overloaded(f1, f2, ...)          - combine multiple callables into single overload set
//                                      (the natural shape of a forward() failure callback)
//

namespace oc
{
/// Combines multiple callables into a single overload set
/// forward() calls its failure callback with each concrete error, so one overload per source error
/// type maps it to the new error set.
/// Usage:
///   auto remap = oc::overloaded{
///       [](unauthorized) { return invalid_credentials{}; },
///       [](timeout const& t) { return t; },
///   };
///   auto res = post(...).forward<token, login_errors>(parse_token, remap);
template <class... Fs>
struct overloaded : Fs...
{
    overloaded(Fs... fs) : Fs(fs)... {}
    using Fs::operator()...;
};
} // namespace oc
