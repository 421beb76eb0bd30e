#pragma once

#include <cstddef>
#include <cstdint>


namespace oc
{

//
// Primitives
//

// signed size type, same convention as the rest of our code:
// counts and indices are signed so that "count - 1" never wraps
using isize = std::int64_t;

//
// Error channel
//

// closed set of expected error variants (arity 1..6)
template <class... Es>
struct error_set;

// either a success value T or a non-empty sequence of errors declared by ErrorSet
template <class T, class ErrorSet>
struct result;

//
// Contract violations
//

struct invariant_violation;
struct scoped_violation_handler;

struct debug_string_config;

} // namespace oc
