#pragma once

#include <outcome-core/fwd.hh>
#include <outcome-core/native.hh>

#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility> // for tuple_size
#include <variant>

namespace oc
{
struct debug_string_config
{
    // soft limit: collections stop appending elements once the output is longer
    isize max_length = 100;
};

// Converts a value to a developer-facing debug string.
// Used to render error values in contract violation messages, e.g.
//   "cannot forward unexpected errors [auth::validation_error] into {auth::invalid_credentials, ...}"
//
// Strategy (in order):
//   - String-likes: wrap in double quotes "..." (never empty output)
//   - char: wrap in single quotes '...' with escape sequences for control/non-printable chars
//   - bool: true/false
//   - arithmetic types: std::to_string
//   - std::variant: the active alternative (error values inside a result are variants)
//   - std::optional: the value or "nullopt"
//   - Use to_string(v) if available (ADL)
//   - Use v.to_string() if available
//   - For collections, recursively format elements as [v0, v1, ...]
//   - For tuple-likes, recursively format elements as (v0, v1, ...)
//   - Otherwise emit the type name (tag-like error structs such as "unauthorized" have no other state)
//
// No stability, completeness, or user-facing guarantees.
// Output may change, be lossy, or depend on build/configuration.
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

//
// Implementation
//

namespace impl
{
template <class T>
constexpr bool is_std_variant = false;
template <class... Ts>
constexpr bool is_std_variant<std::variant<Ts...>> = true;

template <class T>
constexpr bool is_std_optional = false;
template <class T>
constexpr bool is_std_optional<std::optional<T>> = true;

inline void append_hex_byte(std::string& s, unsigned char b)
{
    constexpr char digits[] = "0123456789ABCDEF";
    s += digits[b >> 4];
    s += digits[b & 0xF];
}

template <class T>
bool to_debug_string_append_elem(std::string& s, T const& v, debug_string_config const& cfg)
{
    if (isize(s.size()) >= cfg.max_length)
    {
        s += ", ...";
        return false;
    }

    if (s.size() > 1)
        s += ", ";

    s += oc::to_debug_string(v, cfg);

    return true;
}
template <class T, std::size_t... I>
void to_debug_string_append_tuple(std::string& s, T const& v, debug_string_config const& cfg, std::index_sequence<I...>)
{
    (void)(oc::impl::to_debug_string_append_elem(s, std::get<I>(v), cfg) && ...);
}
} // namespace impl

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (requires { std::string_view(v); })
    {
        auto s = std::string("\"");
        s += std::string_view(v);
        s += '\"';
        return s;
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        auto s = std::string("'");

        // Escape control and non-printable characters
        if (v == '\0')
            s += "\\0";
        else if (v == '\n')
            s += "\\n";
        else if (v == '\r')
            s += "\\r";
        else if (v == '\t')
            s += "\\t";
        else if (v == '\\')
            s += "\\\\";
        else if (v == '\'')
            s += "\\'";
        else if (static_cast<unsigned char>(v) < 32 || static_cast<unsigned char>(v) >= 127) // Other control and non-ASCII bytes
        {
            s += "\\x";
            impl::append_hex_byte(s, static_cast<unsigned char>(v));
        }
        else
            s += v;

        s += '\'';
        return s;
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        return v ? "true" : "false";
    }
    else if constexpr (std::is_arithmetic_v<T>)
    {
        return std::to_string(v);
    }
    else if constexpr (impl::is_std_variant<T>)
    {
        if (v.valueless_by_exception())
            return "<valueless>";
        return std::visit([&](auto const& alt) { return oc::to_debug_string(alt, cfg); }, v);
    }
    else if constexpr (impl::is_std_optional<T>)
    {
        return v.has_value() ? oc::to_debug_string(*v, cfg) : std::string("nullopt");
    }
    else if constexpr (requires { to_string(v); })
    {
        return std::string(to_string(v));
    }
    else if constexpr (requires { v.to_string(); })
    {
        return std::string(v.to_string());
    }
    else if constexpr (requires {
                           std::begin(v);
                           std::end(v);
                       })
    {
        auto s = std::string("[");
        for (auto&& e : v)
            if (!impl::to_debug_string_append_elem(s, e, cfg))
                break;
        s += "]";
        return s;
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto s = std::string("(");
        oc::impl::to_debug_string_append_tuple(s, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        s += ")";
        return s;
    }
    else
    {
        return oc::type_name<T>();
    }
}
} // namespace oc
