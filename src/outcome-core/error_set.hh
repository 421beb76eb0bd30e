#pragma once

#include <outcome-core/fwd.hh>
#include <outcome-core/macros.hh>
#include <outcome-core/native.hh>

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace oc
{
/// upper bound on the number of error types a single error_set may declare
/// an operation with more distinct expected failures should group them
constexpr isize max_error_set_arity = 6;

namespace impl
{
// std::variant<Us..., Ts...> without duplicates, first occurrence wins
template <class Variant, class... Ts>
struct unique_variant;
template <class... Us>
struct unique_variant<std::variant<Us...>>
{
    using type = std::variant<Us...>;
};
template <class... Us, class T, class... Ts>
struct unique_variant<std::variant<Us...>, T, Ts...>
  : std::conditional_t<(std::is_same_v<T, Us> || ...),
                       unique_variant<std::variant<Us...>, Ts...>,
                       unique_variant<std::variant<Us..., T>, Ts...>>
{
};

template <class T>
constexpr bool is_error_set = false;
template <class... Es>
constexpr bool is_error_set<error_set<Es...>> = true;

template <class T>
constexpr bool is_variant = false;
template <class... Ts>
constexpr bool is_variant<std::variant<Ts...>> = true;

// lets call sites spell a set either as its types (A, B) or as a ready-made error_set<A, B>
template <class... Es>
struct as_error_set
{
    using type = error_set<Es...>;
};
template <class... Es>
struct as_error_set<error_set<Es...>>
{
    using type = error_set<Es...>;
};

template <class V, class Set>
struct may_hold_member : std::bool_constant<Set::template declares<V>>
{
};
template <class... Ts, class Set>
struct may_hold_member<std::variant<Ts...>, Set> : std::bool_constant<(Set::template declares<Ts> || ...)>
{
};
} // namespace impl

/// error_set<A, B> for error_set_of<A, B> and error_set_of<error_set<A, B>>
template <class... Es>
using error_set_of = typename impl::as_error_set<Es...>::type;

/// True if a value of type V can be stored in a result declaring Set:
///   - V is one of the declared types, or
///   - V is a std::variant with at least one declared alternative (the active one is checked at runtime)
/// A concrete type outside the set is rejected at compile time.
template <class V, class Set>
concept member_candidate = impl::is_error_set<Set> && impl::may_hold_member<std::remove_cvref_t<V>, Set>::value;

// arity-spelled aliases
template <class E1>
using error_set1 = error_set<E1>;
template <class E1, class E2>
using error_set2 = error_set<E1, E2>;
template <class E1, class E2, class E3>
using error_set3 = error_set<E1, E2, E3>;
template <class E1, class E2, class E3, class E4>
using error_set4 = error_set<E1, E2, E3, E4>;
template <class E1, class E2, class E3, class E4, class E5>
using error_set5 = error_set<E1, E2, E3, E4, E5>;
template <class E1, class E2, class E3, class E4, class E5, class E6>
using error_set6 = error_set<E1, E2, E3, E4, E5, E6>;
} // namespace oc

/// Descriptor of the closed list of expected errors an operation may fail with.
/// Carries no data: all information is in the type list.
///
/// Usage:
///   using login_errors = oc::error_set<invalid_credentials, email_not_confirmed>;
///   oc::result<auth_token, login_errors> login(std::string_view user, std::string_view password);
///
/// Declaring the same type twice is redundant but allowed, value_type lists it once.
template <class... Es>
struct oc::error_set
{
    static_assert(sizeof...(Es) >= 1, "an error_set declares at least one error type");
    static_assert(sizeof...(Es) <= oc::max_error_set_arity, "an error_set declares at most 6 error types");
    static_assert((std::is_same_v<Es, std::remove_cvref_t<Es>> && ...),
                  "error types must be plain object types (no references, no cv-qualifiers)");
    static_assert((std::is_object_v<Es> && ...), "error types must be object types");
    static_assert(!(impl::is_error_set<Es> || ...), "error sets cannot be nested");
    static_assert(!(impl::is_variant<Es> || ...), "declare the alternatives directly instead of a std::variant");

    /// closed sum type of all declared errors, this is what a failed result stores
    using value_type = typename impl::unique_variant<std::variant<>, Es...>::type;

    static constexpr isize arity = sizeof...(Es);

    /// true iff V (ignoring cv-ref) is one of the declared types
    template <class V>
    static constexpr bool declares = (std::is_same_v<std::remove_cvref_t<V>, Es> || ...);

    /// true iff err is one of the declared variants
    /// for std::variant values the active alternative is tested, otherwise the static type decides
    template <class V>
    [[nodiscard]] static constexpr bool is_member(V const& err)
    {
        if constexpr (impl::is_variant<V>)
        {
            if (err.valueless_by_exception())
                return false;
            return std::visit([](auto const& alt) { return declares<decltype(alt)>; }, err);
        }
        else
        {
            OC_UNUSED(err);
            return declares<V>;
        }
    }

    /// err converted to value_type, or nullopt if it is not a member
    /// err is only moved from when it is a member
    template <class V>
    [[nodiscard]] static std::optional<value_type> narrow(V&& err)
    {
        using value_t = std::remove_cvref_t<V>;

        if constexpr (impl::is_variant<value_t>)
        {
            if (err.valueless_by_exception())
                return std::nullopt;

            return std::visit(
                [](auto&& alt) -> std::optional<value_type>
                {
                    using alt_t = std::remove_cvref_t<decltype(alt)>;
                    if constexpr (declares<alt_t>)
                        return std::optional<value_type>(std::in_place, std::in_place_type<alt_t>,
                                                         std::forward<decltype(alt)>(alt));
                    else
                        return std::nullopt;
                },
                std::forward<V>(err));
        }
        else if constexpr (declares<value_t>)
        {
            return std::optional<value_type>(std::in_place, std::in_place_type<value_t>, std::forward<V>(err));
        }
        else
        {
            return std::nullopt;
        }
    }

    /// "{ns::a, ns::b}", used in contract violation messages
    [[nodiscard]] static std::string type_names()
    {
        auto s = std::string("{");
        ((s += (s.size() > 1 ? ", " : ""), s += oc::type_name<Es>()), ...);
        s += "}";
        return s;
    }
};
